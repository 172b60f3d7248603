#pragma once

#include <string>

#include "Config.h"
#include "Manifest.h"
#include "TransferPlan.h"

namespace GlobalSend {

struct PlanOptions {
    /// Delete receiver files that are absent from the target.
    bool mirrorDeletes{false};

    static PlanOptions fromConfig(const Config& config);
};

/**
 * @brief Computes the minimal TransferPlan between the receiver's baseline
 *        and the sender's target manifest.
 *
 * A chunk is sent only when its id does not occur anywhere in the
 * baseline, and at most once however many target files contain it.
 * In mirror mode a target file whose whole content matches a baseline
 * file that the target no longer has becomes a rename instead of a
 * reassembly; the lexicographically smallest such source wins and each
 * source is used once. Without mirror mode such a file is assembled from
 * the receiver's local chunks and the baseline file stays. Deletes are
 * only planned in mirror mode and never touch a rename source.
 */
class DeltaPlanner {
public:
    explicit DeltaPlanner(PlanOptions options = {}) : options_(options) {}

    TransferPlan plan(const SyncManifest& baseline, const SyncManifest& target) const;

    /// Stable identity of a (baseline, target) transfer, used as the job id.
    static std::string jobIdFor(const SyncManifest& baseline, const SyncManifest& target);

    const PlanOptions& options() const { return options_; }

private:
    PlanOptions options_;
};

} // namespace GlobalSend
