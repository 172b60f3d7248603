#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <json/json.h>

#include "Digest.h"

namespace GlobalSend {

/**
 * @brief A chunk the receiver lacks, with the first place it occurs in
 *        the target tree (where the sender reads it from).
 */
struct ChunkRef {
    ChunkId id;
    uint64_t size{0};
    std::string path;
    uint64_t offset{0};
};

/// Move a baseline file whose content reappears under a new path.
struct RenameOp {
    std::string from;
    std::string to;
};

/// Restore permissions/mtime of a file whose bytes are already correct.
struct MetadataOp {
    std::string path;
    int64_t mtimeNs{0};
    uint32_t permissions{0};
};

/**
 * @brief Output of DeltaPlanner: everything needed to turn the baseline
 *        tree into the target tree.
 *
 * Chunks are listed once each, in target path order then chunk order.
 * The plan travels to the receiver in the PLAN message and its digest
 * keys the resumable job record.
 */
struct TransferPlan {
    std::vector<ChunkRef> chunksToSend;
    std::vector<RenameOp> renames;
    std::vector<std::string> deletes;
    std::vector<std::string> filesToAssemble;
    std::vector<MetadataOp> metadataOps;
    bool mirror{false};

    bool isNoop() const {
        return chunksToSend.empty() && renames.empty() && deletes.empty() &&
               filesToAssemble.empty() && metadataOps.empty();
    }

    uint64_t bytesToSend() const;

    /// SHA-256 of the canonical JSON form.
    Digest256 digest() const;

    Json::Value toJson() const;

    /**
     * @throws ProtocolError on missing fields or unsafe paths
     */
    static TransferPlan fromJson(const Json::Value& value);
};

} // namespace GlobalSend
