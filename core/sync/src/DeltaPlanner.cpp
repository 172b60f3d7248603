#include "DeltaPlanner.h"

#include "Constants.h"
#include "Crypto.h"
#include "Logger.h"
#include "LoggerMacros.h"

#include <map>
#include <set>
#include <unordered_set>

namespace GlobalSend {

namespace {

bool sameNode(const FileManifest& a, const FileManifest& b) {
    return a.sameContent(b) && a.symlinkTarget == b.symlinkTarget;
}

MetadataOp metadataFor(const FileManifest& file) {
    MetadataOp op;
    op.path = file.path;
    op.mtimeNs = file.mtimeNs;
    op.permissions = file.permissions;
    return op;
}

} // namespace

PlanOptions PlanOptions::fromConfig(const Config& config) {
    PlanOptions options;
    options.mirrorDeletes = config.getBool(config::keys::SYNC_MIRROR_DELETES, false);
    return options;
}

TransferPlan DeltaPlanner::plan(const SyncManifest& baseline, const SyncManifest& target) const {
    TransferPlan plan;
    plan.mirror = options_.mirrorDeletes;

    const auto receiverHas = baseline.chunkIds();

    // In mirror mode baseline files that vanish from the target are rename
    // candidates, grouped by content. FileMap iteration keeps each group
    // sorted. Otherwise the receiver keeps them and a moved file is
    // assembled from its local chunks.
    std::map<Digest256, std::vector<const FileManifest*>> vanished;
    if (options_.mirrorDeletes) {
        for (const auto& entry : baseline.files()) {
            const FileManifest& file = entry.second;
            if (!target.contains(entry.first) && !file.isSymlink() && !file.chunks.empty()) {
                vanished[file.digest].push_back(&file);
            }
        }
    }

    std::set<std::string> renameSources;
    std::unordered_set<ChunkId> scheduled;

    for (const auto& entry : target.files()) {
        const FileManifest& wanted = entry.second;
        const FileManifest* existing = baseline.find(entry.first);

        if (existing && sameNode(*existing, wanted)) {
            if (!existing->sameMetadata(wanted)) {
                plan.metadataOps.push_back(metadataFor(wanted));
            }
            continue;
        }

        if (!wanted.isSymlink() && !wanted.chunks.empty()) {
            auto group = vanished.find(wanted.digest);
            if (group != vanished.end()) {
                const FileManifest* source = nullptr;
                for (const FileManifest* candidate : group->second) {
                    if (renameSources.count(candidate->path) == 0 && candidate->sameContent(wanted)) {
                        source = candidate;
                        break;
                    }
                }
                if (source) {
                    renameSources.insert(source->path);
                    plan.renames.push_back({source->path, wanted.path});
                    if (source->permissions != wanted.permissions || source->mtimeNs != wanted.mtimeNs) {
                        plan.metadataOps.push_back(metadataFor(wanted));
                    }
                    continue;
                }
            }
        }

        plan.filesToAssemble.push_back(wanted.path);
        for (const auto& chunk : wanted.chunks) {
            if (receiverHas.count(chunk.id) == 0 && scheduled.insert(chunk.id).second) {
                plan.chunksToSend.push_back({chunk.id, chunk.size, wanted.path, chunk.offset});
            }
        }
    }

    if (options_.mirrorDeletes) {
        for (const auto& entry : baseline.files()) {
            if (!target.contains(entry.first) && renameSources.count(entry.first) == 0) {
                plan.deletes.push_back(entry.first);
            }
        }
    }

    LOG_DEBUG_COMP_IF("Plan: " + std::to_string(plan.chunksToSend.size()) + " chunks (" +
                      std::to_string(plan.bytesToSend()) + " bytes), " +
                      std::to_string(plan.filesToAssemble.size()) + " files, " +
                      std::to_string(plan.renames.size()) + " renames, " +
                      std::to_string(plan.deletes.size()) + " deletes", "DeltaPlanner");
    return plan;
}

std::string DeltaPlanner::jobIdFor(const SyncManifest& baseline, const SyncManifest& target) {
    Sha256 hasher;
    hasher.update(baseline.digest());
    hasher.update(target.digest());
    return hasher.finish().toHex();
}

} // namespace GlobalSend
