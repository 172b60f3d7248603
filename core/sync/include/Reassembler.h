#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "Config.h"
#include "Manifest.h"
#include "TransferPlan.h"

namespace GlobalSend {

struct ReassemblerOptions {
    /// Honour deletes in mirror-mode plans; when false they are logged and skipped.
    bool allowDeletes{true};

    static ReassemblerOptions fromConfig(const Config& config);
};

/**
 * @brief Receiver side of a plan: builds target files from chunks in temp
 *        files next to their final path and commits them atomically.
 *
 * Temp files are named ".<name>.<digest prefix>.gspart" and survive an
 * interrupted session; begin() re-verifies them chunk by chunk so a resume
 * only asks for what is really missing. Chunks the receiver already holds
 * in its baseline are copied locally after their hash is checked.
 *
 * A file is committed only after every chunk and the file digest have been
 * re-read and verified: fsync, rename into place, fsync the directory, then
 * restore permissions and mtime. A file failing that check is discarded and
 * all of its chunks are requested again. Rename sources are held to the
 * same check, in begin() and again when they are staged in finish().
 *
 * writeChunk() may be called from several threads; everything else is
 * driven from the engine's session thread.
 */
class Reassembler {
public:
    explicit Reassembler(std::filesystem::path root, ReassemblerOptions options = {});

    /**
     * @brief Prepare temp files for the plan and fill what is available locally.
     * @param target The sender's manifest the plan was computed against
     * @param baseline The receiver's own manifest of root
     * @return Chunk ids still needed from the sender, in plan order
     * @throws ProtocolError if the plan is inconsistent with the target manifest
     * @throws GlobalSendError (IO_ERROR) if temp files cannot be created
     */
    std::vector<ChunkId> begin(const SyncManifest& target, const SyncManifest& baseline, const TransferPlan& plan);

    /**
     * @brief Store a verified chunk at every position still waiting for it.
     * @return false if nothing was waiting for this id
     * @throws GlobalSendError (IO_ERROR) if the write fails; the chunk stays missing
     */
    bool writeChunk(const ChunkId& id, const std::vector<uint8_t>& data);

    /**
     * @brief Commit every complete file, then apply renames, deletes and metadata.
     *
     * Renames are applied once, on the first call. Deletes and metadata run
     * only once nothing is left to resend.
     * @return Ids to resend; empty when the target tree is in place
     */
    std::vector<ChunkId> finish();

    std::vector<ChunkId> missingChunks() const;
    size_t filesCommitted() const { return filesCommitted_; }
    const std::filesystem::path& root() const { return root_; }

    static std::filesystem::path tempPathFor(const std::filesystem::path& root, const FileManifest& file);

private:
    struct PendingFile {
        FileManifest manifest;
        std::filesystem::path finalPath;
        std::filesystem::path tempPath;
        std::set<size_t> missing;     ///< chunk indices not yet written
        bool committed{false};
    };

    using Position = std::pair<std::string, size_t>;

    void addFile(const FileManifest& manifest);
    void prepareTemp(PendingFile& file);
    void fillFromBaseline(const SyncManifest& baseline);
    void writeAt(const PendingFile& file, size_t index, const std::vector<uint8_t>& data) const;
    void commitFile(PendingFile& file);
    void commitSymlink(PendingFile& file);
    void requeueFile(PendingFile& file, std::vector<ChunkId>& out);
    void applyRenames();
    void applyDeletes();
    void applyMetadata();

    std::filesystem::path root_;
    ReassemblerOptions options_;
    SyncManifest target_;
    TransferPlan plan_;
    std::map<std::string, PendingFile> files_;
    std::unordered_map<ChunkId, std::vector<Position>> waiting_;
    bool renamesApplied_{false};
    size_t filesCommitted_{0};
    mutable std::mutex mutex_;
};

} // namespace GlobalSend
