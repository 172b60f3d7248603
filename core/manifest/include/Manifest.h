#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "Digest.h"

namespace GlobalSend {

struct Chunk {
    ChunkId id;
    uint64_t size{0};
    uint64_t offset{0};

    bool operator==(const Chunk& other) const {
        return id == other.id && size == other.size && offset == other.offset;
    }
};

/**
 * @brief One file's decomposition into chunks plus the metadata the
 *        receiver restores on commit.
 */
struct FileManifest {
    std::string path;                         ///< relative, '/'-separated
    uint64_t size{0};
    int64_t mtimeNs{0};                       ///< nanoseconds since the epoch
    uint32_t permissions{0644};               ///< mode bits (07777)
    std::optional<std::string> symlinkTarget;
    std::vector<Chunk> chunks;
    Digest256 digest;                         ///< SHA-256 over the ordered chunk ids

    bool isSymlink() const { return symlinkTarget.has_value(); }

    /// Same bytes: equal digest and equal chunk id sequence.
    bool sameContent(const FileManifest& other) const;

    /// Same bytes and same permissions, mtime and link target.
    bool sameMetadata(const FileManifest& other) const;

    static Digest256 computeDigest(const std::vector<Chunk>& chunks);
};

/**
 * @brief Immutable snapshot of a transfer root.
 *
 * Built once by ManifestBuilder or decoded from the wire; a rescan yields a
 * new object. The manifest digest covers the files only, not the root path
 * or creation time, so two scans of unchanged content compare equal.
 */
class SyncManifest {
public:
    using FileMap = std::map<std::string, FileManifest>;

    SyncManifest() : SyncManifest(std::string(), 0, FileMap()) {}
    SyncManifest(std::string rootPath, int64_t createdAt, FileMap files, int formatVersion = 1);

    static SyncManifest empty(const std::string& rootPath = "");

    int formatVersion() const { return formatVersion_; }
    const std::string& rootPath() const { return rootPath_; }
    int64_t createdAt() const { return createdAt_; }
    const FileMap& files() const { return files_; }

    const FileManifest* find(const std::string& path) const;
    bool contains(const std::string& path) const { return files_.count(path) != 0; }
    size_t fileCount() const { return files_.size(); }
    bool isEmpty() const { return files_.empty(); }

    uint64_t totalBytes() const;
    std::unordered_set<ChunkId> chunkIds() const;

    const Digest256& digest() const { return digest_; }

private:
    int formatVersion_;
    std::string rootPath_;
    int64_t createdAt_;
    FileMap files_;
    Digest256 digest_;
};

} // namespace GlobalSend
