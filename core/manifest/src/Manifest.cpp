#include "Manifest.h"

#include "Constants.h"
#include "Crypto.h"

namespace GlobalSend {

namespace {

void hashU64(Sha256& hasher, uint64_t value) {
    uint8_t buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[7 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
    hasher.update(buf, sizeof(buf));
}

} // namespace

bool FileManifest::sameContent(const FileManifest& other) const {
    if (digest != other.digest || chunks.size() != other.chunks.size() || size != other.size) {
        return false;
    }
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].id != other.chunks[i].id) {
            return false;
        }
    }
    return true;
}

bool FileManifest::sameMetadata(const FileManifest& other) const {
    return sameContent(other) && permissions == other.permissions && mtimeNs == other.mtimeNs &&
           symlinkTarget == other.symlinkTarget;
}

Digest256 FileManifest::computeDigest(const std::vector<Chunk>& chunks) {
    Sha256 hasher;
    for (const auto& chunk : chunks) {
        hasher.update(chunk.id);
    }
    return hasher.finish();
}

SyncManifest::SyncManifest(std::string rootPath, int64_t createdAt, FileMap files, int formatVersion)
    : formatVersion_(formatVersion),
      rootPath_(std::move(rootPath)),
      createdAt_(createdAt),
      files_(std::move(files)) {
    // Canonical form: files in path order, every field length-delimited or fixed width.
    Sha256 hasher;
    hashU64(hasher, static_cast<uint64_t>(formatVersion_));
    for (const auto& [path, file] : files_) {
        hashU64(hasher, path.size());
        hasher.update(path);
        hashU64(hasher, file.size);
        hashU64(hasher, static_cast<uint64_t>(file.mtimeNs));
        hashU64(hasher, file.permissions);
        if (file.symlinkTarget) {
            hashU64(hasher, file.symlinkTarget->size() + 1);
            hasher.update(*file.symlinkTarget);
        } else {
            hashU64(hasher, 0);
        }
        hasher.update(file.digest);
    }
    digest_ = hasher.finish();
}

SyncManifest SyncManifest::empty(const std::string& rootPath) {
    return SyncManifest(rootPath, 0, FileMap(), config::MANIFEST_FORMAT_VERSION);
}

const FileManifest* SyncManifest::find(const std::string& path) const {
    auto it = files_.find(path);
    return it == files_.end() ? nullptr : &it->second;
}

uint64_t SyncManifest::totalBytes() const {
    uint64_t total = 0;
    for (const auto& entry : files_) {
        total += entry.second.size;
    }
    return total;
}

std::unordered_set<ChunkId> SyncManifest::chunkIds() const {
    std::unordered_set<ChunkId> ids;
    for (const auto& entry : files_) {
        for (const auto& chunk : entry.second.chunks) {
            ids.insert(chunk.id);
        }
    }
    return ids;
}

} // namespace GlobalSend
