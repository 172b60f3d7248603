#include "Reassembler.h"

#include "ChunkSource.h"
#include "Constants.h"
#include "Crypto.h"
#include "Exceptions.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"
#include "PathValidator.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <optional>
#include <sys/stat.h>
#include <unistd.h>
#include <unordered_set>

namespace GlobalSend {

namespace fs = std::filesystem;

namespace {

[[noreturn]] void ioError(const std::string& what) {
    throw GlobalSendError(ErrorCode::IO_ERROR, what + ": " + std::strerror(errno));
}

void syncDirectory(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        Logger::instance().warn("Cannot open directory for sync: " + dir.string(), "Reassembler");
        return;
    }
    if (::fsync(fd) != 0) {
        Logger::instance().warn("Directory fsync failed: " + dir.string(), "Reassembler");
    }
    ::close(fd);
}

void setMtime(const fs::path& path, int64_t mtimeNs, bool noFollow) {
    struct timespec times[2];
    times[0].tv_sec = 0;
    times[0].tv_nsec = UTIME_OMIT;
    times[1].tv_sec = static_cast<time_t>(mtimeNs / 1000000000LL);
    times[1].tv_nsec = static_cast<long>(mtimeNs % 1000000000LL);
    if (times[1].tv_nsec < 0) {
        times[1].tv_sec -= 1;
        times[1].tv_nsec += 1000000000L;
    }
    if (::utimensat(AT_FDCWD, path.c_str(), times, noFollow ? AT_SYMLINK_NOFOLLOW : 0) != 0) {
        Logger::instance().warn("Cannot set mtime of " + path.string() + ": " + std::strerror(errno), "Reassembler");
    }
}

bool readExact(int fd, uint8_t* out, size_t size, uint64_t offset) {
    size_t done = 0;
    while (done < size) {
        ssize_t n = ::pread(fd, out + done, size - done, static_cast<off_t>(offset + done));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}

// Hash of the chunk stored at its offset in fd, or nullopt if it cannot be read.
std::optional<ChunkId> hashAt(int fd, const Chunk& chunk, std::vector<uint8_t>& buffer) {
    buffer.resize(chunk.size);
    if (!readExact(fd, buffer.data(), chunk.size, chunk.offset)) {
        return std::nullopt;
    }
    return Crypto::sha256(buffer);
}

// True when path is a regular file holding exactly the chunks of manifest.
bool contentMatches(const fs::path& path, const FileManifest& manifest) {
    int fd = ::open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }

    struct stat st;
    bool matches = ::fstat(fd, &st) == 0 && S_ISREG(st.st_mode) &&
                   static_cast<uint64_t>(st.st_size) == manifest.size;
    Sha256 digest;
    std::vector<uint8_t> buffer;
    for (size_t i = 0; matches && i < manifest.chunks.size(); ++i) {
        auto id = hashAt(fd, manifest.chunks[i], buffer);
        matches = id && *id == manifest.chunks[i].id;
        if (matches) {
            digest.update(*id);
        }
    }
    ::close(fd);
    return matches && digest.finish() == manifest.digest;
}

} // namespace

ReassemblerOptions ReassemblerOptions::fromConfig(const Config& config) {
    ReassemblerOptions options;
    options.allowDeletes = config.getBool(config::keys::SYNC_ALLOW_DELETES, true);
    return options;
}

Reassembler::Reassembler(fs::path root, ReassemblerOptions options)
    : root_(std::move(root)), options_(options) {
}

fs::path Reassembler::tempPathFor(const fs::path& root, const FileManifest& file) {
    fs::path finalPath = PathValidator::resolveWithin(root, file.path);
    std::string name = "." + finalPath.filename().string() + "." + file.digest.shortHex() + config::TEMP_FILE_SUFFIX;
    return finalPath.parent_path() / name;
}

std::vector<ChunkId> Reassembler::begin(const SyncManifest& target, const SyncManifest& baseline,
                                        const TransferPlan& plan) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_.clear();
    waiting_.clear();
    renamesApplied_ = false;
    target_ = target;
    plan_ = plan;

    const auto targetChunks = target.chunkIds();
    for (const auto& ref : plan.chunksToSend) {
        if (targetChunks.count(ref.id) == 0) {
            throw ProtocolError("Plan sends chunk " + ref.id.shortHex() + " that the target does not contain");
        }
    }
    for (const auto& op : plan.metadataOps) {
        if (!target.contains(op.path)) {
            throw ProtocolError("Plan sets metadata of unknown file " + op.path);
        }
    }
    for (const auto& path : plan.deletes) {
        if (target.contains(path)) {
            throw ProtocolError("Plan deletes target file " + path);
        }
    }

    for (const auto& path : plan.filesToAssemble) {
        const FileManifest* file = target.find(path);
        if (!file) {
            throw ProtocolError("Plan assembles unknown file " + path);
        }
        addFile(*file);
    }

    // A rename whose source is gone or no longer holds the target content
    // degrades to a plain reassembly.
    std::vector<RenameOp> renames;
    for (const auto& op : plan.renames) {
        const FileManifest* file = target.find(op.to);
        if (!file) {
            throw ProtocolError("Plan renames onto unknown file " + op.to);
        }
        if (contentMatches(PathValidator::resolveWithin(root_, op.from), *file)) {
            renames.push_back(op);
        } else {
            Logger::instance().warn("Rename source " + op.from + " does not match " + op.to + ", assembling it",
                                    "Reassembler");
            addFile(*file);
        }
    }
    plan_.renames = std::move(renames);

    fillFromBaseline(baseline);

    std::vector<ChunkId> need;
    std::unordered_set<ChunkId> listed;
    for (const auto& ref : plan.chunksToSend) {
        if (waiting_.count(ref.id) != 0 && listed.insert(ref.id).second) {
            need.push_back(ref.id);
        }
    }
    for (const auto& entry : files_) {
        for (size_t index : entry.second.missing) {
            const ChunkId& id = entry.second.manifest.chunks[index].id;
            if (listed.insert(id).second) {
                need.push_back(id);
            }
        }
    }

    LOG_INFO_COMP_IF("Prepared " + std::to_string(files_.size()) + " files, " +
                     std::to_string(need.size()) + " chunks needed from peer", "Reassembler");
    return need;
}

void Reassembler::addFile(const FileManifest& manifest) {
    PendingFile file;
    file.manifest = manifest;
    file.finalPath = PathValidator::resolveWithin(root_, manifest.path);
    file.tempPath = tempPathFor(root_, manifest);

    std::error_code ec;
    fs::create_directories(file.finalPath.parent_path(), ec);
    if (ec) {
        throw GlobalSendError(ErrorCode::IO_ERROR, "Cannot create directory for " + manifest.path + ": " + ec.message());
    }

    if (!manifest.isSymlink()) {
        prepareTemp(file);
    }

    for (size_t index : file.missing) {
        waiting_[manifest.chunks[index].id].emplace_back(manifest.path, index);
    }
    files_[manifest.path] = std::move(file);
}

void Reassembler::prepareTemp(PendingFile& file) {
    const FileManifest& manifest = file.manifest;
    const bool existed = fs::exists(file.tempPath);

    int fd = ::open(file.tempPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        ioError("Cannot open temp file " + file.tempPath.string());
    }

    size_t reused = 0;
    std::vector<uint8_t> buffer;
    for (size_t i = 0; i < manifest.chunks.size(); ++i) {
        if (existed) {
            auto id = hashAt(fd, manifest.chunks[i], buffer);
            if (id && *id == manifest.chunks[i].id) {
                ++reused;
                continue;
            }
        }
        file.missing.insert(i);
    }

    if (::ftruncate(fd, static_cast<off_t>(manifest.size)) != 0) {
        int err = errno;
        ::close(fd);
        errno = err;
        ioError("Cannot size temp file " + file.tempPath.string());
    }
    ::close(fd);

    if (reused > 0) {
        LOG_INFO_COMP_IF("Reusing " + std::to_string(reused) + "/" + std::to_string(manifest.chunks.size()) +
                         " verified chunks of " + manifest.path, "Reassembler");
    }
}

void Reassembler::fillFromBaseline(const SyncManifest& baseline) {
    struct Location {
        std::string path;
        Chunk chunk;
    };
    std::unordered_map<ChunkId, std::vector<Location>> local;
    for (const auto& entry : baseline.files()) {
        for (const auto& chunk : entry.second.chunks) {
            if (waiting_.count(chunk.id) != 0) {
                local[chunk.id].push_back({entry.first, chunk});
            }
        }
    }

    size_t copied = 0;
    for (const auto& entry : local) {
        for (const auto& location : entry.second) {
            std::vector<uint8_t> data;
            try {
                data = readFileRange(PathValidator::resolveWithin(root_, location.path),
                                     location.chunk.offset, location.chunk.size);
            } catch (const std::runtime_error& e) {
                LOG_DEBUG_COMP_IF(std::string("Local copy unavailable: ") + e.what(), "Reassembler");
                continue;
            }
            if (Crypto::sha256(data) != entry.first) {
                Logger::instance().warn("Local chunk " + entry.first.shortHex() + " in " + location.path +
                                        " changed since the scan; requesting it from peer", "Reassembler");
                continue;
            }

            auto waiting = waiting_.find(entry.first);
            for (const auto& position : waiting->second) {
                PendingFile& file = files_.at(position.first);
                writeAt(file, position.second, data);
                file.missing.erase(position.second);
            }
            waiting_.erase(waiting);
            ++copied;
            break;
        }
    }

    if (copied > 0) {
        LOG_DEBUG_COMP_IF("Filled " + std::to_string(copied) + " chunks from local files", "Reassembler");
    }
}

void Reassembler::writeAt(const PendingFile& file, size_t index, const std::vector<uint8_t>& data) const {
    const Chunk& chunk = file.manifest.chunks[index];
    if (data.size() != chunk.size) {
        throw ChunkIntegrityError("Chunk " + chunk.id.shortHex() + " has the wrong size for " + file.manifest.path);
    }

    int fd = ::open(file.tempPath.c_str(), O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        ioError("Cannot open temp file " + file.tempPath.string());
    }
    size_t done = 0;
    while (done < data.size()) {
        ssize_t n = ::pwrite(fd, data.data() + done, data.size() - done, static_cast<off_t>(chunk.offset + done));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            int err = errno;
            ::close(fd);
            errno = err;
            ioError("Write to " + file.tempPath.string() + " failed");
        }
        done += static_cast<size_t>(n);
    }
    ::close(fd);
}

bool Reassembler::writeChunk(const ChunkId& id, const std::vector<uint8_t>& data) {
    std::vector<Position> positions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = waiting_.find(id);
        if (it == waiting_.end()) {
            return false;
        }
        positions = std::move(it->second);
        waiting_.erase(it);
    }

    try {
        for (const auto& position : positions) {
            writeAt(files_.at(position.first), position.second, data);
        }
    } catch (const GlobalSendError&) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = waiting_[id];
        slot.insert(slot.end(), positions.begin(), positions.end());
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& position : positions) {
        files_.at(position.first).missing.erase(position.second);
    }
    return true;
}

std::vector<ChunkId> Reassembler::missingChunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChunkId> ids;
    ids.reserve(waiting_.size());
    for (const auto& entry : waiting_) {
        ids.push_back(entry.first);
    }
    return ids;
}

void Reassembler::commitFile(PendingFile& file) {
    const FileManifest& manifest = file.manifest;
    if (manifest.isSymlink()) {
        commitSymlink(file);
        return;
    }

    int fd = ::open(file.tempPath.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        ioError("Cannot reopen temp file " + file.tempPath.string());
    }

    struct stat st;
    if (::fstat(fd, &st) != 0 || static_cast<uint64_t>(st.st_size) != manifest.size) {
        ::close(fd);
        throw CommitVerificationError("Temp file of " + manifest.path + " has the wrong size");
    }

    Sha256 fileDigest;
    std::vector<uint8_t> buffer;
    for (const auto& chunk : manifest.chunks) {
        auto id = hashAt(fd, chunk, buffer);
        if (!id || *id != chunk.id) {
            ::close(fd);
            throw CommitVerificationError("Chunk at offset " + std::to_string(chunk.offset) + " of " +
                                          manifest.path + " does not verify");
        }
        fileDigest.update(*id);
    }
    if (fileDigest.finish() != manifest.digest) {
        ::close(fd);
        throw CommitVerificationError("Digest of " + manifest.path + " does not verify");
    }

    if (::fchmod(fd, manifest.permissions & 07777) != 0) {
        Logger::instance().warn("Cannot set permissions of " + manifest.path, "Reassembler");
    }
    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        errno = err;
        ioError("fsync of " + file.tempPath.string() + " failed");
    }
    ::close(fd);

    if (::rename(file.tempPath.c_str(), file.finalPath.c_str()) != 0) {
        ioError("Cannot move " + manifest.path + " into place");
    }
    syncDirectory(file.finalPath.parent_path());
    setMtime(file.finalPath, manifest.mtimeNs, false);
}

void Reassembler::commitSymlink(PendingFile& file) {
    const FileManifest& manifest = file.manifest;
    ::unlink(file.tempPath.c_str());
    if (::symlink(manifest.symlinkTarget->c_str(), file.tempPath.c_str()) != 0) {
        ioError("Cannot create symlink " + manifest.path);
    }
    if (::rename(file.tempPath.c_str(), file.finalPath.c_str()) != 0) {
        int err = errno;
        ::unlink(file.tempPath.c_str());
        errno = err;
        ioError("Cannot move symlink " + manifest.path + " into place");
    }
    syncDirectory(file.finalPath.parent_path());
    setMtime(file.finalPath, manifest.mtimeNs, true);
}

void Reassembler::requeueFile(PendingFile& file, std::vector<ChunkId>& out) {
    ::unlink(file.tempPath.c_str());
    file.missing.clear();
    prepareTemp(file);
    for (size_t index : file.missing) {
        const ChunkId& id = file.manifest.chunks[index].id;
        waiting_[id].emplace_back(file.manifest.path, index);
        out.push_back(id);
    }
}

std::vector<ChunkId> Reassembler::finish() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!renamesApplied_) {
        applyRenames();
        renamesApplied_ = true;
    }

    std::vector<ChunkId> requeued;
    for (auto& entry : files_) {
        PendingFile& file = entry.second;
        if (file.committed) {
            continue;
        }
        if (!file.missing.empty()) {
            for (size_t index : file.missing) {
                requeued.push_back(file.manifest.chunks[index].id);
            }
            continue;
        }

        try {
            commitFile(file);
            file.committed = true;
            ++filesCommitted_;
            MetricsCollector::instance().incrementFilesCommitted();
            LOG_DEBUG_COMP_IF("Committed " + entry.first, "Reassembler");
        } catch (const CommitVerificationError& e) {
            MetricsCollector::instance().incrementCommitFailures();
            Logger::instance().warn(std::string(e.what()) + "; re-queueing file", "Reassembler");
            requeueFile(file, requeued);
        }
    }

    std::vector<ChunkId> unique;
    std::unordered_set<ChunkId> seen;
    for (const auto& id : requeued) {
        if (seen.insert(id).second) {
            unique.push_back(id);
        }
    }

    if (unique.empty()) {
        applyDeletes();
        applyMetadata();
        LOG_INFO_COMP_IF("Committed " + std::to_string(filesCommitted_) + " files below " + root_.string(),
                         "Reassembler");
    }
    return unique;
}

void Reassembler::applyRenames() {
    if (plan_.renames.empty()) {
        return;
    }

    // Sources move to staging names first so swaps and chains cannot clobber
    // each other. A staged source that no longer verifies goes back where it
    // was and its target is assembled from chunks instead.
    std::vector<std::pair<fs::path, const RenameOp*>> staged;
    for (size_t i = 0; i < plan_.renames.size(); ++i) {
        const RenameOp& op = plan_.renames[i];
        const FileManifest* manifest = target_.find(op.to);
        fs::path staging = root_ / (".gs-stage-" + std::to_string(i) + config::TEMP_FILE_SUFFIX);
        fs::path source = PathValidator::resolveWithin(root_, op.from);
        if (::rename(source.c_str(), staging.c_str()) != 0) {
            ioError("Cannot stage rename source " + op.from);
        }
        if (!contentMatches(staging, *manifest)) {
            if (::rename(staging.c_str(), source.c_str()) != 0) {
                ioError("Cannot restore rename source " + op.from);
            }
            Logger::instance().warn("Rename source " + op.from + " changed before commit, re-queueing " + op.to,
                                    "Reassembler");
            addFile(*manifest);
            continue;
        }
        staged.emplace_back(staging, &op);
    }

    for (const auto& entry : staged) {
        const RenameOp& op = *entry.second;
        fs::path destination = PathValidator::resolveWithin(root_, op.to);
        std::error_code ec;
        fs::create_directories(destination.parent_path(), ec);
        if (::rename(entry.first.c_str(), destination.c_str()) != 0) {
            ioError("Cannot rename " + op.from + " to " + op.to);
        }
        syncDirectory(destination.parent_path());
        LOG_DEBUG_COMP_IF("Renamed " + op.from + " -> " + op.to, "Reassembler");
    }
    syncDirectory(root_);
}

void Reassembler::applyDeletes() {
    if (plan_.deletes.empty()) {
        return;
    }
    if (!options_.allowDeletes) {
        Logger::instance().info("Skipping " + std::to_string(plan_.deletes.size()) +
                                " deletes: deletes are disabled on this receiver", "Reassembler");
        return;
    }

    for (const auto& path : plan_.deletes) {
        fs::path victim = PathValidator::resolveWithin(root_, path);
        std::error_code ec;
        if (fs::is_directory(fs::symlink_status(victim, ec))) {
            Logger::instance().warn("Not deleting directory " + path, "Reassembler");
            continue;
        }
        if (!fs::remove(victim, ec) && ec) {
            Logger::instance().warn("Cannot delete " + path + ": " + ec.message(), "Reassembler");
        }
    }
    plan_.deletes.clear();
}

void Reassembler::applyMetadata() {
    for (const auto& op : plan_.metadataOps) {
        fs::path path = PathValidator::resolveWithin(root_, op.path);
        struct stat st;
        if (::lstat(path.c_str(), &st) != 0) {
            Logger::instance().warn("Cannot restore metadata of missing file " + op.path, "Reassembler");
            continue;
        }
        const bool isLink = S_ISLNK(st.st_mode);
        if (!isLink && (st.st_mode & 07777) != op.permissions && ::chmod(path.c_str(), op.permissions) != 0) {
            Logger::instance().warn("Cannot set permissions of " + op.path, "Reassembler");
        }
        setMtime(path, op.mtimeNs, isLink);
    }
    plan_.metadataOps.clear();
}

} // namespace GlobalSend
