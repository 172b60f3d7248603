#include "ManifestBuilder.h"

#include "Constants.h"
#include "Crypto.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "PathValidator.h"

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

namespace GlobalSend {

namespace {

int64_t nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

ManifestBuilder::ManifestBuilder(const ChunkerParams& params) : chunker_(params) {
}

FileManifest ManifestBuilder::buildFromStream(std::istream& input, const std::string& path,
                                              int64_t mtimeNs, uint32_t permissions) const {
    FileManifest file;
    file.path = path;
    file.mtimeNs = mtimeNs;
    file.permissions = permissions & 07777;

    ChunkStream stream(chunker_, input);
    ChunkRange range;
    while (stream.next(range)) {
        Chunk chunk;
        chunk.id = Crypto::sha256(range.data);
        chunk.size = range.data.size();
        chunk.offset = range.offset;
        file.size += chunk.size;
        file.chunks.push_back(chunk);
    }
    file.digest = FileManifest::computeDigest(file.chunks);
    return file;
}

FileManifest ManifestBuilder::buildFile(const std::filesystem::path& absolutePath, const std::string& relativePath) const {
    struct stat st;
    if (::lstat(absolutePath.c_str(), &st) != 0) {
        throw std::runtime_error("Cannot stat " + absolutePath.string());
    }
    const int64_t mtimeNs = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;

    if (S_ISLNK(st.st_mode)) {
        std::vector<char> buf(static_cast<size_t>(st.st_size > 0 ? st.st_size : 255) + 1);
        ssize_t len = ::readlink(absolutePath.c_str(), buf.data(), buf.size() - 1);
        if (len < 0) {
            throw std::runtime_error("Cannot read symlink " + absolutePath.string());
        }
        FileManifest link;
        link.path = relativePath;
        link.mtimeNs = mtimeNs;
        link.permissions = st.st_mode & 07777;
        link.symlinkTarget = std::string(buf.data(), static_cast<size_t>(len));
        link.digest = FileManifest::computeDigest(link.chunks);
        return link;
    }

    if (!S_ISREG(st.st_mode)) {
        throw std::runtime_error("Not a regular file: " + absolutePath.string());
    }

    std::ifstream in(absolutePath, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open " + absolutePath.string());
    }
    return buildFromStream(in, relativePath, mtimeNs, st.st_mode);
}

bool ManifestBuilder::isIgnored(const std::filesystem::path& path) const {
    const std::string name = path.filename().string();
    return endsWith(name, config::TEMP_FILE_SUFFIX) || ignoredNames_.count(name) != 0;
}

SyncManifest ManifestBuilder::scanDirectory(const std::filesystem::path& root) const {
    namespace fs = std::filesystem;
    SCOPED_TIMER_COMP("Scan of " + root.string(), "ManifestBuilder");

    SyncManifest::FileMap files;
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        Logger::instance().warn("Scan root does not exist: " + root.string(), "ManifestBuilder");
        return SyncManifest(root.string(), nowSeconds(), std::move(files), config::MANIFEST_FORMAT_VERSION);
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw std::runtime_error("Cannot scan " + root.string() + ": " + ec.message());
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            Logger::instance().warn("Scan error below " + root.string() + ": " + ec.message(), "ManifestBuilder");
            ec.clear();
            continue;
        }

        const auto& entry = *it;
        if (isIgnored(entry.path())) {
            if (entry.is_directory(ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }

        const bool isLink = entry.is_symlink(ec);
        if (!isLink && !entry.is_regular_file(ec)) {
            continue;
        }

        // Lexical so that a symlink keeps its own path rather than its target's.
        const std::string relative = PathValidator::toManifestPath(entry.path().lexically_relative(root));
        if (ec || !PathValidator::isSafeRelativePath(relative)) {
            Logger::instance().warn("Skipping unrepresentable path " + entry.path().string(), "ManifestBuilder");
            ec.clear();
            continue;
        }

        try {
            files.emplace(relative, buildFile(entry.path(), relative));
        } catch (const std::runtime_error& e) {
            Logger::instance().warn(std::string("Skipping file: ") + e.what(), "ManifestBuilder");
        }
    }

    LOG_INFO_COMP_IF("Scanned " + std::to_string(files.size()) + " files below " + root.string(), "ManifestBuilder");
    return SyncManifest(root.string(), nowSeconds(), std::move(files), config::MANIFEST_FORMAT_VERSION);
}

SyncManifest ManifestBuilder::buildForPayloads(const std::vector<Payload>& payloads, const std::string& label) const {
    SyncManifest::FileMap files;
    const int64_t nowNs = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    for (const auto& payload : payloads) {
        const std::string path = payloadPath(payload);
        if (!PathValidator::isSafeRelativePath(path)) {
            throw std::invalid_argument("Invalid payload name: " + path);
        }
        if (files.count(path) != 0) {
            throw std::invalid_argument("Duplicate payload path: " + path);
        }

        int64_t mtimeNs = nowNs;
        if (payloadKind(payload) == PayloadKind::File) {
            struct stat st;
            if (::stat(std::get<FilePayload>(payload).source.c_str(), &st) == 0) {
                mtimeNs = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
            }
        }

        auto input = openPayload(payload);
        files.emplace(path, buildFromStream(*input, path, mtimeNs, payloadPermissions(payload)));
    }

    return SyncManifest(label, nowSeconds(), std::move(files), config::MANIFEST_FORMAT_VERSION);
}

} // namespace GlobalSend
