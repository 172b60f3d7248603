#pragma once

#include <filesystem>
#include <istream>
#include <set>
#include <string>
#include <vector>

#include "Chunker.h"
#include "Manifest.h"
#include "Payload.h"

namespace GlobalSend {

/**
 * @brief Chunks and hashes files in one streaming pass and assembles the
 *        resulting FileManifests into a SyncManifest.
 */
class ManifestBuilder {
public:
    explicit ManifestBuilder(const ChunkerParams& params = ChunkerParams::defaults());

    /// File or directory names skipped during scans (matched on the last path component).
    void addIgnoredName(const std::string& name) { ignoredNames_.insert(name); }

    FileManifest buildFromStream(std::istream& input, const std::string& path,
                                 int64_t mtimeNs, uint32_t permissions) const;

    /**
     * @brief Manifest for one regular file or symlink (symlinks are not followed).
     * @throws std::runtime_error if the file cannot be read
     */
    FileManifest buildFile(const std::filesystem::path& absolutePath, const std::string& relativePath) const;

    /**
     * @brief Scan every regular file and symlink below root.
     *
     * Partial files left by an interrupted receive and ignored names are
     * skipped; unreadable entries are logged and skipped.
     */
    SyncManifest scanDirectory(const std::filesystem::path& root) const;

    SyncManifest buildForPayloads(const std::vector<Payload>& payloads, const std::string& label = "payloads") const;

    const Chunker& chunker() const { return chunker_; }

private:
    bool isIgnored(const std::filesystem::path& path) const;

    Chunker chunker_;
    std::set<std::string> ignoredNames_;
};

} // namespace GlobalSend
