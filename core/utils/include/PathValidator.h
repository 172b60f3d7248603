#pragma once

#include <filesystem>
#include <string>

namespace GlobalSend {

/**
 * @brief Validation of manifest paths received from a peer.
 *
 * Manifest paths are relative, '/'-separated and must never leave the
 * transfer root once joined to it.
 */
class PathValidator {
public:
    /**
     * @brief True if path is non-empty, relative, and free of "." / ".."
     *        components, empty components, backslashes and NUL bytes.
     */
    static bool isSafeRelativePath(const std::string& path);

    /**
     * @brief Join a validated relative path onto root.
     * @throws ProtocolError (UNSAFE_PATH) if the path is not safe.
     */
    static std::filesystem::path resolveWithin(const std::filesystem::path& root, const std::string& relativePath);

    /**
     * @brief Convert a path relative to root into manifest form ("a/b/c").
     */
    static std::string toManifestPath(const std::filesystem::path& relative);
};

} // namespace GlobalSend
