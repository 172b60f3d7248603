#pragma once

#include <string>

#include <json/json.h>

#include "Manifest.h"

namespace GlobalSend {

/**
 * @brief Versioned JSON encoding of SyncManifest.
 *
 * {
 *   "format_version": 1,
 *   "root_path": "...",
 *   "created_at": 1700000000,
 *   "files": [{"path", "size", "mtime", "permissions", "symlink_target"?,
 *              "digest", "chunks": [{"id", "size", "offset"}]}]
 * }
 *
 * Ids and digests are lowercase hex; mtime is nanoseconds since the epoch.
 */
class ManifestSerialization {
public:
    static Json::Value toJson(const SyncManifest& manifest);
    static std::string serialize(const SyncManifest& manifest);

    /**
     * @throws ManifestVersionError if format_version is not supported
     * @throws ProtocolError (MANIFEST_MALFORMED / UNSAFE_PATH) on any other defect
     */
    static SyncManifest fromJson(const Json::Value& root);
    static SyncManifest deserialize(const std::string& text);

    static Json::Value fileToJson(const FileManifest& file);
    static FileManifest fileFromJson(const Json::Value& value);
};

} // namespace GlobalSend
