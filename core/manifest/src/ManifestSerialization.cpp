#include "ManifestSerialization.h"

#include "Constants.h"
#include "Exceptions.h"
#include "PathValidator.h"

#include <memory>
#include <sstream>

namespace GlobalSend {

namespace {

[[noreturn]] void malformed(const std::string& what) {
    throw ProtocolError("Malformed manifest: " + what, ErrorCode::MANIFEST_MALFORMED);
}

const Json::Value& member(const Json::Value& obj, const char* name) {
    if (!obj.isObject() || !obj.isMember(name)) {
        malformed(std::string("missing field '") + name + "'");
    }
    return obj[name];
}

uint64_t asU64(const Json::Value& obj, const char* name) {
    const auto& v = member(obj, name);
    if (!v.isUInt64()) {
        malformed(std::string("field '") + name + "' is not an unsigned integer");
    }
    return v.asUInt64();
}

int64_t asI64(const Json::Value& obj, const char* name) {
    const auto& v = member(obj, name);
    if (!v.isInt64()) {
        malformed(std::string("field '") + name + "' is not an integer");
    }
    return v.asInt64();
}

std::string asString(const Json::Value& obj, const char* name) {
    const auto& v = member(obj, name);
    if (!v.isString()) {
        malformed(std::string("field '") + name + "' is not a string");
    }
    return v.asString();
}

Digest256 asDigest(const Json::Value& obj, const char* name) {
    auto digest = Digest256::fromHex(asString(obj, name));
    if (!digest) {
        malformed(std::string("field '") + name + "' is not a 64-digit hex digest");
    }
    return *digest;
}

} // namespace

Json::Value ManifestSerialization::fileToJson(const FileManifest& file) {
    Json::Value out(Json::objectValue);
    out["path"] = file.path;
    out["size"] = static_cast<Json::UInt64>(file.size);
    out["mtime"] = static_cast<Json::Int64>(file.mtimeNs);
    out["permissions"] = static_cast<Json::UInt>(file.permissions);
    if (file.symlinkTarget) {
        out["symlink_target"] = *file.symlinkTarget;
    }
    out["digest"] = file.digest.toHex();

    Json::Value chunks(Json::arrayValue);
    for (const auto& chunk : file.chunks) {
        Json::Value c(Json::objectValue);
        c["id"] = chunk.id.toHex();
        c["size"] = static_cast<Json::UInt64>(chunk.size);
        c["offset"] = static_cast<Json::UInt64>(chunk.offset);
        chunks.append(c);
    }
    out["chunks"] = chunks;
    return out;
}

Json::Value ManifestSerialization::toJson(const SyncManifest& manifest) {
    Json::Value root(Json::objectValue);
    root["format_version"] = manifest.formatVersion();
    root["root_path"] = manifest.rootPath();
    root["created_at"] = static_cast<Json::Int64>(manifest.createdAt());

    Json::Value files(Json::arrayValue);
    for (const auto& entry : manifest.files()) {
        files.append(fileToJson(entry.second));
    }
    root["files"] = files;
    return root;
}

std::string ManifestSerialization::serialize(const SyncManifest& manifest) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, toJson(manifest));
}

FileManifest ManifestSerialization::fileFromJson(const Json::Value& value) {
    FileManifest file;
    file.path = asString(value, "path");
    if (!PathValidator::isSafeRelativePath(file.path)) {
        throw ProtocolError("Unsafe path in manifest: " + file.path, ErrorCode::UNSAFE_PATH);
    }
    file.size = asU64(value, "size");
    file.mtimeNs = asI64(value, "mtime");
    file.permissions = static_cast<uint32_t>(asU64(value, "permissions")) & 07777;
    if (value.isMember("symlink_target")) {
        file.symlinkTarget = asString(value, "symlink_target");
    }

    const auto& chunks = member(value, "chunks");
    if (!chunks.isArray()) {
        malformed("'chunks' of " + file.path + " is not an array");
    }

    uint64_t expectedOffset = 0;
    for (const auto& c : chunks) {
        Chunk chunk;
        chunk.id = asDigest(c, "id");
        chunk.size = asU64(c, "size");
        chunk.offset = asU64(c, "offset");
        if (chunk.offset != expectedOffset || chunk.size == 0 || chunk.size > config::MAX_FRAME_SIZE) {
            malformed("chunk layout of " + file.path + " is not contiguous");
        }
        expectedOffset += chunk.size;
        file.chunks.push_back(chunk);
    }
    if (expectedOffset != file.size) {
        malformed("chunk sizes of " + file.path + " do not add up to the file size");
    }
    if (file.symlinkTarget && !file.chunks.empty()) {
        malformed("symlink " + file.path + " carries chunks");
    }

    file.digest = FileManifest::computeDigest(file.chunks);
    if (value.isMember("digest") && asDigest(value, "digest") != file.digest) {
        malformed("digest of " + file.path + " does not match its chunk list");
    }
    return file;
}

SyncManifest ManifestSerialization::fromJson(const Json::Value& root) {
    if (!root.isObject()) {
        malformed("top level is not an object");
    }
    const auto& version = member(root, "format_version");
    if (!version.isInt()) {
        malformed("'format_version' is not an integer");
    }
    if (version.asInt() != config::MANIFEST_FORMAT_VERSION) {
        throw ManifestVersionError(version.asInt(), config::MANIFEST_FORMAT_VERSION);
    }

    const auto& files = member(root, "files");
    if (!files.isArray()) {
        malformed("'files' is not an array");
    }

    SyncManifest::FileMap map;
    for (const auto& f : files) {
        FileManifest file = fileFromJson(f);
        std::string path = file.path;
        if (!map.emplace(path, std::move(file)).second) {
            malformed("duplicate path " + path);
        }
    }

    int64_t createdAt = root.isMember("created_at") ? asI64(root, "created_at") : 0;
    return SyncManifest(asString(root, "root_path"), createdAt, std::move(map), version.asInt());
}

SyncManifest ManifestSerialization::deserialize(const std::string& text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        malformed("invalid JSON: " + errors);
    }
    return fromJson(root);
}

} // namespace GlobalSend
