#include "TransferPlan.h"

#include "Crypto.h"
#include "Exceptions.h"
#include "PathValidator.h"

namespace GlobalSend {

namespace {

[[noreturn]] void badPlan(const std::string& what) {
    throw ProtocolError("Malformed plan: " + what);
}

const Json::Value& field(const Json::Value& obj, const char* name) {
    if (!obj.isObject() || !obj.isMember(name)) {
        badPlan(std::string("missing field '") + name + "'");
    }
    return obj[name];
}

const Json::Value& arrayField(const Json::Value& obj, const char* name) {
    const auto& v = field(obj, name);
    if (!v.isArray()) {
        badPlan(std::string("field '") + name + "' is not an array");
    }
    return v;
}

std::string safePath(const Json::Value& v) {
    if (!v.isString()) {
        badPlan("path is not a string");
    }
    std::string path = v.asString();
    if (!PathValidator::isSafeRelativePath(path)) {
        throw ProtocolError("Unsafe path in plan: " + path, ErrorCode::UNSAFE_PATH);
    }
    return path;
}

uint64_t unsignedField(const Json::Value& obj, const char* name) {
    const auto& v = field(obj, name);
    if (!v.isUInt64()) {
        badPlan(std::string("field '") + name + "' is not an unsigned integer");
    }
    return v.asUInt64();
}

} // namespace

uint64_t TransferPlan::bytesToSend() const {
    uint64_t total = 0;
    for (const auto& ref : chunksToSend) {
        total += ref.size;
    }
    return total;
}

Digest256 TransferPlan::digest() const {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    const std::string canonical = Json::writeString(builder, toJson());
    return Crypto::sha256(reinterpret_cast<const uint8_t*>(canonical.data()), canonical.size());
}

Json::Value TransferPlan::toJson() const {
    Json::Value root(Json::objectValue);
    root["mirror"] = mirror;

    Json::Value chunks(Json::arrayValue);
    for (const auto& ref : chunksToSend) {
        Json::Value c(Json::objectValue);
        c["id"] = ref.id.toHex();
        c["size"] = static_cast<Json::UInt64>(ref.size);
        c["path"] = ref.path;
        c["offset"] = static_cast<Json::UInt64>(ref.offset);
        chunks.append(c);
    }
    root["chunks"] = chunks;

    Json::Value renames(Json::arrayValue);
    for (const auto& op : this->renames) {
        Json::Value r(Json::objectValue);
        r["from"] = op.from;
        r["to"] = op.to;
        renames.append(r);
    }
    root["renames"] = renames;

    Json::Value deletes(Json::arrayValue);
    for (const auto& path : this->deletes) {
        deletes.append(path);
    }
    root["deletes"] = deletes;

    Json::Value assemble(Json::arrayValue);
    for (const auto& path : filesToAssemble) {
        assemble.append(path);
    }
    root["assemble"] = assemble;

    Json::Value metadata(Json::arrayValue);
    for (const auto& op : metadataOps) {
        Json::Value m(Json::objectValue);
        m["path"] = op.path;
        m["mtime"] = static_cast<Json::Int64>(op.mtimeNs);
        m["permissions"] = static_cast<Json::UInt>(op.permissions);
        metadata.append(m);
    }
    root["metadata"] = metadata;
    return root;
}

TransferPlan TransferPlan::fromJson(const Json::Value& value) {
    TransferPlan plan;
    const auto& mirror = field(value, "mirror");
    if (!mirror.isBool()) {
        badPlan("field 'mirror' is not a boolean");
    }
    plan.mirror = mirror.asBool();

    for (const auto& c : arrayField(value, "chunks")) {
        ChunkRef ref;
        const auto& id = field(c, "id");
        auto parsed = id.isString() ? Digest256::fromHex(id.asString()) : std::nullopt;
        if (!parsed) {
            badPlan("chunk id is not a hex digest");
        }
        ref.id = *parsed;
        ref.size = unsignedField(c, "size");
        ref.path = safePath(field(c, "path"));
        ref.offset = unsignedField(c, "offset");
        plan.chunksToSend.push_back(std::move(ref));
    }

    for (const auto& r : arrayField(value, "renames")) {
        plan.renames.push_back({safePath(field(r, "from")), safePath(field(r, "to"))});
    }
    for (const auto& d : arrayField(value, "deletes")) {
        plan.deletes.push_back(safePath(d));
    }
    for (const auto& a : arrayField(value, "assemble")) {
        plan.filesToAssemble.push_back(safePath(a));
    }
    for (const auto& m : arrayField(value, "metadata")) {
        MetadataOp op;
        op.path = safePath(field(m, "path"));
        const auto& mtime = field(m, "mtime");
        if (!mtime.isInt64()) {
            badPlan("metadata mtime is not an integer");
        }
        op.mtimeNs = mtime.asInt64();
        op.permissions = static_cast<uint32_t>(unsignedField(m, "permissions")) & 07777;
        plan.metadataOps.push_back(std::move(op));
    }
    return plan;
}

} // namespace GlobalSend
