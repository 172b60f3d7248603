#include "SyncProtocol.h"

#include "Constants.h"
#include "Exceptions.h"
#include "ManifestSerialization.h"

#include <json/json.h>
#include <memory>

namespace GlobalSend {

namespace {

void putU32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value >> 24));
    out.push_back(static_cast<uint8_t>(value >> 16));
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value));
}

uint32_t getU32(const std::vector<uint8_t>& in, size_t& pos) {
    if (in.size() < pos + 4) {
        throw ProtocolError("Truncated message");
    }
    uint32_t value = (static_cast<uint32_t>(in[pos]) << 24) | (static_cast<uint32_t>(in[pos + 1]) << 16) |
                     (static_cast<uint32_t>(in[pos + 2]) << 8) | static_cast<uint32_t>(in[pos + 3]);
    pos += 4;
    return value;
}

void putIds(std::vector<uint8_t>& out, const std::vector<ChunkId>& ids) {
    putU32(out, static_cast<uint32_t>(ids.size()));
    for (const auto& id : ids) {
        out.insert(out.end(), id.bytes.begin(), id.bytes.end());
    }
}

std::vector<ChunkId> getIds(const std::vector<uint8_t>& in, size_t& pos) {
    const uint32_t count = getU32(in, pos);
    if ((in.size() - pos) / Digest256::SIZE < count) {
        throw ProtocolError("Truncated id list");
    }
    std::vector<ChunkId> ids;
    ids.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        ids.push_back(Digest256::fromBytes(in.data() + pos));
        pos += Digest256::SIZE;
    }
    return ids;
}

std::vector<uint8_t> withType(MessageType type) {
    return std::vector<uint8_t>{static_cast<uint8_t>(type)};
}

void appendText(std::vector<uint8_t>& out, const std::string& text) {
    out.insert(out.end(), text.begin(), text.end());
}

std::string writeJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

Json::Value parseJson(const std::vector<uint8_t>& message, size_t pos) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    const char* begin = reinterpret_cast<const char*>(message.data()) + pos;
    const char* end = reinterpret_cast<const char*>(message.data()) + message.size();

    Json::Value root;
    std::string errors;
    if (!reader->parse(begin, end, &root, &errors)) {
        throw ProtocolError("Invalid JSON body: " + errors);
    }
    return root;
}

void expectType(const std::vector<uint8_t>& message, MessageType type) {
    if (SyncProtocol::typeOf(message) != type) {
        throw ProtocolError(std::string("Expected ") + messageTypeName(type) + ", got " +
                            messageTypeName(SyncProtocol::typeOf(message)));
    }
}

void expectEnd(const std::vector<uint8_t>& message, size_t pos) {
    if (pos != message.size()) {
        throw ProtocolError("Trailing bytes after message body");
    }
}

} // namespace

const char* messageTypeName(MessageType type) {
    switch (type) {
        case MessageType::Offer: return "OFFER";
        case MessageType::Baseline: return "BASELINE";
        case MessageType::Plan: return "PLAN";
        case MessageType::Ready: return "READY";
        case MessageType::Batch: return "BATCH";
        case MessageType::Chunk: return "CHUNK";
        case MessageType::BatchResult: return "BATCH_RESULT";
        case MessageType::Done: return "DONE";
        case MessageType::Complete: return "COMPLETE";
        case MessageType::Abort: return "ABORT";
    }
    return "UNKNOWN";
}

MessageType SyncProtocol::typeOf(const std::vector<uint8_t>& message) {
    if (message.empty()) {
        throw ProtocolError("Empty message");
    }
    const uint8_t type = message[0];
    if (type < static_cast<uint8_t>(MessageType::Offer) || type > static_cast<uint8_t>(MessageType::Abort)) {
        throw ProtocolError("Unknown message type " + std::to_string(type));
    }
    return static_cast<MessageType>(type);
}

std::vector<uint8_t> SyncProtocol::encodeOffer(const OfferMessage& offer) {
    auto out = withType(MessageType::Offer);
    out.push_back(offer.protocolVersion);
    appendText(out, ManifestSerialization::serialize(offer.target));
    return out;
}

OfferMessage SyncProtocol::decodeOffer(const std::vector<uint8_t>& message) {
    expectType(message, MessageType::Offer);
    if (message.size() < 2) {
        throw ProtocolError("Truncated OFFER");
    }
    if (message[1] != config::PROTOCOL_VERSION) {
        throw ProtocolError("Unsupported protocol version " + std::to_string(message[1]) +
                            " (supported: " + std::to_string(config::PROTOCOL_VERSION) + ")");
    }
    OfferMessage offer;
    offer.protocolVersion = message[1];
    offer.target = ManifestSerialization::fromJson(parseJson(message, 2));
    return offer;
}

std::vector<uint8_t> SyncProtocol::encodeBaseline(const SyncManifest& baseline) {
    auto out = withType(MessageType::Baseline);
    appendText(out, ManifestSerialization::serialize(baseline));
    return out;
}

SyncManifest SyncProtocol::decodeBaseline(const std::vector<uint8_t>& message) {
    expectType(message, MessageType::Baseline);
    return ManifestSerialization::fromJson(parseJson(message, 1));
}

std::vector<uint8_t> SyncProtocol::encodePlan(const PlanMessage& plan) {
    Json::Value root(Json::objectValue);
    root["job_id"] = plan.jobId;
    root["plan"] = plan.plan.toJson();

    auto out = withType(MessageType::Plan);
    appendText(out, writeJson(root));
    return out;
}

PlanMessage SyncProtocol::decodePlan(const std::vector<uint8_t>& message) {
    expectType(message, MessageType::Plan);
    Json::Value root = parseJson(message, 1);
    if (!root.isObject() || !root["job_id"].isString() || !root.isMember("plan")) {
        throw ProtocolError("Malformed PLAN");
    }
    PlanMessage plan;
    plan.jobId = root["job_id"].asString();
    plan.plan = TransferPlan::fromJson(root["plan"]);
    return plan;
}

std::vector<uint8_t> SyncProtocol::encodeReady(const ReadyMessage& ready) {
    auto out = withType(MessageType::Ready);
    putIds(out, ready.have);
    putIds(out, ready.need);
    return out;
}

ReadyMessage SyncProtocol::decodeReady(const std::vector<uint8_t>& message) {
    expectType(message, MessageType::Ready);
    size_t pos = 1;
    ReadyMessage ready;
    ready.have = getIds(message, pos);
    ready.need = getIds(message, pos);
    expectEnd(message, pos);
    return ready;
}

std::vector<uint8_t> SyncProtocol::encodeBatch(const std::vector<ChunkId>& ids) {
    auto out = withType(MessageType::Batch);
    putIds(out, ids);
    return out;
}

std::vector<ChunkId> SyncProtocol::decodeBatch(const std::vector<uint8_t>& message) {
    expectType(message, MessageType::Batch);
    size_t pos = 1;
    auto ids = getIds(message, pos);
    expectEnd(message, pos);
    return ids;
}

std::vector<uint8_t> SyncProtocol::encodeChunk(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> out;
    out.reserve(data.size() + 1);
    out.push_back(static_cast<uint8_t>(MessageType::Chunk));
    out.insert(out.end(), data.begin(), data.end());
    return out;
}

std::vector<uint8_t> SyncProtocol::decodeChunk(std::vector<uint8_t>&& message) {
    expectType(message, MessageType::Chunk);
    message.erase(message.begin());
    return std::move(message);
}

std::vector<uint8_t> SyncProtocol::encodeBatchResult(const BatchResultMessage& result) {
    auto out = withType(MessageType::BatchResult);
    putIds(out, result.verified);
    putIds(out, result.failed);
    return out;
}

BatchResultMessage SyncProtocol::decodeBatchResult(const std::vector<uint8_t>& message) {
    expectType(message, MessageType::BatchResult);
    size_t pos = 1;
    BatchResultMessage result;
    result.verified = getIds(message, pos);
    result.failed = getIds(message, pos);
    expectEnd(message, pos);
    return result;
}

std::vector<uint8_t> SyncProtocol::encodeDone() {
    return withType(MessageType::Done);
}

std::vector<uint8_t> SyncProtocol::encodeComplete(const std::vector<ChunkId>& requeued) {
    auto out = withType(MessageType::Complete);
    putIds(out, requeued);
    return out;
}

std::vector<ChunkId> SyncProtocol::decodeComplete(const std::vector<uint8_t>& message) {
    expectType(message, MessageType::Complete);
    size_t pos = 1;
    auto ids = getIds(message, pos);
    expectEnd(message, pos);
    return ids;
}

std::vector<uint8_t> SyncProtocol::encodeAbort(const AbortMessage& abort) {
    auto out = withType(MessageType::Abort);
    putU32(out, static_cast<uint32_t>(abort.code));
    appendText(out, abort.reason);
    return out;
}

AbortMessage SyncProtocol::decodeAbort(const std::vector<uint8_t>& message) {
    expectType(message, MessageType::Abort);
    size_t pos = 1;
    AbortMessage abort;
    abort.code = static_cast<ErrorCode>(getU32(message, pos));
    abort.reason.assign(message.begin() + static_cast<std::ptrdiff_t>(pos), message.end());
    return abort;
}

} // namespace GlobalSend
