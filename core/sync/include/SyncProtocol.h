#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ErrorCodes.h"
#include "Manifest.h"
#include "TransferPlan.h"

namespace GlobalSend {

/**
 * @brief Session message types. Every message is the plaintext of one
 *        frame and starts with its type byte.
 *
 * Sender (S) and receiver (R) exchange:
 *   S: OFFER        R: BASELINE
 *   S: PLAN         R: READY
 *   S: BATCH + CHUNK...   R: BATCH_RESULT      (repeated)
 *   S: DONE         R: COMPLETE                (repeated while COMPLETE re-queues)
 * Either side may send ABORT at any point.
 */
enum class MessageType : uint8_t {
    Offer = 1,
    Baseline = 2,
    Plan = 3,
    Ready = 4,
    Batch = 5,
    Chunk = 6,
    BatchResult = 7,
    Done = 8,
    Complete = 9,
    Abort = 10
};

const char* messageTypeName(MessageType type);

struct OfferMessage {
    uint8_t protocolVersion{0};
    SyncManifest target;
};

struct PlanMessage {
    std::string jobId;
    TransferPlan plan;
};

/// have: plan chunks already on the receiver's disk; need: chunks still to send.
struct ReadyMessage {
    std::vector<ChunkId> have;
    std::vector<ChunkId> need;
};

struct BatchResultMessage {
    std::vector<ChunkId> verified;
    std::vector<ChunkId> failed;
};

struct AbortMessage {
    ErrorCode code{ErrorCode::INTERNAL_ERROR};
    std::string reason;
};

/**
 * @brief Encoding of message bodies.
 *
 * Manifests and plans are JSON; id lists are a 4-byte big-endian count
 * followed by raw 32-byte ids. Every decode throws ProtocolError on a
 * truncated or mistyped body.
 */
class SyncProtocol {
public:
    /// @throws ProtocolError on an empty message or unknown type
    static MessageType typeOf(const std::vector<uint8_t>& message);

    static std::vector<uint8_t> encodeOffer(const OfferMessage& offer);
    /**
     * @throws ProtocolError if the peer speaks another protocol version
     * @throws ManifestVersionError if the manifest format is not supported
     */
    static OfferMessage decodeOffer(const std::vector<uint8_t>& message);

    static std::vector<uint8_t> encodeBaseline(const SyncManifest& baseline);
    static SyncManifest decodeBaseline(const std::vector<uint8_t>& message);

    static std::vector<uint8_t> encodePlan(const PlanMessage& plan);
    static PlanMessage decodePlan(const std::vector<uint8_t>& message);

    static std::vector<uint8_t> encodeReady(const ReadyMessage& ready);
    static ReadyMessage decodeReady(const std::vector<uint8_t>& message);

    static std::vector<uint8_t> encodeBatch(const std::vector<ChunkId>& ids);
    static std::vector<ChunkId> decodeBatch(const std::vector<uint8_t>& message);

    static std::vector<uint8_t> encodeChunk(const std::vector<uint8_t>& data);
    static std::vector<uint8_t> decodeChunk(std::vector<uint8_t>&& message);

    static std::vector<uint8_t> encodeBatchResult(const BatchResultMessage& result);
    static BatchResultMessage decodeBatchResult(const std::vector<uint8_t>& message);

    static std::vector<uint8_t> encodeDone();

    static std::vector<uint8_t> encodeComplete(const std::vector<ChunkId>& requeued);
    static std::vector<ChunkId> decodeComplete(const std::vector<uint8_t>& message);

    static std::vector<uint8_t> encodeAbort(const AbortMessage& abort);
    static AbortMessage decodeAbort(const std::vector<uint8_t>& message);
};

} // namespace GlobalSend
