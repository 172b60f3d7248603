#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Digest.h"
#include "Frame.h"

namespace GlobalSend {

enum class SessionRole : uint8_t {
    Initiator,
    Responder
};

/// Value doubles as the direction tag byte in associated data.
enum class Direction : uint8_t {
    InitiatorToResponder = 1,
    ResponderToInitiator = 2
};

const char* directionLabel(Direction direction);

/**
 * @brief Keys for one direction of one session.
 *
 * Move-only; the key and nonce are wiped with OPENSSL_cleanse when the
 * object is destroyed or moved from.
 */
struct SessionKeyMaterial {
    static constexpr size_t NONCE_SIZE = 12;

    Direction direction{Direction::InitiatorToResponder};
    std::vector<uint8_t> aeadKey;
    std::array<uint8_t, NONCE_SIZE> baseNonce{};
    /// HKDF info label that separated this direction's keys from the other's.
    std::string directionSalt;

    SessionKeyMaterial() = default;
    ~SessionKeyMaterial();
    SessionKeyMaterial(SessionKeyMaterial&& other) noexcept;
    SessionKeyMaterial& operator=(SessionKeyMaterial&& other) noexcept;
    SessionKeyMaterial(const SessionKeyMaterial&) = delete;
    SessionKeyMaterial& operator=(const SessionKeyMaterial&) = delete;

    /**
     * @brief HKDF-SHA256(sharedSecret, salt, "globalsend v1 <direction>") -> key || base nonce.
     */
    static SessionKeyMaterial derive(const std::vector<uint8_t>& sharedSecret,
                                     const std::vector<uint8_t>& salt,
                                     Direction direction);

    void wipe();
};

/**
 * @brief Per-session frame encryption with replay protection.
 *
 * Holds the send keys and counter for our direction and the receive keys
 * and last accepted counter for the peer's. Counters start at 1 and never
 * reset for the lifetime of the object. Not thread-safe: the owning
 * TransferEngine drives it from one thread.
 */
class SessionCipher {
public:
    /**
     * @param sharedSecret Output of the authenticated key agreement
     * @param role Which side of the session we are
     * @param salt Optional HKDF salt both sides agree on (e.g. a session id)
     */
    SessionCipher(const std::vector<uint8_t>& sharedSecret, SessionRole role,
                  const std::vector<uint8_t>& salt = {});
    ~SessionCipher();

    SessionCipher(const SessionCipher&) = delete;
    SessionCipher& operator=(const SessionCipher&) = delete;

    /**
     * @brief Encrypt one message under the next send counter.
     * @param chunkId Chunk id bound into the AAD; all-zero for control messages
     */
    Frame seal(const ChunkId& chunkId, const std::vector<uint8_t>& plaintext);

    /**
     * @brief Decrypt a frame from the peer.
     * @throws FrameReplayError if the counter is not above the last accepted one
     * @throws FrameAuthenticationError if authentication fails
     */
    std::vector<uint8_t> open(const Frame& frame, const ChunkId& chunkId);

    /**
     * @brief As open(), but authentication failure yields nullopt.
     *
     * The replay check still throws. On failure the last accepted counter
     * is left unchanged, so the frame may be retried against a different
     * chunk id.
     */
    std::optional<std::vector<uint8_t>> tryOpen(const Frame& frame, const ChunkId& chunkId);

    /// Wipe all key material; any later seal/open throws.
    void destroy();

    SessionRole role() const { return role_; }
    uint64_t lastSentCounter() const { return sendCounter_; }
    uint64_t lastAcceptedCounter() const { return lastAccepted_; }
    bool destroyed() const { return destroyed_; }

    static std::vector<uint8_t> buildAad(const ChunkId& chunkId, uint64_t sequence, Direction direction);
    static std::array<uint8_t, SessionKeyMaterial::NONCE_SIZE> deriveNonce(
        const std::array<uint8_t, SessionKeyMaterial::NONCE_SIZE>& baseNonce, uint64_t counter);

private:
    SessionRole role_;
    SessionKeyMaterial sendKeys_;
    SessionKeyMaterial recvKeys_;
    uint64_t sendCounter_{0};
    uint64_t lastAccepted_{0};
    bool destroyed_{false};
};

} // namespace GlobalSend
