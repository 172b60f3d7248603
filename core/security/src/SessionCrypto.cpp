#include "SessionCrypto.h"

#include "Constants.h"
#include "Crypto.h"
#include "Exceptions.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"

#include <openssl/crypto.h>

#include <limits>

namespace GlobalSend {

const char* directionLabel(Direction direction) {
    switch (direction) {
        case Direction::InitiatorToResponder: return "initiator->responder";
        case Direction::ResponderToInitiator: return "responder->initiator";
    }
    return "unknown";
}

// ============================================================================
// SessionKeyMaterial
// ============================================================================

SessionKeyMaterial::~SessionKeyMaterial() {
    wipe();
}

SessionKeyMaterial::SessionKeyMaterial(SessionKeyMaterial&& other) noexcept
    : direction(other.direction),
      aeadKey(std::move(other.aeadKey)),
      baseNonce(other.baseNonce),
      directionSalt(std::move(other.directionSalt)) {
    other.wipe();
}

SessionKeyMaterial& SessionKeyMaterial::operator=(SessionKeyMaterial&& other) noexcept {
    if (this != &other) {
        wipe();
        direction = other.direction;
        aeadKey = std::move(other.aeadKey);
        baseNonce = other.baseNonce;
        directionSalt = std::move(other.directionSalt);
        other.wipe();
    }
    return *this;
}

void SessionKeyMaterial::wipe() {
    Crypto::secureWipe(aeadKey);
    OPENSSL_cleanse(baseNonce.data(), baseNonce.size());
}

SessionKeyMaterial SessionKeyMaterial::derive(const std::vector<uint8_t>& sharedSecret,
                                              const std::vector<uint8_t>& salt,
                                              Direction direction) {
    SessionKeyMaterial keys;
    keys.direction = direction;
    keys.directionSalt = std::string(config::HKDF_LABEL_PREFIX) + directionLabel(direction);

    auto okm = Crypto::hkdfSha256(sharedSecret, salt, keys.directionSalt,
                                  config::AEAD_KEY_SIZE + NONCE_SIZE);
    keys.aeadKey.assign(okm.begin(), okm.begin() + config::AEAD_KEY_SIZE);
    std::copy(okm.begin() + config::AEAD_KEY_SIZE, okm.end(), keys.baseNonce.begin());
    Crypto::secureWipe(okm);
    return keys;
}

// ============================================================================
// SessionCipher
// ============================================================================

SessionCipher::SessionCipher(const std::vector<uint8_t>& sharedSecret, SessionRole role,
                             const std::vector<uint8_t>& salt)
    : role_(role) {
    const Direction outbound = role == SessionRole::Initiator ? Direction::InitiatorToResponder
                                                              : Direction::ResponderToInitiator;
    const Direction inbound = role == SessionRole::Initiator ? Direction::ResponderToInitiator
                                                             : Direction::InitiatorToResponder;
    sendKeys_ = SessionKeyMaterial::derive(sharedSecret, salt, outbound);
    recvKeys_ = SessionKeyMaterial::derive(sharedSecret, salt, inbound);

    LOG_DEBUG_COMP_IF(std::string("Session keys derived, sending ") + directionLabel(outbound), "SessionCrypto");
}

SessionCipher::~SessionCipher() {
    destroy();
}

void SessionCipher::destroy() {
    sendKeys_.wipe();
    recvKeys_.wipe();
    destroyed_ = true;
}

std::vector<uint8_t> SessionCipher::buildAad(const ChunkId& chunkId, uint64_t sequence, Direction direction) {
    std::vector<uint8_t> aad;
    aad.reserve(ChunkId::SIZE + 8 + 1);
    aad.insert(aad.end(), chunkId.bytes.begin(), chunkId.bytes.end());
    for (int i = 7; i >= 0; --i) {
        aad.push_back(static_cast<uint8_t>(sequence >> (8 * i)));
    }
    aad.push_back(static_cast<uint8_t>(direction));
    return aad;
}

std::array<uint8_t, SessionKeyMaterial::NONCE_SIZE> SessionCipher::deriveNonce(
    const std::array<uint8_t, SessionKeyMaterial::NONCE_SIZE>& baseNonce, uint64_t counter) {
    auto nonce = baseNonce;
    // Counter, big-endian, XORed into the last 8 bytes.
    for (int i = 0; i < 8; ++i) {
        nonce[SessionKeyMaterial::NONCE_SIZE - 1 - i] ^= static_cast<uint8_t>(counter >> (8 * i));
    }
    return nonce;
}

Frame SessionCipher::seal(const ChunkId& chunkId, const std::vector<uint8_t>& plaintext) {
    if (destroyed_) {
        throw std::logic_error("SessionCipher used after destroy()");
    }
    if (sendCounter_ == std::numeric_limits<uint64_t>::max()) {
        throw GlobalSendError(ErrorCode::ENCRYPTION_FAILED, "Send counter exhausted; a new session is required");
    }

    Frame frame;
    frame.counter = ++sendCounter_;
    auto nonce = deriveNonce(sendKeys_.baseNonce, frame.counter);
    auto aad = buildAad(chunkId, frame.counter, sendKeys_.direction);
    frame.ciphertext = Crypto::aeadSeal(sendKeys_.aeadKey, nonce.data(), aad, plaintext.data(), plaintext.size());
    return frame;
}

std::optional<std::vector<uint8_t>> SessionCipher::tryOpen(const Frame& frame, const ChunkId& chunkId) {
    if (destroyed_) {
        throw std::logic_error("SessionCipher used after destroy()");
    }
    if (frame.counter <= lastAccepted_) {
        MetricsCollector::instance().incrementReplayRejections();
        LOG_ERROR_COMP("Rejected frame with counter " + std::to_string(frame.counter) +
                       " (last accepted " + std::to_string(lastAccepted_) + ")", "SessionCrypto");
        throw FrameReplayError("Frame counter " + std::to_string(frame.counter) +
                               " not above last accepted " + std::to_string(lastAccepted_));
    }

    auto nonce = deriveNonce(recvKeys_.baseNonce, frame.counter);
    auto aad = buildAad(chunkId, frame.counter, recvKeys_.direction);
    auto plaintext = Crypto::aeadOpen(recvKeys_.aeadKey, nonce.data(), aad,
                                      frame.ciphertext.data(), frame.ciphertext.size());
    if (plaintext) {
        lastAccepted_ = frame.counter;
    }
    return plaintext;
}

std::vector<uint8_t> SessionCipher::open(const Frame& frame, const ChunkId& chunkId) {
    auto plaintext = tryOpen(frame, chunkId);
    if (!plaintext) {
        throw FrameAuthenticationError("Frame " + std::to_string(frame.counter) + " failed authentication");
    }
    return std::move(*plaintext);
}

} // namespace GlobalSend
