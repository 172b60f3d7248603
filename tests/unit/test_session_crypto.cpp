/**
 * @file test_session_crypto.cpp
 * @brief SessionCipher: per-direction keys, AAD binding, replay rejection,
 *        and frame encoding
 */

#include <gtest/gtest.h>

#include "Constants.h"
#include "Crypto.h"
#include "Exceptions.h"
#include "Frame.h"
#include "SessionCrypto.h"
#include "TestUtils.h"

using namespace GlobalSend;

class SessionCipherTest : public ::testing::Test {
protected:
    void SetUp() override {
        secret_ = test::randomBytes(32, 1234);
        initiator_ = std::make_unique<SessionCipher>(secret_, SessionRole::Initiator);
        responder_ = std::make_unique<SessionCipher>(secret_, SessionRole::Responder);
        chunkId_ = Crypto::sha256(test::randomBytes(64, 1));
        otherId_ = Crypto::sha256(test::randomBytes(64, 2));
        message_ = test::randomBytes(1000, 3);
    }

    std::vector<uint8_t> secret_;
    std::unique_ptr<SessionCipher> initiator_;
    std::unique_ptr<SessionCipher> responder_;
    ChunkId chunkId_;
    ChunkId otherId_;
    std::vector<uint8_t> message_;
};

// ============================================================================
// Sealing and opening
// ============================================================================

TEST_F(SessionCipherTest, FramesOpenOnPeer) {
    Frame frame = initiator_->seal(chunkId_, message_);
    EXPECT_EQ(frame.counter, 1u);
    EXPECT_EQ(frame.ciphertext.size(), message_.size() + config::AEAD_TAG_SIZE);

    EXPECT_EQ(responder_->open(frame, chunkId_), message_);
    EXPECT_EQ(responder_->lastAcceptedCounter(), 1u);

    Frame reply = responder_->seal(ChunkId{}, message_);
    EXPECT_EQ(reply.counter, 1u);
    EXPECT_EQ(initiator_->open(reply, ChunkId{}), message_);
}

TEST_F(SessionCipherTest, CountersIncreasePerFrame) {
    for (uint64_t i = 1; i <= 5; ++i) {
        Frame frame = initiator_->seal(chunkId_, message_);
        EXPECT_EQ(frame.counter, i);
        responder_->open(frame, chunkId_);
    }
    EXPECT_EQ(initiator_->lastSentCounter(), 5u);
    EXPECT_EQ(responder_->lastAcceptedCounter(), 5u);
}

TEST_F(SessionCipherTest, TamperedFrameFailsAuthentication) {
    Frame frame = initiator_->seal(chunkId_, message_);
    frame.ciphertext[10] ^= 0x80;
    EXPECT_THROW(responder_->open(frame, chunkId_), FrameAuthenticationError);
    EXPECT_EQ(responder_->lastAcceptedCounter(), 0u);
}

TEST_F(SessionCipherTest, ChunkIdIsBoundIntoFrame) {
    Frame frame = initiator_->seal(chunkId_, message_);

    EXPECT_FALSE(responder_->tryOpen(frame, otherId_).has_value());
    EXPECT_EQ(responder_->lastAcceptedCounter(), 0u);

    // Retrying with the right id still works after a failed attempt.
    auto plaintext = responder_->tryOpen(frame, chunkId_);
    ASSERT_TRUE(plaintext.has_value());
    EXPECT_EQ(*plaintext, message_);
}

TEST_F(SessionCipherTest, ReplayedFrameIsRejected) {
    Frame first = initiator_->seal(chunkId_, message_);
    Frame second = initiator_->seal(chunkId_, message_);

    responder_->open(second, chunkId_);
    EXPECT_THROW(responder_->open(second, chunkId_), FrameReplayError);
    EXPECT_THROW(responder_->open(first, chunkId_), FrameReplayError);
    EXPECT_EQ(responder_->lastAcceptedCounter(), 2u);
}

TEST_F(SessionCipherTest, DirectionsUseSeparateKeys) {
    Frame frame = initiator_->seal(chunkId_, message_);
    // Reflecting our own frame back at us must not authenticate.
    EXPECT_FALSE(initiator_->tryOpen(frame, chunkId_).has_value());

    SessionCipher secondInitiator(secret_, SessionRole::Initiator);
    EXPECT_FALSE(secondInitiator.tryOpen(frame, chunkId_).has_value());
}

TEST_F(SessionCipherTest, SaltAndSecretSeparateSessions) {
    SessionCipher saltedInitiator(secret_, SessionRole::Initiator, {'s', '1'});
    SessionCipher otherSaltResponder(secret_, SessionRole::Responder, {'s', '2'});
    SessionCipher sameSaltResponder(secret_, SessionRole::Responder, {'s', '1'});

    Frame frame = saltedInitiator.seal(chunkId_, message_);
    EXPECT_FALSE(otherSaltResponder.tryOpen(frame, chunkId_).has_value());
    EXPECT_FALSE(responder_->tryOpen(frame, chunkId_).has_value());
    EXPECT_TRUE(sameSaltResponder.tryOpen(frame, chunkId_).has_value());

    SessionCipher strangerResponder(test::randomBytes(32, 999), SessionRole::Responder);
    Frame plain = initiator_->seal(chunkId_, message_);
    EXPECT_FALSE(strangerResponder.tryOpen(plain, chunkId_).has_value());
}

TEST_F(SessionCipherTest, DestroyedCipherRefusesWork) {
    Frame frame = initiator_->seal(chunkId_, message_);
    initiator_->destroy();
    responder_->destroy();

    EXPECT_TRUE(initiator_->destroyed());
    EXPECT_THROW(initiator_->seal(chunkId_, message_), std::logic_error);
    EXPECT_THROW(responder_->open(frame, chunkId_), std::logic_error);
}

// ============================================================================
// Key material and nonces
// ============================================================================

TEST(SessionKeyMaterialTest, DirectionLabelsAreDistinct) {
    auto secret = test::randomBytes(32, 5);
    auto forward = SessionKeyMaterial::derive(secret, {}, Direction::InitiatorToResponder);
    auto backward = SessionKeyMaterial::derive(secret, {}, Direction::ResponderToInitiator);

    EXPECT_EQ(forward.directionSalt, "globalsend v1 initiator->responder");
    EXPECT_EQ(backward.directionSalt, "globalsend v1 responder->initiator");
    EXPECT_EQ(forward.aeadKey.size(), config::AEAD_KEY_SIZE);
    EXPECT_NE(forward.aeadKey, backward.aeadKey);
    EXPECT_NE(forward.baseNonce, backward.baseNonce);

    auto moved = std::move(forward);
    EXPECT_EQ(moved.aeadKey.size(), config::AEAD_KEY_SIZE);
    EXPECT_TRUE(forward.aeadKey.empty());
}

TEST(SessionKeyMaterialTest, NonceXorsCounterIntoTail) {
    std::array<uint8_t, SessionKeyMaterial::NONCE_SIZE> base{};
    base.fill(0xff);

    auto nonce = SessionCipher::deriveNonce(base, 0x0102);
    for (size_t i = 0; i < 10; ++i) {
        EXPECT_EQ(nonce[i], 0xff) << i;
    }
    EXPECT_EQ(nonce[10], 0xff ^ 0x01);
    EXPECT_EQ(nonce[11], 0xff ^ 0x02);

    EXPECT_NE(SessionCipher::deriveNonce(base, 1), SessionCipher::deriveNonce(base, 2));
}

TEST(SessionKeyMaterialTest, AadLayout) {
    ChunkId id;
    id.bytes.fill(0xab);
    auto aad = SessionCipher::buildAad(id, 7, Direction::ResponderToInitiator);

    ASSERT_EQ(aad.size(), 32u + 8u + 1u);
    EXPECT_EQ(aad[0], 0xab);
    EXPECT_EQ(aad[31], 0xab);
    EXPECT_EQ(aad[39], 7);
    EXPECT_EQ(aad[40], static_cast<uint8_t>(Direction::ResponderToInitiator));
}

// ============================================================================
// Frame codec
// ============================================================================

TEST(FrameCodecTest, EncodesLengthAndCounter) {
    Frame frame;
    frame.counter = 0x0102030405060708ULL;
    frame.ciphertext = test::randomBytes(40, 8);

    auto wire = FrameCodec::encode(frame);
    ASSERT_EQ(wire.size(), 4u + 12u + 40u);
    EXPECT_EQ(wire[3], 12 + 40);
    for (size_t i = 4; i < 8; ++i) {
        EXPECT_EQ(wire[i], 0);
    }
    EXPECT_EQ(wire[8], 0x01);
    EXPECT_EQ(wire[15], 0x08);
}

TEST(FrameCodecTest, ReaderHandlesSplitAndCoalescedInput) {
    Frame a{1, test::randomBytes(30, 1)};
    Frame b{2, test::randomBytes(50, 2)};
    auto wireA = FrameCodec::encode(a);
    auto wireB = FrameCodec::encode(b);

    std::vector<uint8_t> stream(wireA);
    stream.insert(stream.end(), wireB.begin(), wireB.end());

    FrameReader reader;
    size_t fed = 0;
    std::vector<Frame> frames;
    // Feed in awkward 7-byte pieces.
    while (fed < stream.size()) {
        size_t n = std::min<size_t>(7, stream.size() - fed);
        reader.feed(std::vector<uint8_t>(stream.begin() + static_cast<std::ptrdiff_t>(fed),
                                         stream.begin() + static_cast<std::ptrdiff_t>(fed + n)));
        fed += n;
        while (auto frame = reader.next()) {
            frames.push_back(std::move(*frame));
        }
    }

    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].counter, 1u);
    EXPECT_EQ(frames[0].ciphertext, a.ciphertext);
    EXPECT_EQ(frames[1].counter, 2u);
    EXPECT_EQ(frames[1].ciphertext, b.ciphertext);
    EXPECT_EQ(reader.buffered(), 0u);
}

TEST(FrameCodecTest, ReaderRejectsBadLengths) {
    FrameReader tooShort;
    tooShort.feed({0x00, 0x00, 0x00, 0x05});
    EXPECT_THROW(tooShort.next(), ProtocolError);

    FrameReader tooLong;
    tooLong.feed({0x7f, 0xff, 0xff, 0xff});
    EXPECT_THROW(tooLong.next(), ProtocolError);
}

TEST(FrameCodecTest, CounterAbove64BitsIsRejected) {
    uint8_t counter[12] = {0};
    counter[0] = 1;
    EXPECT_THROW(FrameCodec::readCounter(counter), ProtocolError);
}
