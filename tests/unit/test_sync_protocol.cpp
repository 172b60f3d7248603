/**
 * @file test_sync_protocol.cpp
 * @brief Session message bodies and their rejection of malformed input
 */

#include <gtest/gtest.h>

#include "Constants.h"
#include "Crypto.h"
#include "Exceptions.h"
#include "ManifestBuilder.h"
#include "SyncProtocol.h"
#include "TestUtils.h"

#include <sstream>

using namespace GlobalSend;

class SyncProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (uint64_t i = 0; i < 3; ++i) {
            ids_.push_back(Crypto::sha256(test::randomBytes(8, i + 1)));
        }

        ManifestBuilder builder(ChunkerParams{2 * 1024, 8 * 1024, 32 * 1024});
        auto data = test::randomBytes(20 * 1024, 9);
        std::istringstream in(std::string(data.begin(), data.end()));
        SyncManifest::FileMap files;
        files.emplace("x.bin", builder.buildFromStream(in, "x.bin", 42, 0644));
        manifest_ = SyncManifest("src", 7, files);
    }

    std::vector<ChunkId> ids_;
    SyncManifest manifest_;
};

TEST_F(SyncProtocolTest, OfferCarriesVersionAndManifest) {
    auto wire = SyncProtocol::encodeOffer(OfferMessage{config::PROTOCOL_VERSION, manifest_});
    EXPECT_EQ(SyncProtocol::typeOf(wire), MessageType::Offer);
    EXPECT_EQ(wire[1], config::PROTOCOL_VERSION);

    OfferMessage offer = SyncProtocol::decodeOffer(wire);
    EXPECT_EQ(offer.protocolVersion, config::PROTOCOL_VERSION);
    EXPECT_EQ(offer.target.digest(), manifest_.digest());
}

TEST_F(SyncProtocolTest, OfferFromOtherProtocolVersionIsRejected) {
    auto wire = SyncProtocol::encodeOffer(OfferMessage{static_cast<uint8_t>(config::PROTOCOL_VERSION + 1), manifest_});
    EXPECT_THROW(SyncProtocol::decodeOffer(wire), ProtocolError);
}

TEST_F(SyncProtocolTest, PlanCarriesJobId) {
    PlanMessage message;
    message.jobId = "abc123";
    message.plan.filesToAssemble.push_back("x.bin");
    message.plan.chunksToSend.push_back({ids_[0], 100, "x.bin", 0});

    PlanMessage decoded = SyncProtocol::decodePlan(SyncProtocol::encodePlan(message));
    EXPECT_EQ(decoded.jobId, "abc123");
    EXPECT_EQ(decoded.plan.digest(), message.plan.digest());
}

TEST_F(SyncProtocolTest, IdListsKeepOrder) {
    ReadyMessage ready{{ids_[2]}, {ids_[0], ids_[1]}};
    ReadyMessage decoded = SyncProtocol::decodeReady(SyncProtocol::encodeReady(ready));
    EXPECT_EQ(decoded.have, ready.have);
    EXPECT_EQ(decoded.need, ready.need);

    auto batch = SyncProtocol::encodeBatch(ids_);
    EXPECT_EQ(batch.size(), 1u + 4u + 3u * 32u);
    EXPECT_EQ(SyncProtocol::decodeBatch(batch), ids_);

    BatchResultMessage result{{ids_[0]}, {ids_[1], ids_[2]}};
    BatchResultMessage decodedResult = SyncProtocol::decodeBatchResult(SyncProtocol::encodeBatchResult(result));
    EXPECT_EQ(decodedResult.verified, result.verified);
    EXPECT_EQ(decodedResult.failed, result.failed);

    EXPECT_TRUE(SyncProtocol::decodeComplete(SyncProtocol::encodeComplete({})).empty());
}

TEST_F(SyncProtocolTest, ChunkBodyIsRawBytes) {
    auto data = test::randomBytes(1000, 4);
    auto wire = SyncProtocol::encodeChunk(data);
    ASSERT_EQ(wire.size(), data.size() + 1);
    EXPECT_EQ(wire[0], static_cast<uint8_t>(MessageType::Chunk));
    EXPECT_EQ(SyncProtocol::decodeChunk(std::move(wire)), data);
}

TEST_F(SyncProtocolTest, AbortCarriesCodeAndReason) {
    auto wire = SyncProtocol::encodeAbort(AbortMessage{ErrorCode::CANCELLED, "user pressed stop"});
    AbortMessage abort = SyncProtocol::decodeAbort(wire);
    EXPECT_EQ(abort.code, ErrorCode::CANCELLED);
    EXPECT_EQ(abort.reason, "user pressed stop");
}

TEST_F(SyncProtocolTest, RejectsMalformedMessages) {
    EXPECT_THROW(SyncProtocol::typeOf({}), ProtocolError);
    EXPECT_THROW(SyncProtocol::typeOf({0}), ProtocolError);
    EXPECT_THROW(SyncProtocol::typeOf({11}), ProtocolError);

    auto batch = SyncProtocol::encodeBatch(ids_);
    auto truncated = batch;
    truncated.pop_back();
    EXPECT_THROW(SyncProtocol::decodeBatch(truncated), ProtocolError);

    auto trailing = batch;
    trailing.push_back(0);
    EXPECT_THROW(SyncProtocol::decodeBatch(trailing), ProtocolError);

    // A huge claimed count must not be trusted.
    std::vector<uint8_t> lying{static_cast<uint8_t>(MessageType::Batch), 0xff, 0xff, 0xff, 0xff};
    EXPECT_THROW(SyncProtocol::decodeBatch(lying), ProtocolError);

    EXPECT_THROW(SyncProtocol::decodeReady(batch), ProtocolError);

    std::vector<uint8_t> badJson{static_cast<uint8_t>(MessageType::Plan), '{', 'x'};
    EXPECT_THROW(SyncProtocol::decodePlan(badJson), ProtocolError);

    EXPECT_THROW(SyncProtocol::decodeOffer({static_cast<uint8_t>(MessageType::Offer)}), ProtocolError);
}

TEST(MessageTypeTest, NamesMatchWireTypes) {
    EXPECT_STREQ(messageTypeName(MessageType::BatchResult), "BATCH_RESULT");
    EXPECT_STREQ(messageTypeName(MessageType::Abort), "ABORT");
    EXPECT_EQ(SyncProtocol::typeOf(SyncProtocol::encodeDone()), MessageType::Done);
}
