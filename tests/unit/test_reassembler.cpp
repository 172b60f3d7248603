/**
 * @file test_reassembler.cpp
 * @brief Receiver-side assembly: temp files, verified commit, resume,
 *        local fills, renames and metadata
 */

#include <gtest/gtest.h>

#include "ChunkSource.h"
#include "Constants.h"
#include "Crypto.h"
#include "DeltaPlanner.h"
#include "Exceptions.h"
#include "ManifestBuilder.h"
#include "Reassembler.h"
#include "TestUtils.h"

#include <filesystem>
#include <fcntl.h>
#include <sys/stat.h>
#include <unordered_map>

using namespace GlobalSend;
namespace fs = std::filesystem;

class ReassemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<test::TempDir>("gs_reassembler");
        src_ = dir_->path() / "src";
        dst_ = dir_->path() / "dst";
        fs::create_directories(src_);
        fs::create_directories(dst_);
    }

    void TearDown() override {
        dir_.reset();
    }

    SyncManifest scan(const fs::path& root) const { return builder_.scanDirectory(root); }

    // Sender side: bytes of every chunk id in the target, read from src.
    std::vector<uint8_t> chunkBytes(const SyncManifest& target, const ChunkId& id) const {
        for (const auto& entry : target.files()) {
            for (const auto& chunk : entry.second.chunks) {
                if (chunk.id == id) {
                    return readFileRange(src_ / entry.first, chunk.offset, chunk.size);
                }
            }
        }
        ADD_FAILURE() << "chunk " << id.shortHex() << " not in target";
        return {};
    }

    void deliver(Reassembler& reassembler, const SyncManifest& target, const std::vector<ChunkId>& ids) const {
        for (const auto& id : ids) {
            EXPECT_TRUE(reassembler.writeChunk(id, chunkBytes(target, id)));
        }
    }

    // One full sync of src into dst; returns the number of chunks fetched from the "peer".
    size_t syncOnce(PlanOptions options = {}) {
        SyncManifest baseline = scan(dst_);
        SyncManifest target = scan(src_);
        TransferPlan plan = DeltaPlanner(options).plan(baseline, target);

        Reassembler reassembler(dst_);
        auto need = reassembler.begin(target, baseline, plan);
        deliver(reassembler, target, need);
        EXPECT_TRUE(reassembler.finish().empty());
        return need.size();
    }

    ManifestBuilder builder_{ChunkerParams{2 * 1024, 8 * 1024, 32 * 1024}};
    std::unique_ptr<test::TempDir> dir_;
    fs::path src_;
    fs::path dst_;
};

// ============================================================================
// Commit
// ============================================================================

TEST_F(ReassemblerTest, AssemblesNewFilesIntoPlace) {
    auto big = test::randomBytes(300 * 1024, 1);
    test::writeFile(src_ / "big.bin", big);
    test::writeFile(src_ / "nested" / "small.txt", std::string("hello"));
    test::writeFile(src_ / "empty", std::string());

    EXPECT_GT(syncOnce(), 0u);

    EXPECT_EQ(test::readFile(dst_ / "big.bin"), big);
    EXPECT_EQ(test::readFile(dst_ / "nested" / "small.txt"), std::vector<uint8_t>({'h', 'e', 'l', 'l', 'o'}));
    EXPECT_TRUE(fs::exists(dst_ / "empty"));
    EXPECT_EQ(fs::file_size(dst_ / "empty"), 0u);
    EXPECT_EQ(scan(dst_).digest(), scan(src_).digest());
}

TEST_F(ReassemblerTest, NothingIsVisibleBeforeFinish) {
    test::writeFile(src_ / "f.bin", test::randomBytes(50 * 1024, 2));
    SyncManifest target = scan(src_);
    SyncManifest baseline = scan(dst_);
    TransferPlan plan = DeltaPlanner().plan(baseline, target);

    Reassembler reassembler(dst_);
    auto need = reassembler.begin(target, baseline, plan);
    deliver(reassembler, target, need);

    EXPECT_FALSE(fs::exists(dst_ / "f.bin"));
    EXPECT_TRUE(fs::exists(Reassembler::tempPathFor(dst_, *target.find("f.bin"))));
    EXPECT_TRUE(reassembler.missingChunks().empty());

    EXPECT_TRUE(reassembler.finish().empty());
    EXPECT_TRUE(fs::exists(dst_ / "f.bin"));
    EXPECT_FALSE(fs::exists(Reassembler::tempPathFor(dst_, *target.find("f.bin"))));
    EXPECT_EQ(reassembler.filesCommitted(), 1u);
}

TEST_F(ReassemblerTest, IncompleteFilesAreReportedNotCommitted) {
    test::writeFile(src_ / "f.bin", test::randomBytes(100 * 1024, 3));
    SyncManifest target = scan(src_);
    SyncManifest baseline = scan(dst_);
    TransferPlan plan = DeltaPlanner().plan(baseline, target);

    Reassembler reassembler(dst_);
    auto need = reassembler.begin(target, baseline, plan);
    ASSERT_GT(need.size(), 2u);
    deliver(reassembler, target, {need[0]});

    auto missing = reassembler.finish();
    EXPECT_EQ(missing.size(), need.size() - 1);
    EXPECT_FALSE(fs::exists(dst_ / "f.bin"));

    // Unknown or already written ids are ignored.
    EXPECT_FALSE(reassembler.writeChunk(need[0], chunkBytes(target, need[0])));
}

TEST_F(ReassemblerTest, CorruptTempIsRequeuedThenRecommitted) {
    auto data = test::randomBytes(120 * 1024, 4);
    test::writeFile(src_ / "f.bin", data);
    SyncManifest target = scan(src_);
    SyncManifest baseline = scan(dst_);
    TransferPlan plan = DeltaPlanner().plan(baseline, target);

    Reassembler reassembler(dst_);
    auto need = reassembler.begin(target, baseline, plan);
    deliver(reassembler, target, need);

    // Flip a byte on disk between write and commit.
    fs::path temp = Reassembler::tempPathFor(dst_, *target.find("f.bin"));
    auto onDisk = test::readFile(temp);
    onDisk[onDisk.size() / 2] ^= 0x01;
    test::writeFile(temp, onDisk);

    auto requeued = reassembler.finish();
    EXPECT_EQ(requeued.size(), target.find("f.bin")->chunks.size());
    EXPECT_FALSE(fs::exists(dst_ / "f.bin"));

    deliver(reassembler, target, requeued);
    EXPECT_TRUE(reassembler.finish().empty());
    EXPECT_EQ(test::readFile(dst_ / "f.bin"), data);
}

TEST_F(ReassemblerTest, RestoresPermissionsAndMtime) {
    test::writeFile(src_ / "tool", test::randomBytes(5000, 5));
    ASSERT_EQ(::chmod((src_ / "tool").c_str(), 0751), 0);
    struct timespec times[2];
    times[0].tv_sec = 1600000000;
    times[0].tv_nsec = 500;
    times[1] = times[0];
    ASSERT_EQ(::utimensat(AT_FDCWD, (src_ / "tool").c_str(), times, 0), 0);

    syncOnce();

    struct stat st;
    ASSERT_EQ(::stat((dst_ / "tool").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 07777, 0751u);
    EXPECT_EQ(st.st_mtim.tv_sec, 1600000000);
    EXPECT_EQ(st.st_mtim.tv_nsec, 500);
}

TEST_F(ReassemblerTest, CreatesSymlinks) {
    test::writeFile(src_ / "real.txt", std::string("real"));
    fs::create_symlink("real.txt", src_ / "alias");

    syncOnce();

    ASSERT_TRUE(fs::is_symlink(dst_ / "alias"));
    EXPECT_EQ(fs::read_symlink(dst_ / "alias"), fs::path("real.txt"));
}

// ============================================================================
// Local data and resume
// ============================================================================

TEST_F(ReassemblerTest, ReusesLocalChunksForEditedFile) {
    auto original = test::randomBytes(400 * 1024, 6);
    test::writeFile(src_ / "doc.bin", original);
    syncOnce();

    auto edited = original;
    edited.insert(edited.begin() + 200 * 1024, 100, 0x42);
    test::writeFile(src_ / "doc.bin", edited);

    const size_t fetched = syncOnce();
    EXPECT_GE(fetched, 1u);
    EXPECT_LT(fetched, scan(src_).find("doc.bin")->chunks.size() / 2);
    EXPECT_EQ(test::readFile(dst_ / "doc.bin"), edited);
}

TEST_F(ReassemblerTest, ChangedLocalCopyIsFetchedFromPeer) {
    auto shared = test::randomBytes(60 * 1024, 7);
    test::writeFile(dst_ / "local.bin", shared);
    test::writeFile(src_ / "local.bin", shared);
    test::writeFile(src_ / "copy.bin", shared);

    SyncManifest baseline = scan(dst_);
    SyncManifest target = scan(src_);
    TransferPlan plan = DeltaPlanner().plan(baseline, target);
    EXPECT_TRUE(plan.chunksToSend.empty());

    // The receiver's file changes after its manifest was taken.
    test::writeFile(dst_ / "local.bin", test::randomBytes(60 * 1024, 8));

    Reassembler reassembler(dst_);
    auto need = reassembler.begin(target, baseline, plan);
    EXPECT_EQ(need.size(), target.find("copy.bin")->chunks.size());
    deliver(reassembler, target, need);
    EXPECT_TRUE(reassembler.finish().empty());
    EXPECT_EQ(test::readFile(dst_ / "copy.bin"), shared);
}

TEST_F(ReassemblerTest, ResumeReusesVerifiedTempChunks) {
    test::writeFile(src_ / "f.bin", test::randomBytes(200 * 1024, 9));
    SyncManifest target = scan(src_);
    SyncManifest baseline = scan(dst_);
    TransferPlan plan = DeltaPlanner().plan(baseline, target);

    std::vector<ChunkId> firstNeed;
    {
        Reassembler first(dst_);
        firstNeed = first.begin(target, baseline, plan);
        ASSERT_GT(firstNeed.size(), 3u);
        deliver(first, target, std::vector<ChunkId>(firstNeed.begin(), firstNeed.begin() + 3));
    }

    // The partial file is invisible to scans, so the baseline is unchanged.
    EXPECT_EQ(scan(dst_).digest(), baseline.digest());

    Reassembler second(dst_);
    auto need = second.begin(target, scan(dst_), plan);
    EXPECT_EQ(need.size(), firstNeed.size() - 3);
    deliver(second, target, need);
    EXPECT_TRUE(second.finish().empty());
    EXPECT_EQ(scan(dst_).digest(), target.digest());
}

// ============================================================================
// Renames, deletes and plan validation
// ============================================================================

TEST_F(ReassemblerTest, MirrorPlanRenamesAndDeletes) {
    auto moved = test::randomBytes(40 * 1024, 10);
    test::writeFile(dst_ / "old.txt", moved);
    test::writeFile(dst_ / "stale.txt", std::string("stale"));
    test::writeFile(src_ / "dir" / "new.txt", moved);

    EXPECT_EQ(syncOnce(PlanOptions{true}), 0u);

    EXPECT_FALSE(fs::exists(dst_ / "old.txt"));
    EXPECT_FALSE(fs::exists(dst_ / "stale.txt"));
    EXPECT_EQ(test::readFile(dst_ / "dir" / "new.txt"), moved);
}

TEST_F(ReassemblerTest, EditedRenameSourceIsAssembledInstead) {
    auto moved = test::randomBytes(40 * 1024, 13);
    test::writeFile(dst_ / "old.txt", moved);
    test::writeFile(src_ / "new.txt", moved);

    SyncManifest baseline = scan(dst_);
    SyncManifest target = scan(src_);
    TransferPlan plan = DeltaPlanner(PlanOptions{true}).plan(baseline, target);
    ASSERT_EQ(plan.renames.size(), 1u);

    // The receiver edits the source after its manifest was taken.
    auto edited = moved;
    edited[100] ^= 0xff;
    test::writeFile(dst_ / "old.txt", edited);

    Reassembler reassembler(dst_);
    auto need = reassembler.begin(target, baseline, plan);
    EXPECT_FALSE(need.empty());
    deliver(reassembler, target, need);
    EXPECT_TRUE(reassembler.finish().empty());

    EXPECT_EQ(test::readFile(dst_ / "new.txt"), moved);
    EXPECT_EQ(test::readFile(dst_ / "old.txt"), edited);
}

TEST_F(ReassemblerTest, RenameSourceEditedBeforeFinishIsRequeued) {
    auto moved = test::randomBytes(40 * 1024, 14);
    test::writeFile(dst_ / "old.txt", moved);
    test::writeFile(src_ / "new.txt", moved);

    SyncManifest baseline = scan(dst_);
    SyncManifest target = scan(src_);
    TransferPlan plan = DeltaPlanner(PlanOptions{true}).plan(baseline, target);
    ASSERT_EQ(plan.renames.size(), 1u);

    Reassembler reassembler(dst_);
    EXPECT_TRUE(reassembler.begin(target, baseline, plan).empty());

    auto edited = moved;
    edited[100] ^= 0xff;
    test::writeFile(dst_ / "old.txt", edited);

    auto requeued = reassembler.finish();
    EXPECT_EQ(requeued.size(), target.find("new.txt")->chunks.size());
    EXPECT_FALSE(fs::exists(dst_ / "new.txt"));
    EXPECT_EQ(test::readFile(dst_ / "old.txt"), edited);

    deliver(reassembler, target, requeued);
    EXPECT_TRUE(reassembler.finish().empty());
    EXPECT_EQ(test::readFile(dst_ / "new.txt"), moved);
}

TEST_F(ReassemblerTest, SwappedNamesDoNotClobber) {
    auto a = test::randomBytes(10 * 1024, 11);
    auto b = test::randomBytes(10 * 1024, 12);
    test::writeFile(dst_ / "a", a);
    test::writeFile(dst_ / "b", b);

    SyncManifest baseline = scan(dst_);
    TransferPlan plan;
    plan.renames.push_back({"a", "c"});
    plan.renames.push_back({"b", "a"});

    test::writeFile(src_ / "c", a);
    test::writeFile(src_ / "a", b);
    SyncManifest target = scan(src_);

    Reassembler reassembler(dst_);
    EXPECT_TRUE(reassembler.begin(target, baseline, plan).empty());
    EXPECT_TRUE(reassembler.finish().empty());
    EXPECT_EQ(test::readFile(dst_ / "c"), a);
    EXPECT_EQ(test::readFile(dst_ / "a"), b);
}

TEST_F(ReassemblerTest, DeletesCanBeDisabled) {
    test::writeFile(dst_ / "precious", std::string("keep me"));
    SyncManifest baseline = scan(dst_);
    TransferPlan plan = DeltaPlanner(PlanOptions{true}).plan(baseline, scan(src_));
    ASSERT_EQ(plan.deletes.size(), 1u);

    Reassembler reassembler(dst_, ReassemblerOptions{false});
    reassembler.begin(scan(src_), baseline, plan);
    EXPECT_TRUE(reassembler.finish().empty());
    EXPECT_TRUE(fs::exists(dst_ / "precious"));
}

TEST_F(ReassemblerTest, RejectsPlansThatDisagreeWithTarget) {
    test::writeFile(src_ / "f", std::string("data"));
    SyncManifest target = scan(src_);
    Reassembler reassembler(dst_);

    TransferPlan unknownFile;
    unknownFile.filesToAssemble.push_back("ghost");
    EXPECT_THROW(reassembler.begin(target, SyncManifest::empty(), unknownFile), ProtocolError);

    TransferPlan deletesTarget;
    deletesTarget.deletes.push_back("f");
    EXPECT_THROW(reassembler.begin(target, SyncManifest::empty(), deletesTarget), ProtocolError);

    TransferPlan foreignChunk;
    foreignChunk.chunksToSend.push_back({Crypto::sha256(test::randomBytes(4, 1)), 4, "f", 0});
    EXPECT_THROW(reassembler.begin(target, SyncManifest::empty(), foreignChunk), ProtocolError);
}

TEST_F(ReassemblerTest, TempPathSitsBesideFinalPath) {
    FileManifest file;
    file.path = "sub/report.pdf";
    file.digest = Crypto::sha256(test::randomBytes(4, 2));

    fs::path temp = Reassembler::tempPathFor(dst_, file);
    EXPECT_EQ(temp.parent_path(), dst_ / "sub");
    EXPECT_EQ(temp.filename().string(), ".report.pdf." + file.digest.shortHex() + config::TEMP_FILE_SUFFIX);
}

TEST(ReassemblerOptionsTest, ReadsAllowDeletes) {
    Config config;
    EXPECT_TRUE(ReassemblerOptions::fromConfig(config).allowDeletes);
    config.setBool("sync.allow_deletes", false);
    EXPECT_FALSE(ReassemblerOptions::fromConfig(config).allowDeletes);
}
