/**
 * @file test_job_store.cpp
 * @brief SQLite job persistence across store instances
 */

#include <gtest/gtest.h>

#include "Crypto.h"
#include "Exceptions.h"
#include "JobStore.h"
#include "TestUtils.h"

#include <algorithm>

using namespace GlobalSend;

class JobStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<test::TempDir>("gs_jobstore");
        dbPath_ = (dir_->path() / "jobs.db").string();
        planDigest_ = Crypto::sha256(test::randomBytes(16, 1));
        for (uint64_t i = 0; i < 4; ++i) {
            ids_.push_back(Crypto::sha256(test::randomBytes(16, 100 + i)));
        }
    }

    void TearDown() override {
        dir_.reset();
    }

    std::unique_ptr<test::TempDir> dir_;
    std::string dbPath_;
    Digest256 planDigest_;
    std::vector<ChunkId> ids_;
};

TEST_F(JobStoreTest, CreateThenLoad) {
    JobStore store(dbPath_);
    TransferJob created = store.openOrCreate("job-1", planDigest_);
    EXPECT_EQ(created.state, JobState::Planning);
    EXPECT_TRUE(created.completedChunks.empty());
    EXPECT_GT(created.createdAt, 0);

    auto loaded = store.load("job-1");
    ASSERT_TRUE(loaded.isOk());
    EXPECT_EQ(loaded.value().planDigest, planDigest_);
    EXPECT_EQ(loaded.value().state, JobState::Planning);
}

TEST_F(JobStoreTest, MissingJobIsReported) {
    JobStore store(dbPath_);
    auto missing = store.load("nope");
    ASSERT_TRUE(missing.isError());
    EXPECT_EQ(missing.error().code, ErrorCode::JOB_NOT_FOUND);

    auto marked = store.markCompleted("nope", ids_, 10);
    ASSERT_TRUE(marked.isError());
    EXPECT_EQ(marked.error().code, ErrorCode::JOB_NOT_FOUND);

    auto updated = store.updateState("nope", JobState::Paused);
    ASSERT_TRUE(updated.isError());
    EXPECT_EQ(updated.error().code, ErrorCode::JOB_NOT_FOUND);

    EXPECT_TRUE(store.remove("nope").isOk());
}

TEST_F(JobStoreTest, ProgressSurvivesReopen) {
    {
        JobStore store(dbPath_);
        store.openOrCreate("job-1", planDigest_);
        ASSERT_TRUE(store.markCompleted("job-1", {ids_[0], ids_[1]}, 300).isOk());
        ASSERT_TRUE(store.markCompleted("job-1", {ids_[2]}, 100).isOk());
        ASSERT_TRUE(store.updateState("job-1", JobState::Paused).isOk());
    }

    JobStore reopened(dbPath_);
    TransferJob job = reopened.openOrCreate("job-1", planDigest_);
    EXPECT_EQ(job.state, JobState::Paused);
    EXPECT_EQ(job.completedChunks.size(), 3u);
    EXPECT_TRUE(job.isCompleted(ids_[0]));
    EXPECT_TRUE(job.isCompleted(ids_[2]));
    EXPECT_FALSE(job.isCompleted(ids_[3]));
    EXPECT_EQ(job.bytesTransferred, 400u);
}

TEST_F(JobStoreTest, MarkingTwiceIsIdempotentForChunks) {
    JobStore store(dbPath_);
    store.openOrCreate("job-1", planDigest_);
    ASSERT_TRUE(store.markCompleted("job-1", {ids_[0]}, 50).isOk());
    ASSERT_TRUE(store.markCompleted("job-1", {ids_[0]}, 0).isOk());

    auto job = store.load("job-1");
    ASSERT_TRUE(job.isOk());
    EXPECT_EQ(job.value().completedChunks.size(), 1u);
    EXPECT_EQ(job.value().bytesTransferred, 50u);
}

TEST_F(JobStoreTest, UnmarkForgetsChunks) {
    JobStore store(dbPath_);
    store.openOrCreate("job-1", planDigest_);
    ASSERT_TRUE(store.markCompleted("job-1", ids_, 0).isOk());
    ASSERT_TRUE(store.unmarkCompleted("job-1", {ids_[1], ids_[3]}).isOk());

    auto job = store.load("job-1");
    ASSERT_TRUE(job.isOk());
    EXPECT_EQ(job.value().completedChunks.size(), 2u);
    EXPECT_FALSE(job.value().isCompleted(ids_[1]));
    EXPECT_TRUE(job.value().isCompleted(ids_[2]));
}

TEST_F(JobStoreTest, DifferentPlanDigestIsMismatch) {
    JobStore store(dbPath_);
    store.openOrCreate("job-1", planDigest_);
    Digest256 other = Crypto::sha256(test::randomBytes(16, 2));

    EXPECT_THROW(store.openOrCreate("job-1", other), PlanMismatchError);

    // Recreating after removal is the recovery path.
    ASSERT_TRUE(store.remove("job-1").isOk());
    TransferJob fresh = store.openOrCreate("job-1", other);
    EXPECT_EQ(fresh.planDigest, other);
}

TEST_F(JobStoreTest, RemoveDropsChunkRecords) {
    JobStore store(dbPath_);
    store.openOrCreate("job-1", planDigest_);
    store.openOrCreate("job-2", planDigest_);
    ASSERT_TRUE(store.markCompleted("job-1", ids_, 0).isOk());

    ASSERT_TRUE(store.remove("job-1").isOk());
    EXPECT_TRUE(store.load("job-1").isError());

    auto jobs = store.listJobs();
    EXPECT_EQ(jobs, std::vector<std::string>{"job-2"});

    TransferJob again = store.openOrCreate("job-1", planDigest_);
    EXPECT_TRUE(again.completedChunks.empty());
}

TEST_F(JobStoreTest, InMemoryStoreWorks) {
    JobStore store(":memory:");
    store.openOrCreate("job", planDigest_);
    ASSERT_TRUE(store.updateState("job", JobState::Transferring).isOk());
    EXPECT_EQ(store.load("job").value().state, JobState::Transferring);
}

TEST_F(JobStoreTest, UnopenableDatabaseThrows) {
    const std::string badPath = (dir_->path() / "missing-dir" / "jobs.db").string();
    EXPECT_THROW({ JobStore store(badPath); }, GlobalSendError);
}
