/**
 * @file test_cli.cpp
 * @brief globalsend command-line tool
 */

#include <gtest/gtest.h>

#include "CliApp.h"
#include "DeltaPlanner.h"
#include "JobStore.h"
#include "Logger.h"
#include "ManifestBuilder.h"
#include "TestUtils.h"
#include "Version.h"

#include <json/json.h>

#include <fstream>
#include <sstream>

using namespace GlobalSend;
namespace fs = std::filesystem;

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<test::TempDir>("gs_cli");
        src_ = dir_->path() / "src";
        dst_ = dir_->path() / "dst";
        dbPath_ = (dir_->path() / "jobs.db").string();
        logPath_ = (dir_->path() / "globalsend.log").string();
        fs::create_directories(src_);

        configPath_ = (dir_->path() / "globalsend.conf").string();
        std::ofstream conf(configPath_);
        conf << "chunk.min_size = 16384\n"
             << "chunk.target_size = 65536\n"
             << "chunk.max_size = 262144\n"
             << "jobs.db_path = " << dbPath_ << "\n"
             << "log.level = INFO\n"
             << "log.file = " << logPath_ << "\n";

        Logger::instance().setConsoleOutput(false);
    }

    void TearDown() override {
        Logger::instance().closeLogFile();
        Logger::instance().setLevel(LogLevel::INFO);
        Logger::instance().setConsoleOutput(true);
        dir_.reset();
    }

    int run(const std::vector<std::string>& args) {
        out_.str("");
        err_.str("");
        CliApp app(out_, err_);
        return app.run(args);
    }

    int sync(std::vector<std::string> extra = {}) {
        std::vector<std::string> args{"sync", src_.string(), dst_.string(), "--config", configPath_};
        args.insert(args.end(), extra.begin(), extra.end());
        return run(args);
    }

    SyncManifest scan(const fs::path& root) const {
        return ManifestBuilder(ChunkerParams{16384, 65536, 262144}).scanDirectory(root);
    }

    std::unique_ptr<test::TempDir> dir_;
    fs::path src_;
    fs::path dst_;
    std::string dbPath_;
    std::string logPath_;
    std::string configPath_;
    std::ostringstream out_;
    std::ostringstream err_;
};

// ============================================================================
// Usage
// ============================================================================

TEST_F(CliTest, VersionPrintsProtocolAndFormat) {
    EXPECT_EQ(run({"version"}), 0);
    EXPECT_NE(out_.str().find(std::string("globalsend ") + Version::STRING), std::string::npos);
    EXPECT_NE(out_.str().find("protocol 1"), std::string::npos);
    EXPECT_NE(out_.str().find("manifest format 1"), std::string::npos);
}

TEST_F(CliTest, NoArgumentsPrintsUsage) {
    EXPECT_EQ(run({}), 1);
    EXPECT_NE(err_.str().find("Usage: globalsend"), std::string::npos);
}

TEST_F(CliTest, HelpGoesToStdout) {
    EXPECT_EQ(run({"help"}), 0);
    EXPECT_NE(out_.str().find("Commands:"), std::string::npos);
}

TEST_F(CliTest, UnknownCommandAndOption) {
    EXPECT_EQ(run({"frobnicate"}), 1);
    EXPECT_NE(err_.str().find("Unknown command: frobnicate"), std::string::npos);

    EXPECT_EQ(run({"sync", "a", "b", "--fast"}), 1);
    EXPECT_NE(err_.str().find("--fast"), std::string::npos);

    EXPECT_EQ(run({"sync", "only-one"}), 1);
}

TEST_F(CliTest, MissingConfigFile) {
    EXPECT_EQ(run({"jobs", "--config", (dir_->path() / "absent.conf").string()}), 1);
    EXPECT_NE(err_.str().find("Cannot read config file"), std::string::npos);
}

// ============================================================================
// scan
// ============================================================================

TEST_F(CliTest, ScanPrintsManifestJson) {
    test::writeFile(src_ / "a.txt", std::string("alpha"));
    test::writeFile(src_ / "sub/b.bin", test::randomBytes(100 * 1024, 1));

    ASSERT_EQ(run({"scan", src_.string(), "--config", configPath_}), 0);

    Json::Value root;
    Json::CharReaderBuilder reader;
    std::string errors;
    std::istringstream in(out_.str());
    ASSERT_TRUE(Json::parseFromStream(reader, in, &root, &errors)) << errors;
    EXPECT_NE(out_.str().find("\"sub/b.bin\""), std::string::npos);
    EXPECT_NE(out_.str().find("\"a.txt\""), std::string::npos);
}

TEST_F(CliTest, ScanOfMissingDirectoryFails) {
    EXPECT_EQ(run({"scan", (dir_->path() / "nowhere").string()}), 2);
    EXPECT_NE(err_.str().find("not a directory"), std::string::npos);
}

// ============================================================================
// sync
// ============================================================================

TEST_F(CliTest, SyncCopiesTreeAndLogsToConfiguredFile) {
    test::writeFile(src_ / "a.bin", test::randomBytes(400 * 1024, 2));
    test::writeFile(src_ / "docs/readme.txt", std::string("read me"));

    ASSERT_EQ(sync(), 0) << err_.str();
    EXPECT_NE(out_.str().find("completed"), std::string::npos);
    EXPECT_NE(out_.str().find("2 files committed"), std::string::npos);
    EXPECT_EQ(scan(dst_).digest(), scan(src_).digest());

    EXPECT_TRUE(fs::exists(dbPath_));
    JobStore jobs(dbPath_);
    EXPECT_TRUE(jobs.listJobs().empty());

    Logger::instance().closeLogFile();
    auto log = test::readFile(logPath_);
    EXPECT_NE(std::string(log.begin(), log.end()).find("Transfer complete"), std::string::npos);
}

TEST_F(CliTest, SecondSyncSendsNothing) {
    test::writeFile(src_ / "a.bin", test::randomBytes(200 * 1024, 3));
    ASSERT_EQ(sync(), 0) << err_.str();
    ASSERT_EQ(sync(), 0) << err_.str();
    EXPECT_NE(out_.str().find(": 0 chunks (0 bytes) sent"), std::string::npos) << out_.str();
}

TEST_F(CliTest, MirrorFlagDeletesExtraFiles) {
    test::writeFile(src_ / "keep.txt", std::string("keep"));
    test::writeFile(dst_ / "extra.txt", std::string("extra"));

    ASSERT_EQ(sync(), 0) << err_.str();
    EXPECT_TRUE(fs::exists(dst_ / "extra.txt"));

    ASSERT_EQ(sync({"--mirror"}), 0) << err_.str();
    EXPECT_FALSE(fs::exists(dst_ / "extra.txt"));
    EXPECT_TRUE(fs::exists(dst_ / "keep.txt"));
}

TEST_F(CliTest, SyncRejectsBadChunkSizes) {
    std::ofstream conf(configPath_, std::ios::app);
    conf << "chunk.min_size = 10\n";
    conf.close();

    test::writeFile(src_ / "a.txt", std::string("x"));
    EXPECT_EQ(sync(), 2);
    EXPECT_NE(err_.str().find("Invalid configuration"), std::string::npos) << err_.str();
}

TEST_F(CliTest, SyncOfMissingSourceFails) {
    fs::remove_all(src_);
    EXPECT_EQ(sync(), 2);
    EXPECT_NE(err_.str().find("not a directory"), std::string::npos);
}

TEST_F(CliTest, SyncLocalReportsReceiverSide) {
    test::writeFile(src_ / "one.bin", test::randomBytes(150 * 1024, 4));
    Config config;
    ASSERT_TRUE(config.loadFromFile(configPath_));

    TransferResult result = CliApp::syncLocal(src_, dst_, config);

    EXPECT_EQ(result.status, TransferStatus::Completed);
    EXPECT_EQ(result.filesCommitted, 1u);
    EXPECT_EQ(result.chunksReceived, result.chunksSent);
    EXPECT_EQ(result.bytesReceived, 150u * 1024);
}

// ============================================================================
// jobs
// ============================================================================

TEST_F(CliTest, JobsWithNothingPending) {
    EXPECT_EQ(run({"jobs", "--config", configPath_}), 0);
    EXPECT_NE(out_.str().find("No resumable jobs"), std::string::npos);
}

TEST_F(CliTest, JobsListsPausedTransfer) {
    test::writeFile(src_ / "a.bin", test::randomBytes(100 * 1024, 5));
    const SyncManifest target = scan(src_);
    const SyncManifest baseline;
    const std::string jobId = DeltaPlanner::jobIdFor(baseline, target);
    {
        JobStore jobs(dbPath_);
        jobs.openOrCreate(jobId, DeltaPlanner().plan(baseline, target).digest());
        ASSERT_TRUE(jobs.updateState(jobId, JobState::Paused).isOk());
    }

    EXPECT_EQ(run({"jobs", "--config", configPath_}), 0);
    EXPECT_NE(out_.str().find(jobId.substr(0, 16)), std::string::npos);
    EXPECT_NE(out_.str().find("paused"), std::string::npos);
}
