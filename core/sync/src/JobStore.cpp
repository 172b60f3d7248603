#include "JobStore.h"

#include "Exceptions.h"
#include "Logger.h"
#include "LoggerMacros.h"

#include <chrono>
#include <sqlite3.h>

namespace GlobalSend {

namespace {

int64_t nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

// Rolls back unless commit() succeeded.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        active_ = sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) == SQLITE_OK;
    }

    ~Transaction() {
        if (active_) {
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    bool active() const { return active_; }

    bool commit() {
        if (!active_) {
            return false;
        }
        if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            return false;
        }
        active_ = false;
        return true;
    }

private:
    sqlite3* db_;
    bool active_{false};
};

} // namespace

JobStore::JobStore(const std::string& dbPath) : dbPath_(dbPath) {
    if (sqlite3_open_v2(dbPath.c_str(), &db_,
                        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                        nullptr) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw GlobalSendError(ErrorCode::STORAGE_ERROR, "Cannot open job store " + dbPath + ": " + message);
    }
    initialize();
}

JobStore::~JobStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool JobStore::exec(const char* sql) {
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg) != SQLITE_OK) {
        Logger::instance().error(std::string("SQL error: ") + (errMsg ? errMsg : "unknown"), "JobStore");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

void JobStore::initialize() {
    const char* schema =
        "CREATE TABLE IF NOT EXISTS jobs ("
        "  job_id TEXT PRIMARY KEY,"
        "  plan_digest TEXT NOT NULL,"
        "  state TEXT NOT NULL,"
        "  bytes_transferred INTEGER NOT NULL DEFAULT 0,"
        "  created_at INTEGER NOT NULL,"
        "  updated_at INTEGER NOT NULL"
        ");"
        "CREATE TABLE IF NOT EXISTS job_chunks ("
        "  job_id TEXT NOT NULL,"
        "  chunk_id TEXT NOT NULL,"
        "  PRIMARY KEY (job_id, chunk_id)"
        ");";

    // WAL is unavailable for in-memory databases; the pragma is then a no-op.
    if (!exec("PRAGMA journal_mode=WAL;") || !exec("PRAGMA synchronous=FULL;") || !exec(schema)) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw GlobalSendError(ErrorCode::STORAGE_ERROR, "Cannot initialize job store " + dbPath_);
    }
    LOG_DEBUG_COMP_IF("Job store ready at " + dbPath_, "JobStore");
}

Error JobStore::storageError(const std::string& what) const {
    return Error(what + ": " + sqlite3_errmsg(db_), ErrorCode::STORAGE_ERROR, "JobStore");
}

bool JobStore::jobExists(const std::string& jobId) const {
    const char* sql = "SELECT 1 FROM jobs WHERE job_id = ?;";
    sqlite3_stmt* stmt;
    bool found = false;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, jobId.c_str(), -1, SQLITE_TRANSIENT);
        found = sqlite3_step(stmt) == SQLITE_ROW;
        sqlite3_finalize(stmt);
    }
    return found;
}

Result<TransferJob> JobStore::load(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);

    TransferJob job;
    const char* sql =
        "SELECT plan_digest, state, bytes_transferred, created_at, updated_at FROM jobs WHERE job_id = ?;";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return storageError("Failed to prepare job query");
    }
    sqlite3_bind_text(stmt, 1, jobId.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        if (rc == SQLITE_DONE) {
            return Error("No job " + jobId, ErrorCode::JOB_NOT_FOUND, "JobStore");
        }
        return storageError("Failed to read job " + jobId);
    }

    job.jobId = jobId;
    auto digest = Digest256::fromHex(columnText(stmt, 0));
    auto state = jobStateFromName(columnText(stmt, 1));
    job.bytesTransferred = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
    job.createdAt = sqlite3_column_int64(stmt, 3);
    job.updatedAt = sqlite3_column_int64(stmt, 4);
    sqlite3_finalize(stmt);

    if (!digest || !state) {
        return Error("Corrupt job record " + jobId, ErrorCode::STORAGE_ERROR, "JobStore");
    }
    job.planDigest = *digest;
    job.state = *state;

    const char* chunkSql = "SELECT chunk_id FROM job_chunks WHERE job_id = ?;";
    if (sqlite3_prepare_v2(db_, chunkSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return storageError("Failed to prepare chunk query");
    }
    sqlite3_bind_text(stmt, 1, jobId.c_str(), -1, SQLITE_TRANSIENT);
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto id = Digest256::fromHex(columnText(stmt, 0));
        if (id) {
            job.completedChunks.insert(*id);
        }
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return storageError("Failed to read chunks of job " + jobId);
    }
    return job;
}

TransferJob JobStore::openOrCreate(const std::string& jobId, const Digest256& planDigest) {
    auto existing = load(jobId);
    if (existing.isOk()) {
        if (existing.value().planDigest != planDigest) {
            throw PlanMismatchError("Job " + jobId.substr(0, 16) + " was recorded for plan " +
                                    existing.value().planDigest.shortHex() + ", not " + planDigest.shortHex());
        }
        return existing.value();
    }
    if (existing.error().code != ErrorCode::JOB_NOT_FOUND) {
        throw GlobalSendError(ErrorCode::STORAGE_ERROR, existing.error().toString());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    TransferJob job;
    job.jobId = jobId;
    job.planDigest = planDigest;
    job.state = JobState::Planning;
    job.createdAt = nowSeconds();
    job.updatedAt = job.createdAt;

    const char* sql =
        "INSERT INTO jobs (job_id, plan_digest, state, bytes_transferred, created_at, updated_at) "
        "VALUES (?, ?, ?, 0, ?, ?);";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw GlobalSendError(ErrorCode::STORAGE_ERROR, storageError("Failed to prepare insert").toString());
    }
    sqlite3_bind_text(stmt, 1, jobId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, planDigest.toHex().c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, jobStateName(job.state), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, job.createdAt);
    sqlite3_bind_int64(stmt, 5, job.updatedAt);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw GlobalSendError(ErrorCode::STORAGE_ERROR, storageError("Failed to create job " + jobId).toString());
    }

    LOG_DEBUG_COMP_IF("Created job " + jobId.substr(0, 16), "JobStore");
    return job;
}

VoidResult JobStore::markCompleted(const std::string& jobId, const std::vector<ChunkId>& chunkIds, uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!jobExists(jobId)) {
        return Error("No job " + jobId, ErrorCode::JOB_NOT_FOUND, "JobStore");
    }

    Transaction txn(db_);
    if (!txn.active()) {
        return storageError("Failed to begin transaction");
    }

    sqlite3_stmt* stmt;
    const char* insertSql = "INSERT OR IGNORE INTO job_chunks (job_id, chunk_id) VALUES (?, ?);";
    if (sqlite3_prepare_v2(db_, insertSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return storageError("Failed to prepare chunk insert");
    }
    for (const auto& id : chunkIds) {
        sqlite3_bind_text(stmt, 1, jobId.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, id.toHex().c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            sqlite3_finalize(stmt);
            return storageError("Failed to record chunk " + id.shortHex());
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
    sqlite3_finalize(stmt);

    const char* updateSql =
        "UPDATE jobs SET bytes_transferred = bytes_transferred + ?, updated_at = ? WHERE job_id = ?;";
    if (sqlite3_prepare_v2(db_, updateSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return storageError("Failed to prepare job update");
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(bytes));
    sqlite3_bind_int64(stmt, 2, nowSeconds());
    sqlite3_bind_text(stmt, 3, jobId.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return storageError("Failed to update job " + jobId);
    }

    if (!txn.commit()) {
        return storageError("Failed to commit chunk progress");
    }
    return Ok();
}

VoidResult JobStore::unmarkCompleted(const std::string& jobId, const std::vector<ChunkId>& chunkIds) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(db_);
    if (!txn.active()) {
        return storageError("Failed to begin transaction");
    }

    sqlite3_stmt* stmt;
    const char* sql = "DELETE FROM job_chunks WHERE job_id = ? AND chunk_id = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return storageError("Failed to prepare chunk delete");
    }
    for (const auto& id : chunkIds) {
        sqlite3_bind_text(stmt, 1, jobId.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, id.toHex().c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            sqlite3_finalize(stmt);
            return storageError("Failed to forget chunk " + id.shortHex());
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
    sqlite3_finalize(stmt);

    if (!txn.commit()) {
        return storageError("Failed to commit chunk removal");
    }
    return Ok();
}

VoidResult JobStore::updateState(const std::string& jobId, JobState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    const char* sql = "UPDATE jobs SET state = ?, updated_at = ? WHERE job_id = ?;";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return storageError("Failed to prepare state update");
    }
    sqlite3_bind_text(stmt, 1, jobStateName(state), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, nowSeconds());
    sqlite3_bind_text(stmt, 3, jobId.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return storageError("Failed to update state of job " + jobId);
    }
    if (sqlite3_changes(db_) == 0) {
        return Error("No job " + jobId, ErrorCode::JOB_NOT_FOUND, "JobStore");
    }
    return Ok();
}

VoidResult JobStore::remove(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(db_);
    if (!txn.active()) {
        return storageError("Failed to begin transaction");
    }

    const char* statements[] = {
        "DELETE FROM job_chunks WHERE job_id = ?;",
        "DELETE FROM jobs WHERE job_id = ?;"
    };
    for (const char* sql : statements) {
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return storageError("Failed to prepare job delete");
        }
        sqlite3_bind_text(stmt, 1, jobId.c_str(), -1, SQLITE_TRANSIENT);
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return storageError("Failed to delete job " + jobId);
        }
    }

    if (!txn.commit()) {
        return storageError("Failed to commit job removal");
    }
    return Ok();
}

std::vector<std::string> JobStore::listJobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> jobs;
    const char* sql = "SELECT job_id FROM jobs ORDER BY created_at, job_id;";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            jobs.push_back(columnText(stmt, 0));
        }
        sqlite3_finalize(stmt);
    }
    return jobs;
}

} // namespace GlobalSend
