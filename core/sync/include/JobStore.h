#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "Result.h"
#include "TransferJob.h"

struct sqlite3;

namespace GlobalSend {

/**
 * @brief SQLite-backed store of resumable transfer jobs.
 *
 * Schema:
 *   jobs(job_id PK, plan_digest, state, bytes_transferred, created_at, updated_at)
 *   job_chunks(job_id, chunk_id, PRIMARY KEY(job_id, chunk_id))
 *
 * Every mutation runs in its own transaction, so a crash leaves either
 * the old or the new record. The database runs in WAL mode with
 * synchronous=FULL. All methods are thread-safe.
 */
class JobStore {
public:
    /**
     * @param dbPath File to open or create; ":memory:" gives a private in-memory store
     * @throws GlobalSendError (STORAGE_ERROR) if the database cannot be opened or initialized
     */
    explicit JobStore(const std::string& dbPath);
    ~JobStore();

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    /**
     * @brief Load a job with its completed chunk set.
     * @return JOB_NOT_FOUND error if there is no such job
     */
    Result<TransferJob> load(const std::string& jobId) const;

    /**
     * @brief Fetch the job for a resume, or create it in Planning state.
     * @throws PlanMismatchError if a record exists under a different plan digest
     * @throws GlobalSendError (STORAGE_ERROR) on database failure
     */
    TransferJob openOrCreate(const std::string& jobId, const Digest256& planDigest);

    /// Record chunks the receiver verified; bytes are added to the running total.
    VoidResult markCompleted(const std::string& jobId, const std::vector<ChunkId>& chunkIds, uint64_t bytes);

    /// Forget completion of chunks the receiver could not commit.
    VoidResult unmarkCompleted(const std::string& jobId, const std::vector<ChunkId>& chunkIds);

    VoidResult updateState(const std::string& jobId, JobState state);

    /// Delete the job and its chunk records. Removing a missing job is not an error.
    VoidResult remove(const std::string& jobId);

    std::vector<std::string> listJobs() const;

private:
    void initialize();
    bool exec(const char* sql);
    bool jobExists(const std::string& jobId) const;
    Error storageError(const std::string& what) const;

    sqlite3* db_{nullptr};
    std::string dbPath_;
    mutable std::mutex mutex_;
};

} // namespace GlobalSend
