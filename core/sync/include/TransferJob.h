#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>

#include "Digest.h"

namespace GlobalSend {

enum class JobState {
    Planning,
    Transferring,
    Verifying,
    Committed,
    Aborted,
    Paused
};

enum class JobEvent {
    PlanAccepted,       ///< receiver answered READY
    ChunksDelivered,    ///< DONE sent / received
    CommitRequeued,     ///< commit left chunks to resend
    CommitSucceeded,
    ChannelLost,
    Resumed,
    Cancelled,
    Failed
};

const char* jobStateName(JobState state);
std::optional<JobState> jobStateFromName(const std::string& name);
const char* jobEventName(JobEvent event);

/**
 * @brief Lifecycle of one transfer job.
 *
 *   Planning -> Transferring -> Verifying -> Committed
 *                    ^              |
 *                    +--requeue-----+
 *   Planning/Transferring/Verifying -> Paused (channel lost) -> Planning (resumed)
 *   any non-terminal state -> Aborted (cancel or fatal error)
 *
 * Committed and Aborted are terminal.
 */
class JobStateMachine {
public:
    explicit JobStateMachine(JobState initial = JobState::Planning) : state_(initial) {}

    /**
     * @brief Apply an event.
     * @throws std::logic_error if the event is not valid in the current state
     */
    JobState apply(JobEvent event);

    JobState state() const { return state_; }
    bool isTerminal() const { return state_ == JobState::Committed || state_ == JobState::Aborted; }

    /// Target state for (from, event), or nullopt if the transition is not allowed.
    static std::optional<JobState> transition(JobState from, JobEvent event);

private:
    JobState state_;
};

/**
 * @brief Persistent record of a resumable transfer, keyed by job id.
 */
struct TransferJob {
    std::string jobId;
    Digest256 planDigest;
    JobState state{JobState::Planning};
    std::unordered_set<ChunkId> completedChunks;
    uint64_t bytesTransferred{0};
    int64_t createdAt{0};
    int64_t updatedAt{0};

    bool isCompleted(const ChunkId& id) const { return completedChunks.count(id) != 0; }
};

} // namespace GlobalSend
