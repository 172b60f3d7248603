#include "TransferJob.h"

#include <stdexcept>

namespace GlobalSend {

const char* jobStateName(JobState state) {
    switch (state) {
        case JobState::Planning: return "planning";
        case JobState::Transferring: return "transferring";
        case JobState::Verifying: return "verifying";
        case JobState::Committed: return "committed";
        case JobState::Aborted: return "aborted";
        case JobState::Paused: return "paused";
    }
    return "unknown";
}

std::optional<JobState> jobStateFromName(const std::string& name) {
    if (name == "planning") return JobState::Planning;
    if (name == "transferring") return JobState::Transferring;
    if (name == "verifying") return JobState::Verifying;
    if (name == "committed") return JobState::Committed;
    if (name == "aborted") return JobState::Aborted;
    if (name == "paused") return JobState::Paused;
    return std::nullopt;
}

const char* jobEventName(JobEvent event) {
    switch (event) {
        case JobEvent::PlanAccepted: return "plan-accepted";
        case JobEvent::ChunksDelivered: return "chunks-delivered";
        case JobEvent::CommitRequeued: return "commit-requeued";
        case JobEvent::CommitSucceeded: return "commit-succeeded";
        case JobEvent::ChannelLost: return "channel-lost";
        case JobEvent::Resumed: return "resumed";
        case JobEvent::Cancelled: return "cancelled";
        case JobEvent::Failed: return "failed";
    }
    return "unknown";
}

std::optional<JobState> JobStateMachine::transition(JobState from, JobEvent event) {
    if (from == JobState::Committed || from == JobState::Aborted) {
        return std::nullopt;
    }
    if (event == JobEvent::Cancelled || event == JobEvent::Failed) {
        return JobState::Aborted;
    }

    switch (from) {
        case JobState::Planning:
            if (event == JobEvent::PlanAccepted) return JobState::Transferring;
            if (event == JobEvent::ChannelLost) return JobState::Paused;
            break;
        case JobState::Transferring:
            if (event == JobEvent::ChunksDelivered) return JobState::Verifying;
            if (event == JobEvent::ChannelLost) return JobState::Paused;
            break;
        case JobState::Verifying:
            if (event == JobEvent::CommitSucceeded) return JobState::Committed;
            if (event == JobEvent::CommitRequeued) return JobState::Transferring;
            if (event == JobEvent::ChannelLost) return JobState::Paused;
            break;
        case JobState::Paused:
            if (event == JobEvent::Resumed) return JobState::Planning;
            break;
        case JobState::Committed:
        case JobState::Aborted:
            break;
    }
    return std::nullopt;
}

JobState JobStateMachine::apply(JobEvent event) {
    auto next = transition(state_, event);
    if (!next) {
        throw std::logic_error(std::string("Invalid job transition: ") + jobEventName(event) +
                               " in state " + jobStateName(state_));
    }
    state_ = *next;
    return state_;
}

} // namespace GlobalSend
