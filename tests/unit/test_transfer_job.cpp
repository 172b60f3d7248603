/**
 * @file test_transfer_job.cpp
 * @brief Job lifecycle state machine
 */

#include <gtest/gtest.h>

#include "TransferJob.h"

using namespace GlobalSend;

TEST(JobStateMachineTest, HappyPathReachesCommitted) {
    JobStateMachine machine;
    EXPECT_EQ(machine.state(), JobState::Planning);
    EXPECT_EQ(machine.apply(JobEvent::PlanAccepted), JobState::Transferring);
    EXPECT_EQ(machine.apply(JobEvent::ChunksDelivered), JobState::Verifying);
    EXPECT_EQ(machine.apply(JobEvent::CommitSucceeded), JobState::Committed);
    EXPECT_TRUE(machine.isTerminal());
}

TEST(JobStateMachineTest, RequeueLoopsBackToTransferring) {
    JobStateMachine machine(JobState::Verifying);
    EXPECT_EQ(machine.apply(JobEvent::CommitRequeued), JobState::Transferring);
    EXPECT_EQ(machine.apply(JobEvent::ChunksDelivered), JobState::Verifying);
    EXPECT_FALSE(machine.isTerminal());
}

TEST(JobStateMachineTest, ChannelLossPausesAndResumeReplans) {
    for (JobState from : {JobState::Planning, JobState::Transferring, JobState::Verifying}) {
        JobStateMachine machine(from);
        EXPECT_EQ(machine.apply(JobEvent::ChannelLost), JobState::Paused) << jobStateName(from);
        EXPECT_EQ(machine.apply(JobEvent::Resumed), JobState::Planning);
    }
}

TEST(JobStateMachineTest, CancelAndFailureAbortFromAnyLiveState) {
    for (JobState from : {JobState::Planning, JobState::Transferring, JobState::Verifying, JobState::Paused}) {
        EXPECT_EQ(JobStateMachine::transition(from, JobEvent::Cancelled), JobState::Aborted);
        EXPECT_EQ(JobStateMachine::transition(from, JobEvent::Failed), JobState::Aborted);
    }
}

TEST(JobStateMachineTest, TerminalStatesRejectEverything) {
    for (JobState from : {JobState::Committed, JobState::Aborted}) {
        for (JobEvent event : {JobEvent::PlanAccepted, JobEvent::Resumed, JobEvent::Cancelled, JobEvent::Failed}) {
            EXPECT_FALSE(JobStateMachine::transition(from, event).has_value());
        }
    }
    JobStateMachine machine(JobState::Committed);
    EXPECT_THROW(machine.apply(JobEvent::Cancelled), std::logic_error);
}

TEST(JobStateMachineTest, OutOfOrderEventsThrow) {
    JobStateMachine planning;
    EXPECT_THROW(planning.apply(JobEvent::ChunksDelivered), std::logic_error);
    EXPECT_THROW(planning.apply(JobEvent::CommitSucceeded), std::logic_error);
    EXPECT_EQ(planning.state(), JobState::Planning);

    JobStateMachine paused(JobState::Paused);
    EXPECT_THROW(paused.apply(JobEvent::PlanAccepted), std::logic_error);
    EXPECT_THROW(paused.apply(JobEvent::ChannelLost), std::logic_error);
}

TEST(JobStateNamesTest, NamesParseBack) {
    for (JobState state : {JobState::Planning, JobState::Transferring, JobState::Verifying,
                           JobState::Committed, JobState::Aborted, JobState::Paused}) {
        auto parsed = jobStateFromName(jobStateName(state));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, state);
    }
    EXPECT_FALSE(jobStateFromName("Running").has_value());
    EXPECT_STREQ(jobEventName(JobEvent::CommitRequeued), "commit-requeued");
}
