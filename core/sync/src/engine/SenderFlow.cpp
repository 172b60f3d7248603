#include "TransferEngine.h"

#include "Constants.h"
#include "Crypto.h"
#include "Exceptions.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"

#include <algorithm>
#include <deque>
#include <future>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace GlobalSend {

struct TransferEngine::SendState {
    SendState(const SyncManifest& t, const IChunkSource& s, JobStore& j, const PlanOptions& p)
        : target(t), source(s), jobs(j), planOptions(p) {}

    const SyncManifest& target;
    const IChunkSource& source;
    JobStore& jobs;
    PlanOptions planOptions;

    std::string jobId;
    std::optional<JobStateMachine> machine;
    std::unordered_map<ChunkId, ChunkRef> index;    ///< every target chunk, first occurrence
    TransferResult result;
};

namespace {

TransferJob openJob(JobStore& jobs, const std::string& jobId, const Digest256& planDigest) {
    try {
        return jobs.openOrCreate(jobId, planDigest);
    } catch (const PlanMismatchError& e) {
        Logger::instance().warn(std::string(e.what()) + "; discarding stale job and replanning", "TransferEngine");
        jobs.remove(jobId).orThrow();
        return jobs.openOrCreate(jobId, planDigest);
    }
}

} // namespace

TransferResult TransferEngine::send(const SyncManifest& target, const IChunkSource& source, JobStore& jobs,
                                    const PlanOptions& planOptions) {
    SendState state(target, source, jobs, planOptions);
    try {
        runSender(state);
    } catch (const ChannelInterrupted& e) {
        Logger::instance().warn(std::string("Channel lost, pausing job: ") + e.what(), "TransferEngine");
        recordJobState(state, JobState::Paused);
        state.result.status = TransferStatus::Interrupted;
    } catch (const SessionAbortedError& e) {
        if (e.peerCode() != ErrorCode::CANCELLED) {
            handleFatal(e);
            recordJobState(state, JobState::Aborted);
            MetricsCollector::instance().incrementTransfersFailed();
            throw;
        }
        Logger::instance().info("Receiver cancelled the transfer; job kept for resume", "TransferEngine");
        recordJobState(state, JobState::Paused);
        state.result.status = TransferStatus::Cancelled;
    } catch (const GlobalSendError& e) {
        handleFatal(e);
        recordJobState(state, JobState::Aborted);
        MetricsCollector::instance().incrementTransfersFailed();
        throw;
    }
    return state.result;
}

void TransferEngine::recordJobState(SendState& state, JobState jobState) {
    if (state.jobId.empty()) {
        return;
    }
    if (state.machine && !state.machine->isTerminal()) {
        const JobEvent event = jobState == JobState::Paused ? JobEvent::ChannelLost : JobEvent::Failed;
        if (JobStateMachine::transition(state.machine->state(), event)) {
            state.machine->apply(event);
        }
    }
    auto updated = state.jobs.updateState(state.jobId, jobState);
    if (updated.isError()) {
        Logger::instance().error("Cannot persist job state: " + updated.error().toString(), "TransferEngine");
    }
}

void TransferEngine::cancelJob(SendState& state) {
    Logger::instance().info("Transfer cancelled, discarding job " + state.jobId.substr(0, 16), "TransferEngine");
    sendAbortQuietly(ErrorCode::CANCELLED, "cancelled by sender");
    state.machine->apply(JobEvent::Cancelled);
    state.jobs.remove(state.jobId).orThrow();
    state.result.status = TransferStatus::Cancelled;
}

void TransferEngine::runSender(SendState& state) {
    TransferResult& result = state.result;

    sendControl(SyncProtocol::encodeOffer({config::PROTOCOL_VERSION, state.target}));
    const SyncManifest baseline = SyncProtocol::decodeBaseline(receiveControl());

    const TransferPlan plan = DeltaPlanner(state.planOptions).plan(baseline, state.target);
    state.jobId = DeltaPlanner::jobIdFor(baseline, state.target);
    result.jobId = state.jobId;

    TransferJob job = openJob(state.jobs, state.jobId, plan.digest());
    const bool interrupted = job.state == JobState::Paused || job.state == JobState::Transferring ||
                             job.state == JobState::Verifying;
    state.machine.emplace(interrupted ? JobState::Paused : JobState::Planning);
    if (interrupted) {
        state.machine->apply(JobEvent::Resumed);
        result.resumed = true;
        MetricsCollector::instance().incrementTransfersResumed();
    }

    sendControl(SyncProtocol::encodePlan({state.jobId, plan}));
    const ReadyMessage ready = SyncProtocol::decodeReady(receiveControl());

    for (const auto& entry : state.target.files()) {
        for (const auto& chunk : entry.second.chunks) {
            state.index.emplace(chunk.id, ChunkRef{chunk.id, chunk.size, entry.first, chunk.offset});
        }
    }

    // The receiver's disk is the truth: forget deliveries it cannot confirm,
    // record the ones it already holds.
    std::vector<ChunkId> stale;
    for (const auto& id : ready.need) {
        if (state.index.count(id) == 0) {
            throw ProtocolError("Receiver asked for unknown chunk " + id.shortHex());
        }
        if (job.isCompleted(id)) {
            stale.push_back(id);
        }
    }
    std::vector<ChunkId> present;
    size_t reused = 0;
    for (const auto& id : ready.have) {
        if (job.isCompleted(id)) {
            ++reused;
        } else {
            present.push_back(id);
        }
    }
    state.jobs.unmarkCompleted(state.jobId, stale).orThrow();
    state.jobs.markCompleted(state.jobId, present, 0).orThrow();
    if (result.resumed) {
        LOG_INFO_COMP_IF("Resuming job " + state.jobId.substr(0, 16) + ": " + std::to_string(reused) +
                         " chunks already delivered, " + std::to_string(ready.need.size()) + " to go",
                         "TransferEngine");
    }

    state.machine->apply(JobEvent::PlanAccepted);
    state.jobs.updateState(state.jobId, state.machine->state()).orThrow();

    std::deque<ChunkId> queue(ready.need.begin(), ready.need.end());
    std::unordered_map<ChunkId, size_t> failures;

    while (true) {
        while (!queue.empty()) {
            if (cancelled_) {
                cancelJob(state);
                return;
            }

            const size_t count = std::min(options_.batchSize, queue.size());
            std::vector<ChunkId> batch(queue.begin(), queue.begin() + static_cast<std::ptrdiff_t>(count));
            queue.erase(queue.begin(), queue.begin() + static_cast<std::ptrdiff_t>(count));

            sendControl(SyncProtocol::encodeBatch(batch));
            if (!sendChunks(state, batch)) {
                cancelJob(state);
                return;
            }

            const BatchResultMessage reply = SyncProtocol::decodeBatchResult(receiveControl());
            std::unordered_set<ChunkId> outstanding(batch.begin(), batch.end());
            for (const auto* ids : {&reply.verified, &reply.failed}) {
                for (const auto& id : *ids) {
                    if (outstanding.erase(id) == 0) {
                        throw ProtocolError("BATCH_RESULT lists chunk " + id.shortHex() + " twice or out of batch");
                    }
                }
            }
            if (!outstanding.empty()) {
                throw ProtocolError("BATCH_RESULT does not account for every chunk of the batch");
            }

            uint64_t bytes = 0;
            for (const auto& id : reply.verified) {
                bytes += state.index.at(id).size;
            }
            state.jobs.markCompleted(state.jobId, reply.verified, bytes).orThrow();

            for (const auto& id : reply.failed) {
                ++result.integrityFailures;
                if (++failures[id] > options_.maxRounds) {
                    throw ChunkIntegrityError("Chunk " + id.shortHex() + " failed verification " +
                                              std::to_string(failures[id]) + " times");
                }
                Logger::instance().warn("Receiver rejected chunk " + id.shortHex() + ", resending", "TransferEngine");
                queue.push_back(id);
            }
        }

        state.machine->apply(JobEvent::ChunksDelivered);
        state.jobs.updateState(state.jobId, state.machine->state()).orThrow();

        sendControl(SyncProtocol::encodeDone());
        const std::vector<ChunkId> requeued = SyncProtocol::decodeComplete(receiveControl());
        ++result.rounds;

        if (requeued.empty()) {
            state.machine->apply(JobEvent::CommitSucceeded);
            state.jobs.remove(state.jobId).orThrow();
            MetricsCollector::instance().incrementTransfersCompleted();
            LOG_INFO_COMP_IF("Transfer complete: " + std::to_string(result.chunksSent) + " chunks, " +
                             std::to_string(result.bytesSent) + " bytes in " + std::to_string(result.rounds) +
                             " rounds", "TransferEngine");
            result.status = TransferStatus::Completed;
            return;
        }

        if (result.rounds >= options_.maxRounds) {
            throw CommitVerificationError("Receiver still re-queues " + std::to_string(requeued.size()) +
                                          " chunks after " + std::to_string(result.rounds) + " rounds");
        }
        for (const auto& id : requeued) {
            if (state.index.count(id) == 0) {
                throw ProtocolError("Receiver re-queued unknown chunk " + id.shortHex());
            }
        }

        Logger::instance().warn("Receiver re-queued " + std::to_string(requeued.size()) + " chunks", "TransferEngine");
        state.jobs.unmarkCompleted(state.jobId, requeued).orThrow();
        state.machine->apply(JobEvent::CommitRequeued);
        state.jobs.updateState(state.jobId, state.machine->state()).orThrow();
        queue.assign(requeued.begin(), requeued.end());
    }
}

bool TransferEngine::sendChunks(SendState& state, const std::vector<ChunkId>& batch) {
    std::deque<std::future<std::vector<uint8_t>>> inflight;
    size_t scheduled = 0;
    auto& metrics = MetricsCollector::instance();

    auto drain = [&inflight]() {
        for (auto& pending : inflight) {
            pending.wait();
        }
        inflight.clear();
    };

    try {
        for (size_t i = 0; i < batch.size(); ++i) {
            if (cancelled_) {
                drain();
                return false;
            }

            while (inflight.size() < options_.window && scheduled < batch.size()) {
                const ChunkRef ref = state.index.at(batch[scheduled++]);
                const IChunkSource& source = state.source;
                inflight.push_back(pool_.enqueue([&source, ref]() {
                    std::vector<uint8_t> data;
                    try {
                        data = source.read(ref);
                    } catch (const std::runtime_error& e) {
                        throw GlobalSendError(ErrorCode::IO_ERROR, e.what());
                    }
                    if (Crypto::sha256(data) != ref.id) {
                        throw SourceChangedError(ref.path + " changed since it was scanned (chunk at offset " +
                                                 std::to_string(ref.offset) + ")");
                    }
                    return data;
                }));
            }

            auto next = std::move(inflight.front());
            inflight.pop_front();
            std::vector<uint8_t> data = next.get();

            sendMessage(batch[i], SyncProtocol::encodeChunk(data));
            ++state.result.chunksSent;
            state.result.bytesSent += data.size();
            metrics.incrementChunksSent();
            metrics.addBytesSent(data.size());
        }
    } catch (const std::exception&) {
        drain();
        throw;
    }
    return true;
}

} // namespace GlobalSend
