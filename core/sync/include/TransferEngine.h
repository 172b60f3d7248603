#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "Channel.h"
#include "ChunkSource.h"
#include "Config.h"
#include "DeltaPlanner.h"
#include "Frame.h"
#include "JobStore.h"
#include "Reassembler.h"
#include "Result.h"
#include "SessionCrypto.h"
#include "SyncProtocol.h"
#include "ThreadPool.h"

namespace GlobalSend {

struct EngineOptions {
    size_t window{8};          ///< chunk reads / verify+writes in flight per session
    size_t batchSize{32};      ///< chunks announced per BATCH
    size_t maxRounds{5};       ///< DONE/COMPLETE rounds and per-chunk retries before giving up
    size_t workerThreads{4};

    VoidResult validate() const;
    static Result<EngineOptions> fromConfig(const Config& config);
};

enum class TransferStatus {
    Completed,
    Cancelled,
    Interrupted     ///< channel lost; job state kept for a resume
};

const char* transferStatusName(TransferStatus status);

struct TransferResult {
    TransferStatus status{TransferStatus::Completed};
    std::string jobId;
    uint64_t chunksSent{0};
    uint64_t bytesSent{0};
    uint64_t chunksReceived{0};
    uint64_t bytesReceived{0};
    uint64_t integrityFailures{0};
    size_t filesCommitted{0};
    size_t rounds{0};
    bool resumed{false};
};

/**
 * @brief One session's end of a transfer.
 *
 * Owns the session's key material and frame counters, its worker pool and
 * its view of the channel. Each engine runs at most one send() or
 * receive() at a time; cancel() may be called from any thread and takes
 * effect at the next chunk boundary.
 *
 * Recoverable conditions come back as a TransferResult (channel loss,
 * cancellation by either peer). Everything else is thrown after a
 * best-effort ABORT to the peer; replay and authentication failures also
 * destroy the session keys.
 */
class TransferEngine {
public:
    TransferEngine(IChannel& channel, const std::vector<uint8_t>& sharedSecret, SessionRole role,
                   EngineOptions options = {}, const std::vector<uint8_t>& salt = {});
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    /**
     * @brief Offer target to the peer and send whatever its baseline lacks.
     * @param target Manifest of what the peer should end up with
     * @param source Where chunk bytes of target are read from
     * @param jobs Resume records; a finished job is removed
     */
    TransferResult send(const SyncManifest& target, const IChunkSource& source, JobStore& jobs,
                        const PlanOptions& planOptions = {});

    /**
     * @brief Answer an offer with baseline and reassemble the target below the reassembler's root.
     */
    TransferResult receive(const SyncManifest& baseline, Reassembler& reassembler);

    void cancel() { cancelled_ = true; }
    bool cancelRequested() const { return cancelled_; }

    /// Wipe the session keys; the engine cannot be used afterwards.
    void close();

    SessionRole role() const { return cipher_.role(); }
    const EngineOptions& options() const { return options_; }
    bool closed() const { return cipher_.destroyed(); }

private:
    struct SendState;

    // Framing
    void sendMessage(const ChunkId& aadId, const std::vector<uint8_t>& plaintext);
    void sendControl(const std::vector<uint8_t>& message);
    Frame readFrame();
    std::vector<uint8_t> receiveControl();
    void sendAbortQuietly(ErrorCode code, const std::string& reason);
    void handleFatal(const GlobalSendError& error);

    // Sender
    void runSender(SendState& state);
    bool sendChunks(SendState& state, const std::vector<ChunkId>& batch);
    void cancelJob(SendState& state);
    void recordJobState(SendState& state, JobState jobState);

    // Receiver
    void runReceiver(const SyncManifest& baseline, Reassembler& reassembler, TransferResult& result);
    bool receiveBatch(const std::vector<ChunkId>& ids, Reassembler& reassembler, TransferResult& result);

    IChannel& channel_;
    SessionCipher cipher_;
    EngineOptions options_;
    ThreadPool pool_;
    FrameReader reader_;
    std::atomic<bool> cancelled_{false};
};

} // namespace GlobalSend
