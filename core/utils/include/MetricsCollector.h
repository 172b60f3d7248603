#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace GlobalSend {

    struct TransferMetricsSnapshot {
        uint64_t bytesSent{0};
        uint64_t bytesReceived{0};
        uint64_t chunksSent{0};
        uint64_t chunksReceived{0};
        uint64_t filesCommitted{0};
        uint64_t transfersCompleted{0};
        uint64_t transfersFailed{0};
        uint64_t transfersResumed{0};
    };

    struct IntegrityMetricsSnapshot {
        uint64_t chunkIntegrityFailures{0};
        uint64_t commitFailures{0};
        uint64_t replayRejections{0};
        uint64_t authFailures{0};
        uint64_t encryptionErrors{0};
    };

    /**
     * @brief Process-wide counters for the transfer engine.
     *
     * All updates are lock-free atomic increments; snapshots are not taken
     * atomically across counters.
     */
    class MetricsCollector {
    public:
        static MetricsCollector& instance();

        void addBytesSent(uint64_t bytes) { transfer_.bytesSent += bytes; }
        void addBytesReceived(uint64_t bytes) { transfer_.bytesReceived += bytes; }
        void incrementChunksSent() { transfer_.chunksSent++; }
        void incrementChunksReceived() { transfer_.chunksReceived++; }
        void incrementFilesCommitted() { transfer_.filesCommitted++; }
        void incrementTransfersCompleted() { transfer_.transfersCompleted++; }
        void incrementTransfersFailed() { transfer_.transfersFailed++; }
        void incrementTransfersResumed() { transfer_.transfersResumed++; }

        void incrementChunkIntegrityFailures() { integrity_.chunkIntegrityFailures++; }
        void incrementCommitFailures() { integrity_.commitFailures++; }
        void incrementReplayRejections() { integrity_.replayRejections++; }
        void incrementAuthFailures() { integrity_.authFailures++; }
        void incrementEncryptionErrors() { integrity_.encryptionErrors++; }

        TransferMetricsSnapshot getTransferMetrics() const;
        IntegrityMetricsSnapshot getIntegrityMetrics() const;

        std::string getMetricsSummary() const;

        void reset();

        std::chrono::seconds getUptime() const;

    private:
        MetricsCollector();

        struct TransferCounters {
            std::atomic<uint64_t> bytesSent{0};
            std::atomic<uint64_t> bytesReceived{0};
            std::atomic<uint64_t> chunksSent{0};
            std::atomic<uint64_t> chunksReceived{0};
            std::atomic<uint64_t> filesCommitted{0};
            std::atomic<uint64_t> transfersCompleted{0};
            std::atomic<uint64_t> transfersFailed{0};
            std::atomic<uint64_t> transfersResumed{0};
        };

        struct IntegrityCounters {
            std::atomic<uint64_t> chunkIntegrityFailures{0};
            std::atomic<uint64_t> commitFailures{0};
            std::atomic<uint64_t> replayRejections{0};
            std::atomic<uint64_t> authFailures{0};
            std::atomic<uint64_t> encryptionErrors{0};
        };

        TransferCounters transfer_;
        IntegrityCounters integrity_;
        std::chrono::steady_clock::time_point startTime_;
    };

} // namespace GlobalSend
