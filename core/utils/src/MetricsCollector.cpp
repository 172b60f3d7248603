#include "MetricsCollector.h"

#include <iomanip>
#include <sstream>

namespace GlobalSend {

    MetricsCollector::MetricsCollector()
        : startTime_(std::chrono::steady_clock::now()) {
    }

    MetricsCollector& MetricsCollector::instance() {
        static MetricsCollector instance;
        return instance;
    }

    TransferMetricsSnapshot MetricsCollector::getTransferMetrics() const {
        TransferMetricsSnapshot s;
        s.bytesSent = transfer_.bytesSent.load();
        s.bytesReceived = transfer_.bytesReceived.load();
        s.chunksSent = transfer_.chunksSent.load();
        s.chunksReceived = transfer_.chunksReceived.load();
        s.filesCommitted = transfer_.filesCommitted.load();
        s.transfersCompleted = transfer_.transfersCompleted.load();
        s.transfersFailed = transfer_.transfersFailed.load();
        s.transfersResumed = transfer_.transfersResumed.load();
        return s;
    }

    IntegrityMetricsSnapshot MetricsCollector::getIntegrityMetrics() const {
        IntegrityMetricsSnapshot s;
        s.chunkIntegrityFailures = integrity_.chunkIntegrityFailures.load();
        s.commitFailures = integrity_.commitFailures.load();
        s.replayRejections = integrity_.replayRejections.load();
        s.authFailures = integrity_.authFailures.load();
        s.encryptionErrors = integrity_.encryptionErrors.load();
        return s;
    }

    std::string MetricsCollector::getMetricsSummary() const {
        auto t = getTransferMetrics();
        auto i = getIntegrityMetrics();
        auto uptime = getUptime().count();

        std::ostringstream ss;
        ss << "=== GlobalSend Metrics ===\n";
        ss << "Uptime: " << uptime / 3600 << "h " << (uptime % 3600) / 60 << "m\n\n";

        ss << std::fixed << std::setprecision(2);
        ss << "--- Transfer ---\n";
        ss << "  Sent: " << t.bytesSent / (1024.0 * 1024.0) << " MB in " << t.chunksSent << " chunks\n";
        ss << "  Received: " << t.bytesReceived / (1024.0 * 1024.0) << " MB in " << t.chunksReceived << " chunks\n";
        ss << "  Files Committed: " << t.filesCommitted << "\n";
        ss << "  Transfers Completed/Failed/Resumed: " << t.transfersCompleted << "/"
           << t.transfersFailed << "/" << t.transfersResumed << "\n\n";

        ss << "--- Integrity ---\n";
        ss << "  Chunk Integrity Failures: " << i.chunkIntegrityFailures << "\n";
        ss << "  Commit Failures: " << i.commitFailures << "\n";
        ss << "  Replay Rejections: " << i.replayRejections << "\n";
        ss << "  Auth Failures: " << i.authFailures << "\n";
        ss << "  Encryption Errors: " << i.encryptionErrors << "\n";
        return ss.str();
    }

    void MetricsCollector::reset() {
        transfer_.bytesSent = 0;
        transfer_.bytesReceived = 0;
        transfer_.chunksSent = 0;
        transfer_.chunksReceived = 0;
        transfer_.filesCommitted = 0;
        transfer_.transfersCompleted = 0;
        transfer_.transfersFailed = 0;
        transfer_.transfersResumed = 0;

        integrity_.chunkIntegrityFailures = 0;
        integrity_.commitFailures = 0;
        integrity_.replayRejections = 0;
        integrity_.authFailures = 0;
        integrity_.encryptionErrors = 0;
    }

    std::chrono::seconds MetricsCollector::getUptime() const {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startTime_);
    }

} // namespace GlobalSend
