#include "TransferEngine.h"

#include "Constants.h"
#include "Exceptions.h"
#include "Logger.h"
#include "LoggerMacros.h"

namespace GlobalSend {

const char* transferStatusName(TransferStatus status) {
    switch (status) {
        case TransferStatus::Completed: return "completed";
        case TransferStatus::Cancelled: return "cancelled";
        case TransferStatus::Interrupted: return "interrupted";
    }
    return "unknown";
}

VoidResult EngineOptions::validate() const {
    if (window == 0) {
        return Error("transfer.window must be at least 1", ErrorCode::INVALID_CONFIGURATION, "TransferEngine");
    }
    if (batchSize == 0) {
        return Error("transfer.batch_size must be at least 1", ErrorCode::INVALID_CONFIGURATION, "TransferEngine");
    }
    if (maxRounds == 0) {
        return Error("transfer.max_rounds must be at least 1", ErrorCode::INVALID_CONFIGURATION, "TransferEngine");
    }
    if (workerThreads == 0) {
        return Error("transfer.worker_threads must be at least 1", ErrorCode::INVALID_CONFIGURATION, "TransferEngine");
    }
    return Ok();
}

Result<EngineOptions> EngineOptions::fromConfig(const Config& config) {
    EngineOptions options;
    options.window = config.getSize(config::keys::TRANSFER_WINDOW, config::DEFAULT_WINDOW);
    options.batchSize = config.getSize(config::keys::TRANSFER_BATCH_SIZE, config::DEFAULT_BATCH_SIZE);
    options.maxRounds = config.getSize(config::keys::TRANSFER_MAX_ROUNDS, config::DEFAULT_MAX_ROUNDS);
    options.workerThreads = config.getSize(config::keys::TRANSFER_WORKER_THREADS, config::DEFAULT_WORKER_THREADS);

    auto valid = options.validate();
    if (valid.isError()) {
        return valid.error();
    }
    return options;
}

TransferEngine::TransferEngine(IChannel& channel, const std::vector<uint8_t>& sharedSecret, SessionRole role,
                               EngineOptions options, const std::vector<uint8_t>& salt)
    : channel_(channel),
      cipher_(sharedSecret, role, salt),
      options_(options),
      pool_(options.workerThreads == 0 ? 1 : options.workerThreads) {
    auto valid = options_.validate();
    if (valid.isError()) {
        throw std::invalid_argument(valid.error().message);
    }
}

TransferEngine::~TransferEngine() {
    pool_.shutdown();
    if (!cipher_.destroyed()) {
        cipher_.destroy();
    }
}

void TransferEngine::close() {
    if (!cipher_.destroyed()) {
        cipher_.destroy();
        LOG_DEBUG_COMP_IF("Session keys destroyed", "TransferEngine");
    }
}

void TransferEngine::sendMessage(const ChunkId& aadId, const std::vector<uint8_t>& plaintext) {
    Frame frame = cipher_.seal(aadId, plaintext);
    channel_.send(FrameCodec::encode(frame));
}

void TransferEngine::sendControl(const std::vector<uint8_t>& message) {
    LOG_DEBUG_COMP_IF(std::string("-> ") + messageTypeName(SyncProtocol::typeOf(message)), "TransferEngine");
    sendMessage(ChunkId{}, message);
}

Frame TransferEngine::readFrame() {
    while (true) {
        if (auto frame = reader_.next()) {
            return std::move(*frame);
        }
        reader_.feed(channel_.receive());
    }
}

std::vector<uint8_t> TransferEngine::receiveControl() {
    std::vector<uint8_t> message = cipher_.open(readFrame(), ChunkId{});
    const MessageType type = SyncProtocol::typeOf(message);
    LOG_DEBUG_COMP_IF(std::string("<- ") + messageTypeName(type), "TransferEngine");
    if (type == MessageType::Abort) {
        AbortMessage abort = SyncProtocol::decodeAbort(message);
        throw SessionAbortedError(abort.code, abort.reason);
    }
    return message;
}

void TransferEngine::sendAbortQuietly(ErrorCode code, const std::string& reason) {
    if (cipher_.destroyed()) {
        return;
    }
    try {
        sendControl(SyncProtocol::encodeAbort({code, reason}));
    } catch (const std::runtime_error& e) {
        LOG_DEBUG_COMP_IF(std::string("ABORT not delivered: ") + e.what(), "TransferEngine");
    }
}

void TransferEngine::handleFatal(const GlobalSendError& error) {
    Logger::instance().error(std::string("Session failed: ") + error.what() + " (" +
                             errorCodeToString(error.code()) + ")", "TransferEngine");
    if (error.code() != ErrorCode::SESSION_ABORTED) {
        sendAbortQuietly(error.code(), error.what());
    }
    if (error.code() == ErrorCode::FRAME_REPLAY || error.code() == ErrorCode::FRAME_AUTHENTICATION_FAILED) {
        close();
    }
}

} // namespace GlobalSend
