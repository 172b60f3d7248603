#pragma once

#include <stdexcept>
#include <string>

#include "ErrorCodes.h"

namespace GlobalSend {

/**
 * @brief Base of every error the engine throws.
 */
class GlobalSendError : public std::runtime_error {
public:
    GlobalSendError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }
    bool recoverable() const noexcept { return isRecoverable(code_); }

private:
    ErrorCode code_;
};

// Decrypted or re-read content does not hash to the claimed chunk id.
class ChunkIntegrityError : public GlobalSendError {
public:
    explicit ChunkIntegrityError(const std::string& message)
        : GlobalSendError(ErrorCode::CHUNK_INTEGRITY, message) {}
};

// Frame counter not strictly greater than the last accepted one.
class FrameReplayError : public GlobalSendError {
public:
    explicit FrameReplayError(const std::string& message)
        : GlobalSendError(ErrorCode::FRAME_REPLAY, message) {}
};

class FrameAuthenticationError : public GlobalSendError {
public:
    explicit FrameAuthenticationError(const std::string& message)
        : GlobalSendError(ErrorCode::FRAME_AUTHENTICATION_FAILED, message) {}
};

class ManifestVersionError : public GlobalSendError {
public:
    ManifestVersionError(int found, int supported)
        : GlobalSendError(ErrorCode::MANIFEST_VERSION,
                          "Unsupported manifest format version " + std::to_string(found) +
                          " (supported: " + std::to_string(supported) + ")"),
          found_(found) {}

    int foundVersion() const noexcept { return found_; }

private:
    int found_;
};

class PlanMismatchError : public GlobalSendError {
public:
    explicit PlanMismatchError(const std::string& message)
        : GlobalSendError(ErrorCode::PLAN_MISMATCH, message) {}
};

class ChannelInterrupted : public GlobalSendError {
public:
    explicit ChannelInterrupted(const std::string& message)
        : GlobalSendError(ErrorCode::CHANNEL_INTERRUPTED, message) {}
};

class CommitVerificationError : public GlobalSendError {
public:
    explicit CommitVerificationError(const std::string& message)
        : GlobalSendError(ErrorCode::COMMIT_VERIFICATION, message) {}
};

class SourceChangedError : public GlobalSendError {
public:
    explicit SourceChangedError(const std::string& message)
        : GlobalSendError(ErrorCode::SOURCE_CHANGED, message) {}
};

class ProtocolError : public GlobalSendError {
public:
    explicit ProtocolError(const std::string& message, ErrorCode code = ErrorCode::PROTOCOL_ERROR)
        : GlobalSendError(code, message) {}
};

// The peer ended the session with an ABORT message.
class SessionAbortedError : public GlobalSendError {
public:
    SessionAbortedError(ErrorCode peerCode, const std::string& reason)
        : GlobalSendError(ErrorCode::SESSION_ABORTED, "Peer aborted session: " + reason),
          peerCode_(peerCode) {}

    ErrorCode peerCode() const noexcept { return peerCode_; }

private:
    ErrorCode peerCode_;
};

} // namespace GlobalSend
