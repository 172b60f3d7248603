#pragma once

namespace GlobalSend {

enum class ErrorCode : int {
    SUCCESS = 0,

    // Configuration (1000-1999)
    INVALID_CONFIGURATION = 1000,
    INVALID_ARGUMENT = 1001,

    // Session crypto (2000-2999)
    FRAME_REPLAY = 2001,
    FRAME_AUTHENTICATION_FAILED = 2002,
    KEY_DERIVATION_FAILED = 2003,
    ENCRYPTION_FAILED = 2004,

    // Integrity (3000-3999)
    CHUNK_INTEGRITY = 3001,
    COMMIT_VERIFICATION = 3002,
    SOURCE_CHANGED = 3003,

    // Manifest (4000-4999)
    MANIFEST_VERSION = 4001,
    MANIFEST_MALFORMED = 4002,
    UNSAFE_PATH = 4003,

    // Jobs and storage (5000-5999)
    PLAN_MISMATCH = 5001,
    JOB_NOT_FOUND = 5002,
    STORAGE_ERROR = 5003,
    IO_ERROR = 5004,

    // Session protocol (6000-6999)
    CHANNEL_INTERRUPTED = 6001,
    PROTOCOL_ERROR = 6002,
    SESSION_ABORTED = 6003,
    CANCELLED = 6004,

    INTERNAL_ERROR = 9000
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::INVALID_CONFIGURATION: return "Invalid configuration";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::FRAME_REPLAY: return "Frame replay";
        case ErrorCode::FRAME_AUTHENTICATION_FAILED: return "Frame authentication failed";
        case ErrorCode::KEY_DERIVATION_FAILED: return "Key derivation failed";
        case ErrorCode::ENCRYPTION_FAILED: return "Encryption failed";
        case ErrorCode::CHUNK_INTEGRITY: return "Chunk integrity";
        case ErrorCode::COMMIT_VERIFICATION: return "Commit verification";
        case ErrorCode::SOURCE_CHANGED: return "Source changed";
        case ErrorCode::MANIFEST_VERSION: return "Unsupported manifest version";
        case ErrorCode::MANIFEST_MALFORMED: return "Malformed manifest";
        case ErrorCode::UNSAFE_PATH: return "Unsafe path";
        case ErrorCode::PLAN_MISMATCH: return "Plan mismatch";
        case ErrorCode::JOB_NOT_FOUND: return "Job not found";
        case ErrorCode::STORAGE_ERROR: return "Storage error";
        case ErrorCode::IO_ERROR: return "I/O error";
        case ErrorCode::CHANNEL_INTERRUPTED: return "Channel interrupted";
        case ErrorCode::PROTOCOL_ERROR: return "Protocol error";
        case ErrorCode::SESSION_ABORTED: return "Session aborted";
        case ErrorCode::CANCELLED: return "Cancelled";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
    }
    return "Unknown error";
}

/**
 * @brief Whether a failure with this code leaves the job resumable.
 */
inline bool isRecoverable(ErrorCode code) {
    switch (code) {
        case ErrorCode::CHUNK_INTEGRITY:
        case ErrorCode::COMMIT_VERIFICATION:
        case ErrorCode::PLAN_MISMATCH:
        case ErrorCode::CHANNEL_INTERRUPTED:
        case ErrorCode::CANCELLED:
            return true;
        default:
            return false;
    }
}

} // namespace GlobalSend
