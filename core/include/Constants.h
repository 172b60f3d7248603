#pragma once

/**
 * @file Constants.h
 * @brief Wire constants and configuration defaults for GlobalSend.
 *
 * Defaults here are what the engine uses when the matching Config key is
 * absent.
 */

#include <cstddef>
#include <cstdint>

namespace GlobalSend::config {

// =============================================================================
// Chunking
// =============================================================================

constexpr std::size_t DEFAULT_MIN_CHUNK_SIZE = 256 * 1024;
constexpr std::size_t DEFAULT_TARGET_CHUNK_SIZE = 1024 * 1024;
constexpr std::size_t DEFAULT_MAX_CHUNK_SIZE = 4 * 1024 * 1024;

/// Bytes of history the gear hash depends on; also the smallest legal min size.
constexpr std::size_t GEAR_WINDOW_SIZE = 64;

/// Read granularity for streaming scans.
constexpr std::size_t SCAN_READ_SIZE = 256 * 1024;

// =============================================================================
// Manifest
// =============================================================================

constexpr int MANIFEST_FORMAT_VERSION = 1;

/// Suffix of the receiver's partial files; never part of a scan.
constexpr const char* TEMP_FILE_SUFFIX = ".gspart";

// =============================================================================
// Session crypto and framing
// =============================================================================

constexpr std::uint8_t PROTOCOL_VERSION = 1;

constexpr std::size_t AEAD_KEY_SIZE = 32;
constexpr std::size_t AEAD_NONCE_SIZE = 12;
constexpr std::size_t AEAD_TAG_SIZE = 16;

constexpr std::size_t FRAME_LENGTH_SIZE = 4;
constexpr std::size_t FRAME_COUNTER_SIZE = 12;

/// Upper bound on the length field; larger frames are rejected unread.
constexpr std::size_t MAX_FRAME_SIZE = 16 * 1024 * 1024;

constexpr const char* HKDF_LABEL_PREFIX = "globalsend v1 ";

/// Largest read a SocketChannel hands out per receive().
constexpr std::size_t SOCKET_READ_SIZE = 64 * 1024;

// =============================================================================
// Transfer engine
// =============================================================================

constexpr std::size_t DEFAULT_WINDOW = 8;
constexpr std::size_t DEFAULT_BATCH_SIZE = 32;
constexpr std::size_t DEFAULT_MAX_ROUNDS = 5;
constexpr std::size_t DEFAULT_WORKER_THREADS = 4;

constexpr const char* DEFAULT_JOB_DB_PATH = "globalsend_jobs.db";

} // namespace GlobalSend::config

namespace GlobalSend::config::keys {

constexpr const char* CHUNK_MIN_SIZE = "chunk.min_size";
constexpr const char* CHUNK_TARGET_SIZE = "chunk.target_size";
constexpr const char* CHUNK_MAX_SIZE = "chunk.max_size";
constexpr const char* TRANSFER_WINDOW = "transfer.window";
constexpr const char* TRANSFER_BATCH_SIZE = "transfer.batch_size";
constexpr const char* TRANSFER_MAX_ROUNDS = "transfer.max_rounds";
constexpr const char* TRANSFER_WORKER_THREADS = "transfer.worker_threads";
constexpr const char* SYNC_MIRROR_DELETES = "sync.mirror_deletes";
constexpr const char* SYNC_ALLOW_DELETES = "sync.allow_deletes";
constexpr const char* JOBS_DB_PATH = "jobs.db_path";
constexpr const char* LOG_LEVEL = "log.level";
constexpr const char* LOG_FILE = "log.file";

} // namespace GlobalSend::config::keys
