#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace GlobalSend {

enum class PayloadKind : uint8_t {
    File = 0,
    Clipboard = 1,
    Structured = 2
};

const char* payloadKindName(PayloadKind kind);

/// A file on local disk, sent under `name` (a relative manifest path).
struct FilePayload {
    std::filesystem::path source;
    std::string name;
};

/// Clipboard text; lands at ".clipboard/<name>.txt" on the receiver.
struct ClipboardPayload {
    std::string name;
    std::string text;
};

/// Application data blob; lands at ".data/<name>" on the receiver.
struct StructuredPayload {
    std::string name;
    std::string contentType;
    std::vector<uint8_t> body;
};

/**
 * @brief Anything a session can carry. Each kind maps to a manifest path
 *        and a byte stream, after which all kinds are chunked, planned and
 *        encrypted the same way.
 */
using Payload = std::variant<FilePayload, ClipboardPayload, StructuredPayload>;

PayloadKind payloadKind(const Payload& payload);

/// Relative manifest path the payload is transferred under.
std::string payloadPath(const Payload& payload);

/**
 * @brief Open the payload's bytes for reading (seekable).
 * @throws std::runtime_error if a file payload cannot be opened
 */
std::unique_ptr<std::istream> openPayload(const Payload& payload);

/// Mode bits recorded in the manifest for in-memory kinds; files use their own.
uint32_t payloadPermissions(const Payload& payload);

} // namespace GlobalSend
