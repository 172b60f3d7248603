#include "Payload.h"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

namespace GlobalSend {

const char* payloadKindName(PayloadKind kind) {
    switch (kind) {
        case PayloadKind::File: return "file";
        case PayloadKind::Clipboard: return "clipboard";
        case PayloadKind::Structured: return "structured";
    }
    return "unknown";
}

PayloadKind payloadKind(const Payload& payload) {
    return static_cast<PayloadKind>(payload.index());
}

std::string payloadPath(const Payload& payload) {
    switch (payloadKind(payload)) {
        case PayloadKind::File:
            return std::get<FilePayload>(payload).name;
        case PayloadKind::Clipboard:
            return ".clipboard/" + std::get<ClipboardPayload>(payload).name + ".txt";
        case PayloadKind::Structured:
            return ".data/" + std::get<StructuredPayload>(payload).name;
    }
    throw std::logic_error("Unhandled payload kind");
}

std::unique_ptr<std::istream> openPayload(const Payload& payload) {
    switch (payloadKind(payload)) {
        case PayloadKind::File: {
            const auto& file = std::get<FilePayload>(payload);
            auto in = std::make_unique<std::ifstream>(file.source, std::ios::binary);
            if (!in->is_open()) {
                throw std::runtime_error("Cannot open payload file " + file.source.string());
            }
            return in;
        }
        case PayloadKind::Clipboard:
            return std::make_unique<std::istringstream>(std::get<ClipboardPayload>(payload).text, std::ios::binary);
        case PayloadKind::Structured: {
            const auto& body = std::get<StructuredPayload>(payload).body;
            return std::make_unique<std::istringstream>(std::string(body.begin(), body.end()), std::ios::binary);
        }
    }
    throw std::logic_error("Unhandled payload kind");
}

uint32_t payloadPermissions(const Payload& payload) {
    switch (payloadKind(payload)) {
        case PayloadKind::File: {
            struct stat st;
            if (::stat(std::get<FilePayload>(payload).source.c_str(), &st) == 0) {
                return st.st_mode & 07777;
            }
            return 0644;
        }
        case PayloadKind::Clipboard:
        case PayloadKind::Structured:
            return 0600;
    }
    return 0600;
}

} // namespace GlobalSend
