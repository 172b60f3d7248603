#include "ChunkSource.h"

#include "PathValidator.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <unistd.h>

namespace GlobalSend {

namespace {

template<typename Bytes>
std::vector<uint8_t> sliceOf(const Bytes& bytes, const ChunkRef& ref) {
    if (ref.offset > bytes.size() || ref.size > bytes.size() - ref.offset) {
        throw std::runtime_error("Chunk range beyond end of payload " + ref.path);
    }
    auto first = bytes.begin() + static_cast<std::ptrdiff_t>(ref.offset);
    return std::vector<uint8_t>(first, first + static_cast<std::ptrdiff_t>(ref.size));
}

} // namespace

std::vector<uint8_t> readFileRange(const std::filesystem::path& path, uint64_t offset, uint64_t size) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw std::runtime_error("Cannot open " + path.string() + ": " + std::strerror(errno));
    }

    std::vector<uint8_t> data(size);
    size_t done = 0;
    while (done < size) {
        ssize_t n = ::pread(fd, data.data() + done, size - done, static_cast<off_t>(offset + done));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            int err = errno;
            ::close(fd);
            throw std::runtime_error("Short read from " + path.string() +
                                     (n < 0 ? std::string(": ") + std::strerror(err) : std::string()));
        }
        done += static_cast<size_t>(n);
    }
    ::close(fd);
    return data;
}

std::vector<uint8_t> DirectoryChunkSource::read(const ChunkRef& ref) const {
    return readFileRange(PathValidator::resolveWithin(root_, ref.path), ref.offset, ref.size);
}

PayloadChunkSource::PayloadChunkSource(const std::vector<Payload>& payloads) {
    for (const auto& payload : payloads) {
        byPath_.emplace(payloadPath(payload), payload);
    }
}

std::vector<uint8_t> PayloadChunkSource::read(const ChunkRef& ref) const {
    auto it = byPath_.find(ref.path);
    if (it == byPath_.end()) {
        throw std::runtime_error("No payload for " + ref.path);
    }

    const Payload& payload = it->second;
    switch (payloadKind(payload)) {
        case PayloadKind::File:
            return readFileRange(std::get<FilePayload>(payload).source, ref.offset, ref.size);
        case PayloadKind::Clipboard:
            return sliceOf(std::get<ClipboardPayload>(payload).text, ref);
        case PayloadKind::Structured:
            return sliceOf(std::get<StructuredPayload>(payload).body, ref);
    }
    throw std::logic_error("Unhandled payload kind");
}

} // namespace GlobalSend
