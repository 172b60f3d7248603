#include "Frame.h"

#include "Constants.h"
#include "Exceptions.h"

#include <arpa/inet.h>

#include <cstring>

namespace GlobalSend {

std::vector<uint8_t> FrameCodec::encode(const Frame& frame) {
    const std::size_t bodyLength = config::FRAME_COUNTER_SIZE + frame.ciphertext.size();
    if (bodyLength > config::MAX_FRAME_SIZE) {
        throw ProtocolError("Frame too large: " + std::to_string(bodyLength) + " bytes");
    }

    std::vector<uint8_t> out(config::FRAME_LENGTH_SIZE + bodyLength);
    uint32_t netLength = htonl(static_cast<uint32_t>(bodyLength));
    std::memcpy(out.data(), &netLength, sizeof(netLength));
    writeCounter(frame.counter, out.data() + config::FRAME_LENGTH_SIZE);
    std::memcpy(out.data() + config::FRAME_LENGTH_SIZE + config::FRAME_COUNTER_SIZE,
                frame.ciphertext.data(), frame.ciphertext.size());
    return out;
}

void FrameCodec::writeCounter(uint64_t counter, uint8_t* out) {
    std::memset(out, 0, config::FRAME_COUNTER_SIZE);
    for (int i = 0; i < 8; ++i) {
        out[config::FRAME_COUNTER_SIZE - 1 - i] = static_cast<uint8_t>(counter >> (8 * i));
    }
}

uint64_t FrameCodec::readCounter(const uint8_t* in) {
    for (std::size_t i = 0; i < config::FRAME_COUNTER_SIZE - 8; ++i) {
        if (in[i] != 0) {
            throw ProtocolError("Frame counter exceeds 64 bits");
        }
    }
    uint64_t counter = 0;
    for (std::size_t i = config::FRAME_COUNTER_SIZE - 8; i < config::FRAME_COUNTER_SIZE; ++i) {
        counter = (counter << 8) | in[i];
    }
    return counter;
}

void FrameReader::feed(const std::vector<uint8_t>& bytes) {
    // Compact once the consumed prefix dominates the buffer.
    if (readPos_ > 0 && readPos_ >= buffer_.size() / 2) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(readPos_));
        readPos_ = 0;
    }
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

std::optional<Frame> FrameReader::next() {
    if (buffered() < config::FRAME_LENGTH_SIZE) {
        return std::nullopt;
    }

    uint32_t netLength = 0;
    std::memcpy(&netLength, buffer_.data() + readPos_, sizeof(netLength));
    const std::size_t bodyLength = ntohl(netLength);

    if (bodyLength < config::FRAME_COUNTER_SIZE + config::AEAD_TAG_SIZE || bodyLength > config::MAX_FRAME_SIZE) {
        throw ProtocolError("Invalid frame length " + std::to_string(bodyLength));
    }
    if (buffered() < config::FRAME_LENGTH_SIZE + bodyLength) {
        return std::nullopt;
    }

    const uint8_t* body = buffer_.data() + readPos_ + config::FRAME_LENGTH_SIZE;
    Frame frame;
    frame.counter = FrameCodec::readCounter(body);
    frame.ciphertext.assign(body + config::FRAME_COUNTER_SIZE, body + bodyLength);

    readPos_ += config::FRAME_LENGTH_SIZE + bodyLength;
    return frame;
}

} // namespace GlobalSend
