#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace GlobalSend {

/**
 * @brief One encrypted frame as it travels on the channel.
 *
 * Wire layout:
 *   [4-byte BE length of what follows][12-byte BE counter][ciphertext || 16-byte tag]
 */
struct Frame {
    uint64_t counter{0};
    std::vector<uint8_t> ciphertext;
};

class FrameCodec {
public:
    static std::vector<uint8_t> encode(const Frame& frame);

    static void writeCounter(uint64_t counter, uint8_t* out);
    /**
     * @throws ProtocolError if the upper four bytes are not zero
     */
    static uint64_t readCounter(const uint8_t* in);
};

/**
 * @brief Reassembles frames from arbitrarily split channel reads.
 */
class FrameReader {
public:
    void feed(const std::vector<uint8_t>& bytes);

    /**
     * @brief Next complete frame, or nullopt if more bytes are needed.
     * @throws ProtocolError on a length outside [28, MAX_FRAME_SIZE]
     */
    std::optional<Frame> next();

    std::size_t buffered() const { return buffer_.size() - readPos_; }

private:
    std::vector<uint8_t> buffer_;
    std::size_t readPos_{0};
};

} // namespace GlobalSend
