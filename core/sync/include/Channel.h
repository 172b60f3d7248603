#pragma once

#include <cstdint>
#include <vector>

namespace GlobalSend {

/**
 * @brief Ordered, reliable, already-authenticated byte stream of one session.
 *
 * Supplied by the transport layer. The engine makes no assumption about how
 * the stream is split: receive() may return any non-empty slice of what the
 * peer sent.
 */
class IChannel {
public:
    virtual ~IChannel() = default;

    /**
     * @throws ChannelInterrupted if the channel is closed or fails
     */
    virtual void send(const std::vector<uint8_t>& bytes) = 0;

    /**
     * @brief Block until at least one byte is available.
     * @throws ChannelInterrupted if the channel is closed or fails
     */
    virtual std::vector<uint8_t> receive() = 0;

    virtual void close() = 0;
};

} // namespace GlobalSend
