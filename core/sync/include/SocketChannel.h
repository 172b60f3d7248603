#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <utility>

#include "Channel.h"
#include "SocketGuard.h"

namespace GlobalSend {

/**
 * @brief IChannel over a connected stream socket.
 *
 * The socket is owned by the channel. close() shuts the connection down in
 * both directions, which also wakes a receive() blocked in another thread;
 * the descriptor itself is released by the destructor.
 */
class SocketChannel : public IChannel {
public:
    explicit SocketChannel(SocketGuard socket);
    ~SocketChannel() override;

    SocketChannel(const SocketChannel&) = delete;
    SocketChannel& operator=(const SocketChannel&) = delete;

    void send(const std::vector<uint8_t>& bytes) override;
    std::vector<uint8_t> receive() override;
    void close() override;

    bool isClosed() const { return closed_; }

    /**
     * @brief Two connected ends of a local stream socket pair.
     * @throws GlobalSendError (IO_ERROR) if the pair cannot be created
     */
    static std::pair<std::unique_ptr<SocketChannel>, std::unique_ptr<SocketChannel>> pair();

private:
    SocketGuard socket_;
    std::mutex sendMutex_;
    std::atomic<bool> closed_{false};
};

} // namespace GlobalSend
