#include "SocketChannel.h"

#include "Constants.h"
#include "Exceptions.h"
#include "LoggerMacros.h"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>

namespace GlobalSend {

SocketChannel::SocketChannel(SocketGuard socket) : socket_(std::move(socket)) {
    if (!socket_) {
        throw std::invalid_argument("SocketChannel needs a connected socket");
    }
}

SocketChannel::~SocketChannel() {
    close();
}

void SocketChannel::send(const std::vector<uint8_t>& bytes) {
    std::lock_guard<std::mutex> lock(sendMutex_);
    size_t done = 0;
    while (done < bytes.size()) {
        if (closed_) {
            throw ChannelInterrupted("socket closed");
        }
        ssize_t n = ::send(socket_.get(), bytes.data() + done, bytes.size() - done, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            throw ChannelInterrupted(std::string("send failed: ") + std::strerror(errno));
        }
        done += static_cast<size_t>(n);
    }
}

std::vector<uint8_t> SocketChannel::receive() {
    std::vector<uint8_t> buffer(config::SOCKET_READ_SIZE);
    while (true) {
        ssize_t n = ::recv(socket_.get(), buffer.data(), buffer.size(), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n == 0) {
            throw ChannelInterrupted("peer closed the connection");
        }
        if (n < 0) {
            throw ChannelInterrupted(std::string("recv failed: ") + std::strerror(errno));
        }
        buffer.resize(static_cast<size_t>(n));
        return buffer;
    }
}

void SocketChannel::close() {
    if (!closed_.exchange(true) && socket_) {
        ::shutdown(socket_.get(), SHUT_RDWR);
        LOG_DEBUG_COMP_IF("Socket " + std::to_string(socket_.get()) + " shut down", "SocketChannel");
    }
}

std::pair<std::unique_ptr<SocketChannel>, std::unique_ptr<SocketChannel>> SocketChannel::pair() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
        throw GlobalSendError(ErrorCode::IO_ERROR, std::string("socketpair failed: ") + std::strerror(errno));
    }
    SocketGuard a(fds[0]);
    SocketGuard b(fds[1]);
    return {std::make_unique<SocketChannel>(std::move(a)), std::make_unique<SocketChannel>(std::move(b))};
}

} // namespace GlobalSend
