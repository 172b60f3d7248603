#pragma once

/**
 * @file SocketGuard.h
 * @brief Owning handle for a socket file descriptor
 */

#include <unistd.h>
#include <utility>

namespace GlobalSend {

/**
 * @brief Closes the socket it owns when it goes out of scope.
 *
 * @code
 * SocketGuard sock(::socket(AF_UNIX, SOCK_STREAM, 0));
 * if (!sock) { ... }
 * int fd = sock.release();   // caller owns fd now
 * @endcode
 */
class SocketGuard {
public:
    SocketGuard() noexcept = default;
    explicit SocketGuard(int fd) noexcept : fd_(fd) {}

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    SocketGuard(SocketGuard&& other) noexcept : fd_(other.release()) {}

    SocketGuard& operator=(SocketGuard&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    ~SocketGuard() { reset(); }

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    int release() noexcept { return std::exchange(fd_, -1); }

    /// Close the current descriptor, if any, and adopt fd.
    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

} // namespace GlobalSend
