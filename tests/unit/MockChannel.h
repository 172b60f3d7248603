#pragma once

#include "Channel.h"
#include "Exceptions.h"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace GlobalSend {

/**
 * @brief In-memory duplex byte pipe. Closing either end closes both;
 *        bytes already queued are still delivered.
 */
class MemoryPipe {
public:
    class End : public IChannel {
    public:
        End(std::shared_ptr<MemoryPipe> pipe, int side) : pipe_(std::move(pipe)), side_(side) {}

        void send(const std::vector<uint8_t>& bytes) override {
            std::lock_guard<std::mutex> lock(pipe_->mutex_);
            if (pipe_->closed_) {
                throw ChannelInterrupted("pipe closed");
            }
            pipe_->queues_[1 - side_].push_back(bytes);
            pipe_->cv_.notify_all();
        }

        std::vector<uint8_t> receive() override {
            std::unique_lock<std::mutex> lock(pipe_->mutex_);
            auto& queue = pipe_->queues_[side_];
            pipe_->cv_.wait(lock, [&]() { return !queue.empty() || pipe_->closed_; });
            if (queue.empty()) {
                throw ChannelInterrupted("pipe closed");
            }
            std::vector<uint8_t> bytes = std::move(queue.front());
            queue.pop_front();
            return bytes;
        }

        void close() override {
            std::lock_guard<std::mutex> lock(pipe_->mutex_);
            pipe_->closed_ = true;
            pipe_->cv_.notify_all();
        }

    private:
        std::shared_ptr<MemoryPipe> pipe_;
        int side_;
    };

    static std::pair<std::unique_ptr<End>, std::unique_ptr<End>> create() {
        auto pipe = std::make_shared<MemoryPipe>();
        return {std::make_unique<End>(pipe, 0), std::make_unique<End>(pipe, 1)};
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::vector<uint8_t>> queues_[2];
    bool closed_{false};
};

/// Forwards everything to another channel; subclasses tamper with send().
class ForwardingChannel : public IChannel {
public:
    explicit ForwardingChannel(IChannel& inner) : inner_(inner) {}

    void send(const std::vector<uint8_t>& bytes) override { inner_.send(bytes); }
    std::vector<uint8_t> receive() override { return inner_.receive(); }
    void close() override { inner_.close(); }

protected:
    IChannel& inner_;
};

/// Flips one ciphertext byte of the first frame of at least minFrameSize bytes.
class CorruptingChannel : public ForwardingChannel {
public:
    CorruptingChannel(IChannel& inner, size_t minFrameSize) : ForwardingChannel(inner), minFrameSize_(minFrameSize) {}

    void send(const std::vector<uint8_t>& bytes) override {
        if (!done_ && bytes.size() >= minFrameSize_) {
            done_ = true;
            std::vector<uint8_t> damaged = bytes;
            damaged[damaged.size() / 2] ^= 0x5a;
            inner_.send(damaged);
            return;
        }
        inner_.send(bytes);
    }

    bool corrupted() const { return done_; }

private:
    size_t minFrameSize_;
    bool done_{false};
};

/// Sends the first frame of at least minFrameSize bytes twice.
class DuplicatingChannel : public ForwardingChannel {
public:
    DuplicatingChannel(IChannel& inner, size_t minFrameSize) : ForwardingChannel(inner), minFrameSize_(minFrameSize) {}

    void send(const std::vector<uint8_t>& bytes) override {
        inner_.send(bytes);
        if (!done_ && bytes.size() >= minFrameSize_) {
            done_ = true;
            inner_.send(bytes);
        }
    }

private:
    size_t minFrameSize_;
    bool done_{false};
};

/// Drops the connection once more than byteLimit bytes have been sent.
class InterruptingChannel : public ForwardingChannel {
public:
    InterruptingChannel(IChannel& inner, size_t byteLimit) : ForwardingChannel(inner), byteLimit_(byteLimit) {}

    void send(const std::vector<uint8_t>& bytes) override {
        if (sent_ + bytes.size() > byteLimit_) {
            inner_.close();
            throw ChannelInterrupted("connection dropped after " + std::to_string(sent_) + " bytes");
        }
        sent_ += bytes.size();
        inner_.send(bytes);
    }

private:
    size_t byteLimit_;
    size_t sent_{0};
};

} // namespace GlobalSend
