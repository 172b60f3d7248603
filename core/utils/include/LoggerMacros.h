/**
 * @file LoggerMacros.h
 * @brief Logging macros that skip message construction when the level is off.
 *
 * Example:
 *   LOG_DEBUG_COMP_IF("chunk " + id.toHex() + " written", "Reassembler");
 */

#pragma once

#include "Logger.h"

#include <chrono>
#include <string>

namespace GlobalSend {

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::GlobalSend::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while (0)

#define LOG_INFO_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::GlobalSend::Logger::instance(); \
        if (logger__.isInfoEnabled()) { \
            logger__.info(msg, component); \
        } \
    } while (0)

#define LOG_WARN_COMP(msg, component) ::GlobalSend::Logger::instance().warn(msg, component)
#define LOG_ERROR_COMP(msg, component) ::GlobalSend::Logger::instance().error(msg, component)
#define LOG_CRITICAL_COMP(msg, component) ::GlobalSend::Logger::instance().critical(msg, component)

// Logs elapsed milliseconds at DEBUG level when it goes out of scope.
class ScopedTimer {
public:
    explicit ScopedTimer(std::string name, std::string component = "Performance")
        : name_(std::move(name)), component_(std::move(component)), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto& logger = Logger::instance();
        if (logger.isDebugEnabled()) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_).count();
            logger.debug(name_ + " took " + std::to_string(elapsed) + "ms", component_);
        }
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string name_;
    std::string component_;
    std::chrono::steady_clock::time_point start_;
};

#define SCOPED_TIMER_COMP(name, component) ::GlobalSend::ScopedTimer timer__(name, component)

} // namespace GlobalSend
