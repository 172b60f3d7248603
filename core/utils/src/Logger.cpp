#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace GlobalSend {

    Logger& Logger::instance() {
        static Logger instance;
        return instance;
    }

    Logger::~Logger() {
        if (logFile_.is_open()) {
            logFile_.close();
        }
    }

    void Logger::setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logFile_.is_open()) {
            logFile_.close();
        }
        logFilePath_ = path;
        logFile_.open(path, std::ios::app);

        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        currentFileSize_ = ec ? 0 : static_cast<size_t>(size);
    }

    void Logger::closeLogFile() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logFile_.is_open()) {
            logFile_.close();
        }
        logFilePath_.clear();
        currentFileSize_ = 0;
    }

    void Logger::setLevel(LogLevel level) {
        currentLevel_ = level;
    }

    void Logger::setMaxFileSize(size_t maxSizeMB) {
        std::lock_guard<std::mutex> lock(mutex_);
        maxFileSizeMB_ = maxSizeMB;
    }

    LogLevel Logger::levelFromString(const std::string& name, LogLevel fallback) {
        std::string upper = name;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (upper == "DEBUG") return LogLevel::DEBUG;
        if (upper == "INFO") return LogLevel::INFO;
        if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
        if (upper == "ERROR") return LogLevel::ERROR;
        if (upper == "CRITICAL") return LogLevel::CRITICAL;
        return fallback;
    }

    void Logger::log(LogLevel level, const std::string& message, const std::string& component) {
        if (level < currentLevel_) {
            return;
        }

        std::string entry = "[" + timestamp("%Y-%m-%d %H:%M:%S") + "] [" + levelToString(level) + "] [" +
                            (component.empty() ? std::string("GlobalSend") : component) + "] " + message;

        std::lock_guard<std::mutex> lock(mutex_);
        if (consoleOutput_) {
            if (level >= LogLevel::ERROR) {
                std::cerr << "\033[1;31m" << entry << "\033[0m" << std::endl;
            } else if (level == LogLevel::WARN) {
                std::cout << "\033[1;33m" << entry << "\033[0m" << std::endl;
            } else {
                std::cout << entry << std::endl;
            }
        }

        if (logFile_.is_open()) {
            logFile_ << entry << '\n';
            logFile_.flush();
            currentFileSize_ += entry.size() + 1;
            if (currentFileSize_ > maxFileSizeMB_ * 1024 * 1024) {
                rotateLocked();
            }
        }
    }

    void Logger::debug(const std::string& message, const std::string& component) {
        log(LogLevel::DEBUG, message, component);
    }

    void Logger::info(const std::string& message, const std::string& component) {
        log(LogLevel::INFO, message, component);
    }

    void Logger::warn(const std::string& message, const std::string& component) {
        log(LogLevel::WARN, message, component);
    }

    void Logger::error(const std::string& message, const std::string& component) {
        log(LogLevel::ERROR, message, component);
    }

    void Logger::critical(const std::string& message, const std::string& component) {
        log(LogLevel::CRITICAL, message, component);
    }

    const char* Logger::levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::CRITICAL: return "CRITICAL";
        }
        return "UNKNOWN";
    }

    std::string Logger::timestamp(const char* format) {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        struct tm tmBuf;
        localtime_r(&now, &tmBuf);

        std::ostringstream ss;
        ss << std::put_time(&tmBuf, format);
        return ss.str();
    }

    // Caller holds mutex_.
    void Logger::rotateLocked() {
        if (logFilePath_.empty()) {
            return;
        }
        logFile_.close();

        std::string rotatedPath = logFilePath_ + "." + timestamp("%Y%m%d_%H%M%S");
        std::error_code ec;
        std::filesystem::rename(logFilePath_, rotatedPath, ec);
        if (ec) {
            std::cerr << "Failed to rotate log file: " << ec.message() << std::endl;
        }

        logFile_.open(logFilePath_, std::ios::app);
        currentFileSize_ = 0;
    }

}
