#pragma once

#include <atomic>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

namespace GlobalSend {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Process-wide levelled logger.
     *
     * Entries are formatted as "[time] [LEVEL] [Component] message" and go to
     * the console (errors to stderr) and, once setLogFile() was called, to a
     * file that is rotated when it grows past the configured size.
     */
    class Logger {
    public:
        static Logger& instance();

        void setLogFile(const std::string& path);
        void closeLogFile();
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB);
        void setConsoleOutput(bool enabled) { consoleOutput_ = enabled; }

        /**
         * @brief Parse "debug", "INFO", "warn"... Unknown names yield fallback.
         */
        static LogLevel levelFromString(const std::string& name, LogLevel fallback = LogLevel::INFO);

        bool isDebugEnabled() const { return currentLevel_ <= LogLevel::DEBUG; }
        bool isInfoEnabled() const { return currentLevel_ <= LogLevel::INFO; }
        LogLevel getLevel() const { return currentLevel_; }

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

    private:
        Logger() = default;
        ~Logger();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        std::atomic<LogLevel> currentLevel_{LogLevel::INFO};
        std::atomic<bool> consoleOutput_{true};
        size_t maxFileSizeMB_ = 50;
        size_t currentFileSize_ = 0;

        static const char* levelToString(LogLevel level);
        static std::string timestamp(const char* format);
        void rotateLocked();
    };

}
