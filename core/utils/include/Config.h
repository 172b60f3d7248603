#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace GlobalSend {

    /**
     * @brief Thread-safe key=value settings store.
     *
     * Files hold one "key = value" pair per line; '#' starts a comment.
     * The process-wide instance() is what the engine reads its knobs from;
     * standalone instances are handy for tests and tools.
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;

        static Config& instance();

        bool loadFromFile(const std::string& path, bool overrideExisting = true);
        /**
         * @brief Load several files in order; later files win unless overrideExisting is false.
         * @return true if at least one file was read.
         */
        bool loadLayered(const std::vector<std::string>& paths, bool overrideExisting = true);
        bool saveToFile(const std::string& path) const;

        bool hasKey(const std::string& key) const;
        void clear();

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        int getInt(const std::string& key, int defaultValue = 0) const;
        void setInt(const std::string& key, int value);

        size_t getSize(const std::string& key, size_t defaultValue = 0) const;
        void setSize(const std::string& key, size_t value);

        bool getBool(const std::string& key, bool defaultValue = false) const;
        void setBool(const std::string& key, bool value);

        /**
         * @brief Run each validator against the value stored under its key.
         * @return Keys whose value was rejected; empty when all pass.
         */
        std::vector<std::string> validate(const std::unordered_map<std::string, Validator>& schema) const;

    private:
        std::unordered_map<std::string, std::string> settings_;
        mutable std::mutex mutex_;

        static std::string trim(const std::string& value);
    };

}
