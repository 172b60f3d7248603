#include "Config.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>

namespace GlobalSend {

    Config& Config::instance() {
        static Config instance;
        return instance;
    }

    bool Config::loadFromFile(const std::string& path, bool overrideExisting) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        std::vector<std::pair<std::string, std::string>> parsed;
        std::string line;
        while (std::getline(file, line)) {
            auto trimmed = trim(line);
            if (trimmed.empty() || trimmed[0] == '#') continue;

            auto eq = trimmed.find('=');
            if (eq == std::string::npos) continue;

            std::string key = trim(trimmed.substr(0, eq));
            if (!key.empty()) {
                parsed.emplace_back(std::move(key), trim(trimmed.substr(eq + 1)));
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [key, value] : parsed) {
            if (overrideExisting || settings_.find(key) == settings_.end()) {
                settings_[key] = value;
            }
        }
        return true;
    }

    bool Config::loadLayered(const std::vector<std::string>& paths, bool overrideExisting) {
        bool loaded = false;
        for (const auto& path : paths) {
            loaded = loadFromFile(path, overrideExisting) || loaded;
        }
        return loaded;
    }

    bool Config::saveToFile(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open()) {
            return false;
        }
        // Sorted so saved files diff cleanly.
        std::map<std::string, std::string> ordered(settings_.begin(), settings_.end());
        for (const auto& [key, value] : ordered) {
            file << key << " = " << value << '\n';
        }
        return static_cast<bool>(file);
    }

    bool Config::hasKey(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settings_.count(key) != 0;
    }

    void Config::clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_.clear();
    }

    std::string Config::get(const std::string& key, const std::string& defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = settings_.find(key);
        return it != settings_.end() ? it->second : defaultValue;
    }

    void Config::set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_[key] = value;
    }

    int Config::getInt(const std::string& key, int defaultValue) const {
        std::string val = get(key);
        if (val.empty()) return defaultValue;
        try {
            return std::stoi(val);
        } catch (const std::exception&) {
            return defaultValue;
        }
    }

    void Config::setInt(const std::string& key, int value) {
        set(key, std::to_string(value));
    }

    size_t Config::getSize(const std::string& key, size_t defaultValue) const {
        std::string val = get(key);
        if (val.empty() || val[0] == '-') return defaultValue;
        try {
            return static_cast<size_t>(std::stoull(val));
        } catch (const std::exception&) {
            return defaultValue;
        }
    }

    void Config::setSize(const std::string& key, size_t value) {
        set(key, std::to_string(value));
    }

    bool Config::getBool(const std::string& key, bool defaultValue) const {
        std::string val = get(key);
        std::transform(val.begin(), val.end(), val.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (val == "1" || val == "true" || val == "yes" || val == "on") return true;
        if (val == "0" || val == "false" || val == "no" || val == "off") return false;
        return defaultValue;
    }

    void Config::setBool(const std::string& key, bool value) {
        set(key, value ? "true" : "false");
    }

    std::vector<std::string> Config::validate(const std::unordered_map<std::string, Validator>& schema) const {
        std::vector<std::string> rejected;
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, validator] : schema) {
            auto it = settings_.find(key);
            if (it != settings_.end() && validator && !validator(key, it->second)) {
                rejected.push_back(key);
            }
        }
        std::sort(rejected.begin(), rejected.end());
        return rejected;
    }

    std::string Config::trim(const std::string& value) {
        auto start = value.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        auto end = value.find_last_not_of(" \t\r\n");
        return value.substr(start, end - start + 1);
    }

}
