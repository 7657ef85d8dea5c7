#include "Config.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace NetLink {

    Config::Config(const Config& other) {
        std::lock_guard<std::mutex> lock(other.mutex_);
        settings_ = other.settings_;
    }

    Config& Config::operator=(const Config& other) {
        if (this != &other) {
            std::map<std::string, Entry> copy;
            {
                std::lock_guard<std::mutex> lock(other.mutex_);
                copy = other.settings_;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            settings_ = std::move(copy);
        }
        return *this;
    }

    bool Config::loadFromFile(const std::string& path, bool overrideExisting) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        std::map<std::string, std::string> parsed;
        std::string line;
        while (std::getline(file, line)) {
            std::string content = trim(stripComment(line));
            size_t eq = content.find('=');
            if (content.empty() || eq == std::string::npos) continue;

            std::string key = trim(content.substr(0, eq));
            if (!key.empty()) {
                parsed[key] = trim(content.substr(eq + 1));
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [key, value] : parsed) {
            if (!overrideExisting && settings_.count(key) > 0) continue;
            settings_[key] = Entry{std::move(value), path};
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

    bool Config::hasKey(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settings_.count(key) > 0;
    }

    std::string Config::originOf(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = settings_.find(key);
        return it != settings_.end() ? it->second.origin : "";
    }

    std::string Config::get(const std::string& key, const std::string& defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = settings_.find(key);
        return it != settings_.end() ? it->second.value : defaultValue;
    }

    void Config::set(const std::string& key, const std::string& value, const std::string& origin) {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_[key] = Entry{value, origin};
    }

    int Config::getInt(const std::string& key, int defaultValue) const {
        std::string val = get(key, "");
        if (val.empty()) return defaultValue;
        try {
            size_t used = 0;
            int parsed = std::stoi(val, &used);
            return used == val.size() ? parsed : defaultValue;
        } catch (const std::exception&) {
            return defaultValue;
        }
    }

    void Config::setInt(const std::string& key, int value) {
        set(key, std::to_string(value));
    }

    size_t Config::getSize(const std::string& key, size_t defaultValue) const {
        std::string val = get(key, "");
        if (val.empty() || val[0] == '-') return defaultValue;
        try {
            size_t used = 0;
            auto parsed = std::stoull(val, &used);
            return used == val.size() ? static_cast<size_t>(parsed) : defaultValue;
        } catch (const std::exception&) {
            return defaultValue;
        }
    }

    bool Config::getBool(const std::string& key, bool defaultValue) const {
        std::string val = get(key, "");
        std::transform(val.begin(), val.end(), val.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (val == "1" || val == "true" || val == "yes" || val == "on") return true;
        if (val == "0" || val == "false" || val == "no" || val == "off") return false;
        return defaultValue;
    }

    void Config::setBool(const std::string& key, bool value) {
        set(key, value ? "true" : "false");
    }

    std::vector<std::string> Config::getList(const std::string& key) const {
        std::vector<std::string> items;
        std::stringstream ss(get(key, ""));
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = trim(item);
            if (!item.empty()) {
                items.push_back(item);
            }
        }
        return items;
    }

    bool Config::validate(const std::map<std::string, Validator>& schema, std::string* failedKey) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, validator] : schema) {
            auto it = settings_.find(key);
            if (it == settings_.end() || !validator) continue;
            if (!validator(key, it->second.value)) {
                if (failedKey) *failedKey = key;
                return false;
            }
        }
        return true;
    }

    std::string Config::trim(const std::string& value) {
        auto start = value.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        auto end = value.find_last_not_of(" \t\r\n");
        return value.substr(start, end - start + 1);
    }

    std::string Config::stripComment(const std::string& line) {
        // '#' opens a comment at line start or after whitespace; "a#b" stays a value
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '#' && (i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1])))) {
                return line.substr(0, i);
            }
        }
        return line;
    }

}
