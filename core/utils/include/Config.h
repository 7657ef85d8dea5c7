#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <mutex>

namespace NetLink {

    /**
     * @brief Layered key=value configuration store
     *
     * Lines are `key = value`; `#` starts a comment, also after a value.
     * Files loaded later override earlier ones unless overrideExisting is
     * false. Each value remembers where it came from so validation errors
     * can point at the offending file.
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;
        Config(const Config& other);
        Config& operator=(const Config& other);

        bool loadFromFile(const std::string& path, bool overrideExisting = true);

        /// Load every readable file in order; false when none could be read
        bool loadLayered(const std::vector<std::string>& paths, bool overrideExisting = true);

        bool hasKey(const std::string& key) const;

        /// File the value was read from, or the origin passed to set()
        std::string originOf(const std::string& key) const;

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value, const std::string& origin = "command line");

        int getInt(const std::string& key, int defaultValue = 0) const;
        void setInt(const std::string& key, int value);

        size_t getSize(const std::string& key, size_t defaultValue = 0) const;

        bool getBool(const std::string& key, bool defaultValue = false) const;
        void setBool(const std::string& key, bool value);

        /// Comma separated value, items trimmed, empty items dropped
        std::vector<std::string> getList(const std::string& key) const;

        /// Checks keys in alphabetical order; names the first offender in failedKey
        bool validate(const std::map<std::string, Validator>& schema,
                      std::string* failedKey = nullptr) const;

    private:
        struct Entry {
            std::string value;
            std::string origin;
        };

        std::map<std::string, Entry> settings_;
        mutable std::mutex mutex_;

        static std::string trim(const std::string& value);
        static std::string stripComment(const std::string& line);
    };

}
