#pragma once

#include <atomic>
#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>

namespace NetLink {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Process-wide log sink shared by the transfer and discovery threads
     *
     * Entries read `[time] [LEVEL] [Component] message`. The console copy goes
     * to stderr so command output on stdout stays clean; colors are used only
     * when stderr is a terminal. The optional log file rotates by size into
     * `<file>.1` ... `<file>.N`.
     */
    class Logger {
    public:
        static Logger& instance();

        /// Open (append) the log file; false when it cannot be opened
        bool setLogFile(const std::string& path);
        void setRotation(size_t maxSizeMB, int keepFiles);
        void setComponent(const std::string& component);
        void setLevel(LogLevel level) { currentLevel_ = level; }
        LogLevel getLevel() const { return currentLevel_; }

        /// Silence console output (file output is unaffected)
        void setConsoleEnabled(bool enabled) { consoleEnabled_ = enabled; }

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        bool enabled(LogLevel level) const { return level >= currentLevel_; }

        static bool parseLevel(const std::string& text, LogLevel& level);
        static const char* levelToString(LogLevel level);

    private:
        Logger();
        ~Logger() = default;

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        std::string defaultComponent_ = "NetLink";
        std::atomic<LogLevel> currentLevel_{LogLevel::INFO};
        std::atomic<bool> consoleEnabled_{true};
        bool colorConsole_ = false;
        size_t maxFileBytes_;
        int keepFiles_ = 3;
        size_t currentFileSize_ = 0;

        static std::string timestamp();
        void writeToFile(const std::string& entry);
        void rotate();
    };

}
