#include "Logger.h"
#include "Constants.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace NetLink {

    namespace fs = std::filesystem;

    Logger& Logger::instance() {
        static Logger instance;
        return instance;
    }

    Logger::Logger()
        : colorConsole_(::isatty(STDERR_FILENO) == 1)
        , maxFileBytes_(nlk::config::MAX_LOG_FILE_SIZE_MB * 1024 * 1024)
    {
    }

    bool Logger::setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logFile_.is_open()) {
            logFile_.close();
        }
        logFilePath_ = path;
        logFile_.open(path, std::ios::app);

        std::error_code ec;
        auto size = fs::file_size(path, ec);
        currentFileSize_ = ec ? 0 : static_cast<size_t>(size);
        return logFile_.is_open();
    }

    void Logger::setRotation(size_t maxSizeMB, int keepFiles) {
        std::lock_guard<std::mutex> lock(mutex_);
        maxFileBytes_ = maxSizeMB * 1024 * 1024;
        keepFiles_ = std::max(1, keepFiles);
    }

    void Logger::setComponent(const std::string& component) {
        std::lock_guard<std::mutex> lock(mutex_);
        defaultComponent_ = component;
    }

    void Logger::log(LogLevel level, const std::string& message, const std::string& component) {
        if (!enabled(level)) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        std::string entry = "[" + timestamp() + "] [" + levelToString(level) + "] [" +
                            (component.empty() ? defaultComponent_ : component) + "] " + message;

        if (consoleEnabled_) {
            const char* color = nullptr;
            if (colorConsole_) {
                if (level >= LogLevel::ERROR) color = "\033[1;31m";
                else if (level == LogLevel::WARN) color = "\033[1;33m";
            }
            if (color) {
                std::cerr << color << entry << "\033[0m" << std::endl;
            } else {
                std::cerr << entry << std::endl;
            }
        }

        if (logFile_.is_open()) {
            writeToFile(entry);
        }
    }

    bool Logger::parseLevel(const std::string& text, LogLevel& level) {
        std::string upper = text;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (upper == "DEBUG") { level = LogLevel::DEBUG; return true; }
        if (upper == "INFO") { level = LogLevel::INFO; return true; }
        if (upper == "WARN" || upper == "WARNING") { level = LogLevel::WARN; return true; }
        if (upper == "ERROR") { level = LogLevel::ERROR; return true; }
        if (upper == "CRITICAL") { level = LogLevel::CRITICAL; return true; }
        return false;
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

    std::string Logger::timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm local{};
        localtime_r(&time, &local);
        std::ostringstream ss;
        ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    // Called with mutex_ held
    void Logger::writeToFile(const std::string& entry) {
        if (maxFileBytes_ > 0 && currentFileSize_ + entry.size() + 1 > maxFileBytes_) {
            rotate();
        }
        logFile_ << entry << '\n';
        logFile_.flush();
        currentFileSize_ += entry.size() + 1;
    }

    // Called with mutex_ held: log -> log.1 -> ... -> log.N, the oldest is dropped
    void Logger::rotate() {
        logFile_.close();

        std::error_code ec;
        fs::remove(logFilePath_ + "." + std::to_string(keepFiles_), ec);
        for (int i = keepFiles_ - 1; i >= 1; --i) {
            std::string from = logFilePath_ + "." + std::to_string(i);
            if (fs::exists(from, ec)) {
                fs::rename(from, logFilePath_ + "." + std::to_string(i + 1), ec);
            }
        }
        fs::rename(logFilePath_, logFilePath_ + ".1", ec);
        if (ec) {
            std::cerr << "Failed to rotate log file " << logFilePath_ << ": " << ec.message() << std::endl;
        }

        logFile_.open(logFilePath_, std::ios::trunc);
        currentFileSize_ = 0;
    }

}
