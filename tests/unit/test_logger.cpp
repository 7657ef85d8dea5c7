#include <gtest/gtest.h>
#include "Logger.h"
#include <filesystem>
#include <fstream>
#include <string>

using namespace NetLink;
namespace fs = std::filesystem;

TEST(LoggerTest, Singleton) {
    Logger& logger1 = Logger::instance();
    Logger& logger2 = Logger::instance();
    EXPECT_EQ(&logger1, &logger2);
}

TEST(LoggerTest, FileLoggingRespectsLevel) {
    const fs::path logFile = fs::temp_directory_path() / "netlink_test_log.txt";
    fs::remove(logFile);

    Logger& logger = Logger::instance();
    logger.setConsoleEnabled(false);
    ASSERT_TRUE(logger.setLogFile(logFile.string()));
    logger.setLevel(LogLevel::INFO);
    EXPECT_FALSE(logger.enabled(LogLevel::DEBUG));

    logger.log(LogLevel::DEBUG, "hidden debug message", "LoggerTest");
    logger.log(LogLevel::INFO, "Test info message", "LoggerTest");
    logger.log(LogLevel::ERROR, "Test error message", "LoggerTest");

    std::ifstream file(logFile);
    ASSERT_TRUE(file.is_open());

    bool foundInfo = false;
    bool foundError = false;
    bool foundDebug = false;
    std::string line;
    while (std::getline(file, line)) {
        if (line.find("Test info message") != std::string::npos) {
            foundInfo = true;
            EXPECT_NE(line.find("[INFO]"), std::string::npos);
            EXPECT_NE(line.find("[LoggerTest]"), std::string::npos);
        }
        if (line.find("Test error message") != std::string::npos) foundError = true;
        if (line.find("hidden debug message") != std::string::npos) foundDebug = true;
    }
    EXPECT_TRUE(foundInfo);
    EXPECT_TRUE(foundError);
    EXPECT_FALSE(foundDebug);

    logger.setLogFile("/dev/null");
    logger.setConsoleEnabled(true);
    fs::remove(logFile);
}

TEST(LoggerTest, RotatesIntoNumberedFiles) {
    const fs::path logFile = fs::temp_directory_path() / "netlink_rotate_log.txt";
    for (const char* suffix : {"", ".1", ".2", ".3"}) {
        fs::remove(logFile.string() + suffix);
    }

    Logger& logger = Logger::instance();
    logger.setConsoleEnabled(false);
    logger.setLevel(LogLevel::INFO);
    logger.setRotation(1, 2);
    ASSERT_TRUE(logger.setLogFile(logFile.string()));

    const std::string line(1000, 'x');
    for (int i = 0; i < 3000; ++i) {
        logger.log(LogLevel::INFO, line, "LoggerTest");
    }

    EXPECT_TRUE(fs::exists(logFile));
    EXPECT_TRUE(fs::exists(logFile.string() + ".1"));
    EXPECT_TRUE(fs::exists(logFile.string() + ".2"));
    EXPECT_FALSE(fs::exists(logFile.string() + ".3"));
    EXPECT_LE(fs::file_size(logFile), 1024u * 1024u);

    logger.setLogFile("/dev/null");
    logger.setRotation(100, 3);
    logger.setConsoleEnabled(true);
    for (const char* suffix : {"", ".1", ".2"}) {
        fs::remove(logFile.string() + suffix);
    }
}

TEST(LoggerTest, ParseLevel) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(Logger::parseLevel("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(Logger::parseLevel("WARNING", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_FALSE(Logger::parseLevel("loud", level));
    EXPECT_EQ(level, LogLevel::WARN);
}
