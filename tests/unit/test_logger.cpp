#include <gtest/gtest.h>
#include "postrelay/core/logger.hpp"
#include <filesystem>
#include <fstream>

using namespace postrelay::core;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_file = "test_postrelay.log";
    }

    void TearDown() override {
        Logger::shutdown();
        if (std::filesystem::exists(log_file)) {
            std::filesystem::remove(log_file);
        }
    }

    std::string read_log() {
        Logger::get()->flush();
        std::ifstream file(log_file);
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    }

    std::string log_file;
};

TEST_F(LoggerTest, Initialize) {
    Logger::initialize(log_file, LogLevel::Debug);

    EXPECT_NE(Logger::get(), nullptr);
    EXPECT_TRUE(std::filesystem::exists(log_file));
}

TEST_F(LoggerTest, LogMessages) {
    Logger::initialize(log_file, LogLevel::Debug);

    LOG_DEBUG("Chunk uploaded. offset={}/{}", 512, 1024);
    LOG_INFO("Enqueued durable job {}", "abc");
    LOG_WARN("Transient failure on attempt {}", 2);
    LOG_ERROR("Error message");
    LOG_CRITICAL("Critical message");

    auto content = read_log();
    EXPECT_NE(content.find("Chunk uploaded. offset=512/1024"), std::string::npos);
    EXPECT_NE(content.find("Enqueued durable job abc"), std::string::npos);
    EXPECT_NE(content.find("Transient failure on attempt 2"), std::string::npos);
    EXPECT_NE(content.find("Error message"), std::string::npos);
    EXPECT_NE(content.find("Critical message"), std::string::npos);
}

TEST_F(LoggerTest, LogLevel) {
    Logger::initialize(log_file, LogLevel::Warn);

    LOG_DEBUG("Debug message");
    LOG_INFO("Info message");
    LOG_WARN("Warning message");

    auto content = read_log();
    EXPECT_EQ(content.find("Debug message"), std::string::npos);
    EXPECT_EQ(content.find("Info message"), std::string::npos);
    EXPECT_NE(content.find("Warning message"), std::string::npos);
}

TEST_F(LoggerTest, LoggingAfterShutdownIsSafe) {
    Logger::initialize(log_file, LogLevel::Info);
    Logger::shutdown();

    EXPECT_EQ(Logger::get(), nullptr);
    LOG_INFO("still fine after shutdown");
}

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(Logger::parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(Logger::parse_level(" warning "), LogLevel::Warn);
    EXPECT_EQ(Logger::parse_level("error"), LogLevel::Error);
    EXPECT_EQ(Logger::parse_level("off"), LogLevel::Off);
    EXPECT_EQ(Logger::parse_level("nonsense"), LogLevel::Info);
}
