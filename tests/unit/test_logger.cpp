#include <gtest/gtest.h>
#include "peerdrop/core/logger.hpp"
#include <filesystem>
#include <fstream>

using namespace peerdrop::core;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_file = "test_peerdrop.log";
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
    
    LOG_DEBUG("Debug message: {}", 123);
    LOG_INFO("Info message: {}", "test");
    LOG_WARN("Warning message");
    LOG_ERROR("Error message");
    LOG_CRITICAL("Critical message");
    
    auto content = read_log();
    
    EXPECT_NE(content.find("Debug message: 123"), std::string::npos);
    EXPECT_NE(content.find("Info message: test"), std::string::npos);
    EXPECT_NE(content.find("Warning message"), std::string::npos);
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

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::parse_level(" WARNING "), LogLevel::Warn);
    EXPECT_EQ(Logger::parse_level("off"), LogLevel::Off);
    EXPECT_EQ(Logger::parse_level("chatty"), LogLevel::Info);
    EXPECT_EQ(Logger::parse_level("chatty", LogLevel::Error), LogLevel::Error);
}

TEST_F(LoggerTest, UsableAfterShutdown) {
    Logger::initialize(log_file, LogLevel::Info);
    Logger::shutdown();
    
    EXPECT_EQ(Logger::get(), nullptr);
    EXPECT_NO_THROW(LOG_INFO("still routed to the console"));
}
