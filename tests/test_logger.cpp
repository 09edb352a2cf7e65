#include <gtest/gtest.h>
#include "core/logger.hpp"
#include <fstream>
#include <filesystem>

using namespace sproc_mapper::core;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}

} // anonymous namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (std::filesystem::exists("test.log")) {
            std::filesystem::remove("test.log");
        }

        previous_level_ = Logger::instance().level();
        Logger::instance().set_level(LogLevel::TRACE);
        Logger::instance().set_console_enabled(false);
    }

    void TearDown() override {
        Logger::instance().set_output("");
        Logger::instance().set_level(previous_level_);
        Logger::instance().set_console_enabled(true);
        if (std::filesystem::exists("test.log")) {
            std::filesystem::remove("test.log");
        }
    }

    LogLevel previous_level_ = LogLevel::INFO;
};

TEST_F(LoggerTest, BasicLogging) {
    Logger::instance().set_output("test.log");

    LOG_INFO("Test info message");
    LOG_WARN("Test warning message");
    LOG_ERROR("Test error message");

    ASSERT_TRUE(std::filesystem::exists("test.log"));

    auto content = read_file("test.log");
    EXPECT_NE(content.find("Test info message"), std::string::npos);
    EXPECT_NE(content.find("Test warning message"), std::string::npos);
    EXPECT_NE(content.find("Test error message"), std::string::npos);
}

TEST_F(LoggerTest, RecordCarriesLevelAndFunction) {
    Logger::instance().set_output("test.log");

    LOG_WARN("Error: parsing age: not a number");

    auto content = read_file("test.log");
    EXPECT_NE(content.find("[ WARN]"), std::string::npos);
    EXPECT_NE(content.find("test_logger.cpp"), std::string::npos);
    EXPECT_NE(content.find("Error: parsing age"), std::string::npos);
}

TEST_F(LoggerTest, LogLevelFiltering) {
    Logger::instance().set_output("test.log");
    Logger::instance().set_level(LogLevel::WARN);

    LOG_TRACE("Should not appear");
    LOG_DEBUG("Should not appear");
    LOG_INFO("Should not appear");
    LOG_WARN("Should appear");
    LOG_ERROR("Should appear");

    auto content = read_file("test.log");
    EXPECT_EQ(content.find("Should not appear"), std::string::npos);
    EXPECT_NE(content.find("Should appear"), std::string::npos);
}

TEST_F(LoggerTest, BranchLogging) {
    Logger::instance().set_output("test.log");
    Logger::instance().set_level(LogLevel::DEBUG);

    bool condition_true = true;
    bool condition_false = false;

    LOG_IF(condition_true, "Condition was true", "Condition was false");
    LOG_IF(condition_false, "Condition was true", "Condition was false");

    auto content = read_file("test.log");
    EXPECT_NE(content.find("BRANCH: TRUE"), std::string::npos);
    EXPECT_NE(content.find("BRANCH: FALSE"), std::string::npos);
    EXPECT_NE(content.find("Condition was true"), std::string::npos);
    EXPECT_NE(content.find("Condition was false"), std::string::npos);
}

TEST_F(LoggerTest, BranchLoggingSuppressedAboveDebug) {
    Logger::instance().set_output("test.log");
    Logger::instance().set_level(LogLevel::INFO);

    LOG_IF(true, "Hidden branch");

    auto content = read_file("test.log");
    EXPECT_EQ(content.find("Hidden branch"), std::string::npos);
}

TEST(LogLevelTest, ParseKnownNames) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::TRACE);
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level(" Info "), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("fatal"), LogLevel::FATAL);
}

TEST(LogLevelTest, ParseUnknownName) {
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_FALSE(parse_log_level("").has_value());
}

TEST(LogLevelTest, Names) {
    EXPECT_STREQ(log_level_name(LogLevel::WARN), "WARN");
    EXPECT_STREQ(log_level_name(LogLevel::TRACE), "TRACE");
}
