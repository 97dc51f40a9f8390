#include <gtest/gtest.h>

#include <string>

#include "core/Types.hpp"
#include "test_utils.hpp"
#include "utils/Logger.hpp"

using namespace Tmber;
using Tmber::Utils::Logger;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level = Logger::instance().get_log_level();
    }

    void TearDown() override {
        Logger::instance().set_log_level(saved_level);
    }

    LogLevel saved_level = LogLevel::LOG_WARN;
};

TEST_F(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(Logger::parse_log_level("error"), LogLevel::LOG_ERROR);
    EXPECT_EQ(Logger::parse_log_level("WARN"), LogLevel::LOG_WARN);
    EXPECT_EQ(Logger::parse_log_level("Info"), LogLevel::LOG_INFO);
    EXPECT_EQ(Logger::parse_log_level("debug"), LogLevel::LOG_DEBUG);
    EXPECT_FALSE(Logger::parse_log_level("verbose").has_value());
}

TEST_F(LoggerTest, LogFileReceivesLinesAtOrAboveLevel) {
    Test::TempDir dir;
    const std::string path = dir.file("tmber.log");

    auto& logger = Logger::instance();
    logger.set_log_file(path);
    logger.set_log_level(LogLevel::LOG_WARN);
    LOG_INFO("hidden info line");
    LOG_WARNING("visible warning line");
    LOG_ERROR("visible error line");

    std::string text = Test::read_file(path);
    EXPECT_EQ(text.find("hidden info line"), std::string::npos);
    EXPECT_NE(text.find("[WARN ] visible warning line"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] visible error line (test_logger.cpp:"), std::string::npos);
}

TEST_F(LoggerTest, UnwritableLogFile) {
    EXPECT_THROW(Logger::instance().set_log_file("/nonexistent/dir/tmber.log"), ConfigError);
}
