#include <gtest/gtest.h>

#include "footfall/core/logger.hpp"

using namespace footfall;

TEST(LogLevelTest, ParseNames) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::TRACE);
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("Warning"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("critical"), LogLevel::CRITICAL);
    EXPECT_EQ(parse_log_level("off"), LogLevel::OFF);
}

TEST(LogLevelTest, UnknownNameIsInfo) {
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level(""), LogLevel::INFO);
}

TEST(LoggerTest, ModuleLoggersAreCached) {
    ASSERT_TRUE(Logger::init("", LogLevel::OFF, LogLevel::OFF));

    auto tracker = Logger::get("tracker");
    ASSERT_NE(tracker, nullptr);
    EXPECT_EQ(tracker->name(), "tracker");
    EXPECT_EQ(Logger::get("tracker"), tracker);
    EXPECT_NE(Logger::get("sessions"), tracker);

    FOOTFALL_LOG_INFO("tracker", "track {} created", 1);
    Logger::flush();
}
