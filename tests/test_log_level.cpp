/**
 * @file test_log_level.cpp
 * @brief Log level name parsing
 */

#include <gtest/gtest.h>

#include "LogLevel.h"

TEST(LogLevel, ParsesNames)
{
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parseLogLevel("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parseLogLevel("WARN", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(parseLogLevel("Error", level));
    EXPECT_EQ(level, LogLevel::ERROR);
}

TEST(LogLevel, RejectsUnknownName)
{
    LogLevel level = LogLevel::INFO;
    EXPECT_FALSE(parseLogLevel("loud", level));
    EXPECT_EQ(level, LogLevel::INFO);
}

TEST(LogLevel, NamesRoundTrip)
{
    for (LogLevel l : {LogLevel::ERROR, LogLevel::WARN, LogLevel::INFO, LogLevel::DEBUG}) {
        LogLevel parsed = LogLevel::INFO;
        ASSERT_TRUE(parseLogLevel(logLevelName(l), parsed));
        EXPECT_EQ(parsed, l);
    }
}
