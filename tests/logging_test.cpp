// SPDX-License-Identifier: MIT

// tests/logging_test.cpp
#include <gtest/gtest.h>

#include "dbxfer/logging.hpp"

namespace dbxfer {
namespace {

TEST(LoggingTest, ParseLogLevel) {
    EXPECT_EQ(ParseLogLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(ParseLogLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(ParseLogLevel("info"), spdlog::level::info);
    EXPECT_EQ(ParseLogLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(ParseLogLevel("error"), spdlog::level::err);
    EXPECT_EQ(ParseLogLevel("off"), spdlog::level::off);
}

TEST(LoggingTest, ParseUnknownLevel) {
    auto level = ParseLogLevel("INFO");
    ASSERT_FALSE(level.has_value());
    EXPECT_EQ(level.error().code, ErrorCode::InvalidArgument);
}

TEST(LoggingTest, MakeLogger) {
    auto logger = MakeLogger("dbxfer-test", spdlog::level::warn);
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), "dbxfer-test");
    EXPECT_TRUE(logger->should_log(spdlog::level::err));
    EXPECT_FALSE(logger->should_log(spdlog::level::info));
}

TEST(LoggingTest, LoggersAreIndependent) {
    auto quiet = MakeLogger("quiet", spdlog::level::off);
    auto loud = MakeLogger("loud", spdlog::level::trace);
    EXPECT_FALSE(quiet->should_log(spdlog::level::err));
    EXPECT_TRUE(loud->should_log(spdlog::level::trace));
}

}  // namespace
}  // namespace dbxfer
