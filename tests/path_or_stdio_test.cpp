// SPDX-License-Identifier: MIT

// tests/path_or_stdio_test.cpp
#include <gtest/gtest.h>

#include "dbxfer/path_or_stdio.hpp"

namespace dbxfer {
namespace {

TEST(PathOrStdioTest, ParseStdio) {
    auto parsed = PathOrStdio::Parse("csv:", "csv:-");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->is_stdio());
    EXPECT_FALSE(parsed->is_directory());
    EXPECT_EQ(parsed->ToLocator("csv:"), "csv:-");
}

TEST(PathOrStdioTest, ParsePath) {
    auto parsed = PathOrStdio::Parse("csv:", "csv:/tmp/trades.csv");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_FALSE(parsed->is_stdio());
    EXPECT_EQ(parsed->path(), "/tmp/trades.csv");
    EXPECT_FALSE(parsed->is_directory());
    EXPECT_EQ(parsed->ToLocator("csv:"), "csv:/tmp/trades.csv");
}

TEST(PathOrStdioTest, TrailingSlashIsDirectory) {
    auto parsed = PathOrStdio::Parse("csv:", "csv:out/");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->is_directory());
    EXPECT_EQ(parsed->ToLocator("csv:"), "csv:out/");
}

TEST(PathOrStdioTest, WrongScheme) {
    auto parsed = PathOrStdio::Parse("csv:", "bigquery-schema:x.json");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, ErrorCode::InvalidLocator);
    EXPECT_EQ(parsed.error().message, "expected bigquery-schema:x.json to begin with csv:");
}

TEST(PathOrStdioTest, MissingPath) {
    auto parsed = PathOrStdio::Parse("csv:", "csv:");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().message, "missing path in csv:");
}

TEST(PathOrStdioTest, Factories) {
    EXPECT_TRUE(PathOrStdio::Stdio().is_stdio());
    EXPECT_EQ(PathOrStdio::Path("schema.json").ToLocator("bigquery-schema:"),
              "bigquery-schema:schema.json");
}

}  // namespace
}  // namespace dbxfer
