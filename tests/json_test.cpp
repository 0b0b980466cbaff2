// SPDX-License-Identifier: MIT

// tests/json_test.cpp
#include <gtest/gtest.h>

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "dbxfer/json.hpp"

namespace dbxfer {
namespace {

// Simple builder that extracts {"value": N} from JSON
struct IntBuilder {
    using Result = int64_t;
    std::optional<int64_t> value;
    std::string current_key;

    void OnKey(std::string_view key) { current_key = key; }
    void OnInt(int64_t v) {
        if (current_key == "value") value = v;
    }
    void OnUint(uint64_t v) {
        if (current_key == "value") value = static_cast<int64_t>(v);
    }
    void OnString(std::string_view) {}
    void OnDouble(double) {}
    void OnBool(bool) {}
    void OnNull() {}
    void OnStartObject() {}
    void OnEndObject() {}
    void OnStartArray() {}
    void OnEndArray() {}

    std::expected<Result, std::string> Build() {
        if (!value) return std::unexpected("missing 'value'");
        return *value;
    }
};

// Records every event, to check what the SAX handler forwards.
struct EventBuilder {
    using Result = std::vector<std::string>;
    std::vector<std::string> events;

    void OnKey(std::string_view key) { events.push_back("key:" + std::string(key)); }
    void OnString(std::string_view s) { events.push_back("str:" + std::string(s)); }
    void OnInt(int64_t v) { events.push_back("int:" + std::to_string(v)); }
    void OnUint(uint64_t v) { events.push_back("uint:" + std::to_string(v)); }
    void OnDouble(double) { events.push_back("double"); }
    void OnBool(bool b) { events.push_back(b ? "true" : "false"); }
    void OnNull() { events.push_back("null"); }
    void OnStartObject() { events.push_back("{"); }
    void OnEndObject() { events.push_back("}"); }
    void OnStartArray() { events.push_back("["); }
    void OnEndArray() { events.push_back("]"); }

    std::expected<Result, std::string> Build() { return events; }
};

TEST(JsonTest, ParsesSimpleObject) {
    IntBuilder builder;
    auto result = ParseJson(R"({"value": 42})", builder, "test document");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 42);
}

TEST(JsonTest, ForwardsEvents) {
    EventBuilder builder;
    auto result = ParseJson(R"([{"name":"id","n":-1,"ok":true,"x":null,"d":1.5}])", builder, "doc");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, (std::vector<std::string>{"[", "{", "key:name", "str:id", "key:n", "int:-1",
                                                  "key:ok", "true", "key:x", "null", "key:d",
                                                  "double", "}", "]"}));
}

TEST(JsonTest, SyntaxErrorHasOffset) {
    IntBuilder builder;
    auto result = ParseJson(R"({"value": })", builder, "schema.json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ParseError);
    EXPECT_TRUE(
        result.error().message.starts_with("error parsing schema.json: parse error at offset"))
        << result.error().message;
}

TEST(JsonTest, BuilderErrorIsReported) {
    IntBuilder builder;
    auto result = ParseJson(R"({"other": 1})", builder, "schema.json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message, "error parsing schema.json: missing 'value'");
}

TEST(JsonTest, EmptyInput) {
    IntBuilder builder;
    EXPECT_FALSE(ParseJson("", builder, "stdin").has_value());
}

}  // namespace
}  // namespace dbxfer
