// SPDX-License-Identifier: MIT

// include/dbxfer/json.hpp
#pragma once

#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <rapidjson/error/en.h>
#include <rapidjson/memorystream.h>
#include <rapidjson/reader.h>

#include "dbxfer/error.hpp"

namespace dbxfer {

// Builder concept - types that can incrementally build a result from JSON events
template <typename B>
concept JsonBuilder = requires(B& b, std::string_view sv, int64_t i, uint64_t u,
                               double d, bool bl) {
    typename B::Result;
    { b.OnKey(sv) } -> std::same_as<void>;
    { b.OnString(sv) } -> std::same_as<void>;
    { b.OnInt(i) } -> std::same_as<void>;
    { b.OnUint(u) } -> std::same_as<void>;
    { b.OnDouble(d) } -> std::same_as<void>;
    { b.OnBool(bl) } -> std::same_as<void>;
    { b.OnNull() } -> std::same_as<void>;
    { b.OnStartObject() } -> std::same_as<void>;
    { b.OnEndObject() } -> std::same_as<void>;
    { b.OnStartArray() } -> std::same_as<void>;
    { b.OnEndArray() } -> std::same_as<void>;
    { b.Build() } -> std::same_as<std::expected<typename B::Result, std::string>>;
};

namespace detail {

// RapidJSON SAX handler that forwards to a Builder
template <JsonBuilder Builder>
struct SaxHandler : public rapidjson::BaseReaderHandler<rapidjson::UTF8<>, SaxHandler<Builder>> {
    Builder& builder;

    explicit SaxHandler(Builder& b) : builder(b) {}

    bool Null() {
        builder.OnNull();
        return true;
    }
    bool Bool(bool b) {
        builder.OnBool(b);
        return true;
    }
    bool Int(int i) {
        builder.OnInt(static_cast<int64_t>(i));
        return true;
    }
    bool Uint(unsigned u) {
        builder.OnUint(static_cast<uint64_t>(u));
        return true;
    }
    bool Int64(int64_t i) {
        builder.OnInt(i);
        return true;
    }
    bool Uint64(uint64_t u) {
        builder.OnUint(u);
        return true;
    }
    bool Double(double d) {
        builder.OnDouble(d);
        return true;
    }
    bool String(const char* str, rapidjson::SizeType length, bool /*copy*/) {
        builder.OnString(std::string_view(str, length));
        return true;
    }
    bool Key(const char* str, rapidjson::SizeType length, bool /*copy*/) {
        builder.OnKey(std::string_view(str, length));
        return true;
    }
    bool StartObject() {
        builder.OnStartObject();
        return true;
    }
    bool EndObject(rapidjson::SizeType /*memberCount*/) {
        builder.OnEndObject();
        return true;
    }
    bool StartArray() {
        builder.OnStartArray();
        return true;
    }
    bool EndArray(rapidjson::SizeType /*elementCount*/) {
        builder.OnEndArray();
        return true;
    }
};

}  // namespace detail

/// Parse a complete JSON document, feeding SAX events to @p builder.
/// @p description names the document in error messages.
template <JsonBuilder Builder>
std::expected<typename Builder::Result, Error> ParseJson(std::string_view json, Builder& builder,
                                                         std::string_view description) {
    detail::SaxHandler<Builder> handler(builder);
    rapidjson::Reader reader;
    rapidjson::MemoryStream stream(json.data(), json.size());

    auto result = reader.Parse(stream, handler);
    if (result.IsError()) {
        return std::unexpected(Error{
            ErrorCode::ParseError,
            fmt::format("error parsing {}: parse error at offset {}: {}", description,
                        result.Offset(), rapidjson::GetParseError_En(result.Code()))});
    }

    auto built = builder.Build();
    if (!built) {
        return std::unexpected(Error{
            ErrorCode::ParseError,
            fmt::format("error parsing {}: {}", description, built.error())});
    }
    return std::move(*built);
}

}  // namespace dbxfer
