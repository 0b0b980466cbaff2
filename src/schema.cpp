// SPDX-License-Identifier: MIT

// src/schema.cpp
#include "dbxfer/schema.hpp"

#include <array>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>

namespace dbxfer {

namespace {

constexpr std::array<std::pair<DataType, std::string_view>, 13> kTypeNames = {{
    {DataType::Bool, "bool"},
    {DataType::Date, "date"},
    {DataType::Decimal, "decimal"},
    {DataType::Float32, "float32"},
    {DataType::Float64, "float64"},
    {DataType::Int16, "int16"},
    {DataType::Int32, "int32"},
    {DataType::Int64, "int64"},
    {DataType::Json, "json"},
    {DataType::Text, "text"},
    {DataType::TimestampWithoutTimeZone, "timestamp_without_time_zone"},
    {DataType::TimestampWithTimeZone, "timestamp_with_time_zone"},
    {DataType::Uuid, "uuid"},
}};

}  // namespace

std::string_view DataTypeName(DataType type) {
    for (const auto& [t, name] : kTypeNames) {
        if (t == type) return name;
    }
    return "unknown";
}

std::expected<DataType, Error> ParseDataType(std::string_view name) {
    for (const auto& [t, type_name] : kTypeNames) {
        if (type_name == name) return t;
    }
    return std::unexpected(Error{ErrorCode::InvalidArgument,
                                 fmt::format("unknown data type \"{}\"", name)});
}

const Column* Table::FindColumn(std::string_view column_name) const {
    for (const auto& column : columns) {
        if (column.name == column_name) return &column;
    }
    return nullptr;
}

std::expected<void, Error> ValidateTable(const Table& table) {
    std::unordered_set<std::string_view> seen;
    for (const auto& column : table.columns) {
        if (!seen.insert(column.name).second) {
            return std::unexpected(Error{
                ErrorCode::SchemaMismatch,
                fmt::format("duplicate column {} in table {}", column.name, table.name)});
        }
    }
    return {};
}

}  // namespace dbxfer
