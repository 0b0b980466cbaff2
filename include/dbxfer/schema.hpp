// SPDX-License-Identifier: MIT

// include/dbxfer/schema.hpp
#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dbxfer/error.hpp"

namespace dbxfer {

/// Portable column types.  Drivers map their native types onto this set,
/// lossily where the native system has no exact counterpart.
enum class DataType {
    Bool,
    Date,
    Decimal,
    Float32,
    Float64,
    Int16,
    Int32,
    Int64,
    Json,
    Text,
    TimestampWithoutTimeZone,
    TimestampWithTimeZone,
    Uuid,
};

/// Portable spelling of a data type ("int64", "timestamp_with_time_zone", ...).
std::string_view DataTypeName(DataType type);

/// Inverse of DataTypeName.
std::expected<DataType, Error> ParseDataType(std::string_view name);

struct Column {
    std::string name;
    DataType data_type = DataType::Text;
    bool is_nullable = true;
    std::optional<std::string> comment;

    bool operator==(const Column&) const = default;
};

struct Table {
    std::string name;
    std::vector<Column> columns;

    /// Find a column by name.
    const Column* FindColumn(std::string_view column_name) const;

    bool operator==(const Table&) const = default;
};

/// Check table invariants (column names unique).
std::expected<void, Error> ValidateTable(const Table& table);

}  // namespace dbxfer
