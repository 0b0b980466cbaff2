// SPDX-License-Identifier: MIT

// include/dbxfer/drivers/bigquery_schema_locator.hpp
#pragma once

#include <expected>
#include <string>
#include <string_view>

#include "dbxfer/locator.hpp"
#include "dbxfer/path_or_stdio.hpp"

namespace dbxfer {

/// A BigQuery JSON schema file: an array of {"name", "type", "mode"} column
/// records. Holds a schema only, never data.
class BigQuerySchemaLocator : public Locator {
public:
    static constexpr std::string_view kScheme = "bigquery-schema:";

    explicit BigQuerySchemaLocator(PathOrStdio path) : path_(std::move(path)) {}

    static std::expected<BigQuerySchemaLocator, Error> Parse(std::string_view s);
    static Features StaticFeatures();

    std::string_view Scheme() const override { return kScheme; }
    std::string ToString() const override { return path_.ToLocator(kScheme); }
    Features GetFeatures() const override { return StaticFeatures(); }

    /// The document names no table, so the result is called "unnamed".
    asio::awaitable<std::optional<Table>> Schema(Context ctx) const override;

    /// The table name is dropped.
    asio::awaitable<void> WriteSchema(Context ctx, Table table, IfExists if_exists) const override;

private:
    PathOrStdio path_;
};

/// Parse a BigQuery schema document into columns of a table named "unnamed".
std::expected<Table, Error> ParseBigQuerySchema(std::string_view json,
                                                std::string_view description);

/// Render the columns of @p table as a BigQuery schema document.
std::string FormatBigQuerySchema(const Table& table);

}  // namespace dbxfer
