// SPDX-License-Identifier: MIT

// include/dbxfer/drivers/csv_locator.hpp
#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "dbxfer/locator.hpp"
#include "dbxfer/path_or_stdio.hpp"

namespace dbxfer {

/// A CSV file, a directory tree of CSV files, or stdin/stdout ("csv:-").
///
/// As a source, every *.csv or *.CSV file under the path is one partition,
/// named by its path relative to the base without the extension. As a
/// destination, a path ending in '/' receives one <name>.csv per partition;
/// any other path (or stdout) receives all partitions joined under a single
/// header.
class CsvLocator : public Locator {
public:
    static constexpr std::string_view kScheme = "csv:";

    explicit CsvLocator(PathOrStdio path) : path_(std::move(path)) {}

    static std::expected<CsvLocator, Error> Parse(std::string_view s);
    static Features StaticFeatures();

    const PathOrStdio& path() const { return path_; }

    std::string_view Scheme() const override { return kScheme; }
    std::string ToString() const override { return path_.ToLocator(kScheme); }
    Features GetFeatures() const override { return StaticFeatures(); }

    /// Reads only the header line. Every column is nullable text and the
    /// table is named after the file.
    asio::awaitable<std::optional<Table>> Schema(Context ctx) const override;

    asio::awaitable<std::optional<BoxStream<CsvStream>>> LocalData(
        Context ctx, SharedArguments shared, SourceArguments source) const override;

    asio::awaitable<BoxStream<asio::awaitable<void>>> WriteLocalData(
        Context ctx, BoxStream<CsvStream> data, SharedArguments shared,
        DestinationArguments dest) const override;

private:
    PathOrStdio path_;
};

/// Every CSV file under @p base, depth-first, following symbolic links.
/// @throws TransferError{StructuralError} for anything that is neither a
///         directory nor a file named *.csv or *.CSV.
std::vector<std::filesystem::path> FindCsvFiles(const Context& ctx,
                                                const std::filesystem::path& base);

}  // namespace dbxfer
