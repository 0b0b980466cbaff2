// SPDX-License-Identifier: MIT

// include/dbxfer/arguments.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "dbxfer/error.hpp"
#include "dbxfer/features.hpp"
#include "dbxfer/if_exists.hpp"
#include "dbxfer/schema.hpp"

namespace dbxfer {

/// Driver-specific key=value options, passed through uninterpreted.
class DriverArgs {
public:
    DriverArgs() = default;

    /// Parse a list of "key=value" strings.
    static std::expected<DriverArgs, Error> Parse(const std::vector<std::string>& raw);

    bool empty() const { return args_.empty(); }
    const std::vector<std::pair<std::string, std::string>>& items() const { return args_; }

    /// Value of the last occurrence of @p key.
    std::optional<std::string> Get(std::string_view key) const;

    void Add(std::string key, std::string value) {
        args_.emplace_back(std::move(key), std::move(value));
    }

    bool operator==(const DriverArgs&) const = default;

private:
    std::vector<std::pair<std::string, std::string>> args_;
};

/// Opaque selection passed to sources that can filter.
struct Query {
    std::optional<std::string> where_clause;

    /// Fail with UnsupportedFeature if any query detail was given.
    std::expected<void, Error> FailIfQueryDetailsProvided() const;
};

/// Candidate locations for intermediate data, each a locator string.
class TemporaryStorage {
public:
    TemporaryStorage() = default;
    explicit TemporaryStorage(std::vector<std::string> locations)
        : locations_(std::move(locations)) {}

    const std::vector<std::string>& locations() const { return locations_; }

    /// First location starting with @p scheme (for example "s3:").
    std::optional<std::string> FindScheme(std::string_view scheme) const;

private:
    std::vector<std::string> locations_;
};

/// Arguments seen by both ends of a transfer.
struct SharedArguments {
    Table schema;
    TemporaryStorage temporary_storage;
    std::size_t max_streams = 4;
};

/// Arguments for the source end.
struct SourceArguments {
    DriverArgs driver_args;
    Query query;

    /// Check every provided argument against what the source accepts.
    std::expected<void, Error> Verify(SourceArgumentsFeatures features) const;
};

/// Arguments for the destination end.
struct DestinationArguments {
    DriverArgs driver_args;
    IfExists if_exists;

    /// Check every provided argument against what the destination accepts.
    std::expected<void, Error> Verify(const Features& features) const;
};

}  // namespace dbxfer
