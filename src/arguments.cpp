// SPDX-License-Identifier: MIT

// src/arguments.cpp
#include "dbxfer/arguments.hpp"

#include <fmt/format.h>

namespace dbxfer {

std::expected<DriverArgs, Error> DriverArgs::Parse(const std::vector<std::string>& raw) {
    DriverArgs result;
    for (const auto& item : raw) {
        auto eq = item.find('=');
        if (eq == std::string::npos || eq == 0) {
            return std::unexpected(Error{ErrorCode::InvalidArgument,
                                         fmt::format("expected key=value, found {}", item)});
        }
        result.Add(item.substr(0, eq), item.substr(eq + 1));
    }
    return result;
}

std::optional<std::string> DriverArgs::Get(std::string_view key) const {
    std::optional<std::string> found;
    for (const auto& [k, v] : args_) {
        if (k == key) found = v;
    }
    return found;
}

std::expected<void, Error> Query::FailIfQueryDetailsProvided() const {
    if (where_clause) {
        return std::unexpected(Error{ErrorCode::UnsupportedFeature,
                                     "this data source does not support --where"});
    }
    return {};
}

std::optional<std::string> TemporaryStorage::FindScheme(std::string_view scheme) const {
    for (const auto& location : locations_) {
        if (std::string_view(location).starts_with(scheme)) return location;
    }
    return std::nullopt;
}

std::expected<void, Error> SourceArguments::Verify(SourceArgumentsFeatures features) const {
    if (!driver_args.empty() && !HasAll(features, SourceArgumentsFeatures::DriverArgs)) {
        return std::unexpected(Error{ErrorCode::UnsupportedFeature,
                                     "this data source does not support --from-arg"});
    }
    if (query.where_clause && !HasAll(features, SourceArgumentsFeatures::WhereClause)) {
        return query.FailIfQueryDetailsProvided();
    }
    return {};
}

std::expected<void, Error> DestinationArguments::Verify(const Features& features) const {
    if (!driver_args.empty() &&
        !HasAll(features.dest_args, DestinationArgumentsFeatures::DriverArgs)) {
        return std::unexpected(Error{ErrorCode::UnsupportedFeature,
                                     "this data destination does not support --to-arg"});
    }
    if (!features.SupportsDestIfExists(if_exists)) {
        return std::unexpected(Error{
            ErrorCode::UnsupportedFeature,
            fmt::format("this data destination does not support --if-exists={}",
                        if_exists.ToString())});
    }
    return {};
}

}  // namespace dbxfer
