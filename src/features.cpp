// SPDX-License-Identifier: MIT

// src/features.cpp
#include "dbxfer/features.hpp"

#include <iterator>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace dbxfer {

namespace {

std::vector<std::string_view> IfExistsNames(IfExistsFeatures f) {
    std::vector<std::string_view> names;
    if (HasAll(f, IfExistsFeatures::Error)) names.push_back("error");
    if (HasAll(f, IfExistsFeatures::Overwrite)) names.push_back("overwrite");
    if (HasAll(f, IfExistsFeatures::Append)) names.push_back("append");
    if (HasAll(f, IfExistsFeatures::Upsert)) names.push_back("upsert-on");
    return names;
}

}  // namespace

std::string Features::Describe() const {
    std::string out;
    auto it = std::back_inserter(out);
    fmt::format_to(it, "Supported features:\n");
    if (Supports(LocatorFeatures::Schema)) fmt::format_to(it, "- schema\n");
    if (Supports(LocatorFeatures::WriteSchema)) {
        fmt::format_to(it, "- write schema\n");
        auto names = IfExistsNames(write_schema_if_exists);
        if (!names.empty()) {
            fmt::format_to(it, "  --if-exists: {}\n", fmt::join(names, " "));
        }
    }
    if (Supports(LocatorFeatures::LocalData)) {
        fmt::format_to(it, "- local data\n");
    }
    if (HasAll(source_args, SourceArgumentsFeatures::DriverArgs)) {
        fmt::format_to(it, "- source --from-arg\n");
    }
    if (HasAll(source_args, SourceArgumentsFeatures::WhereClause)) {
        fmt::format_to(it, "- source --where\n");
    }
    if (Supports(LocatorFeatures::WriteLocalData)) {
        fmt::format_to(it, "- write local data\n");
    }
    auto dest_names = IfExistsNames(dest_if_exists);
    if (!dest_names.empty()) {
        fmt::format_to(it, "- destination --if-exists: {}\n", fmt::join(dest_names, " "));
    }
    if (HasAll(dest_args, DestinationArgumentsFeatures::DriverArgs)) {
        fmt::format_to(it, "- destination --to-arg\n");
    }
    return out;
}

}  // namespace dbxfer
