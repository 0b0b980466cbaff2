// SPDX-License-Identifier: MIT

// src/if_exists.cpp
#include "dbxfer/if_exists.hpp"

#include <fcntl.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "dbxfer/context.hpp"

namespace dbxfer {

std::expected<IfExists, Error> IfExists::Parse(std::string_view s) {
    constexpr std::string_view kUpsertPrefix = "upsert-on:";
    if (s == "error") return IfExists(Policy::Error);
    if (s == "overwrite") return IfExists(Policy::Overwrite);
    if (s == "append") return IfExists(Policy::Append);
    if (s.starts_with(kUpsertPrefix)) {
        std::vector<std::string> keys;
        std::string_view rest = s.substr(kUpsertPrefix.size());
        while (true) {
            auto comma = rest.find(',');
            auto key = rest.substr(0, comma);
            if (key.empty()) {
                return std::unexpected(Error{
                    ErrorCode::InvalidArgument,
                    fmt::format("upsert-on requires a comma-separated list of key columns: {}",
                                s)});
            }
            keys.emplace_back(key);
            if (comma == std::string_view::npos) break;
            rest.remove_prefix(comma + 1);
        }
        return UpsertOn(std::move(keys));
    }
    return std::unexpected(Error{ErrorCode::InvalidArgument,
                                 fmt::format("unknown if_exists value: {}", s)});
}

std::expected<int, Error> IfExists::ToOpenFlagsNoAppend() const {
    switch (policy_) {
        case Policy::Error:
            return O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC;
        case Policy::Overwrite:
            return O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC;
        case Policy::Append:
        case Policy::Upsert:
            break;
    }
    return std::unexpected(Error{
        ErrorCode::UnsupportedFeature,
        fmt::format("if_exists={} is not supported for this file format", ToString())});
}

void IfExists::WarnIfNotDefaultForStdout(const Context& ctx) const {
    if (policy_ != Policy::Error) {
        ctx.Warn("{} ignored for stdout", ToString());
    }
}

std::string IfExists::ToString() const {
    switch (policy_) {
        case Policy::Error:
            return "error";
        case Policy::Overwrite:
            return "overwrite";
        case Policy::Append:
            return "append";
        case Policy::Upsert:
            return fmt::format("upsert-on:{}", fmt::join(keys_, ","));
    }
    return "unknown";
}

}  // namespace dbxfer
