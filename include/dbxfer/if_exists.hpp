// SPDX-License-Identifier: MIT

// include/dbxfer/if_exists.hpp
#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "dbxfer/error.hpp"

namespace dbxfer {

class Context;

/// What to do when the destination of a write already exists.
class IfExists {
public:
    enum class Policy {
        Error,      ///< Refuse to touch existing data (default)
        Overwrite,  ///< Replace existing data, creating it if absent (overwrite-or-create)
        Append,     ///< Add to existing data
        Upsert,     ///< Merge on the key columns in upsert_keys()
    };

    IfExists() = default;
    IfExists(Policy policy) : policy_(policy) {}  // NOLINT(google-explicit-constructor)

    static IfExists UpsertOn(std::vector<std::string> keys) {
        IfExists result(Policy::Upsert);
        result.keys_ = std::move(keys);
        return result;
    }

    /// Parse "error", "overwrite", "append" or "upsert-on:col1,col2".
    static std::expected<IfExists, Error> Parse(std::string_view s);

    Policy policy() const { return policy_; }
    const std::vector<std::string>& upsert_keys() const { return keys_; }

    /// open(2) flags for writing a file under this policy, for formats that
    /// cannot be appended to (every file carries its own header).
    std::expected<int, Error> ToOpenFlagsNoAppend() const;

    /// Log a warning if anything but the default was requested for a
    /// destination (stdout) that cannot honor it.
    void WarnIfNotDefaultForStdout(const Context& ctx) const;

    std::string ToString() const;

    bool operator==(const IfExists&) const = default;

private:
    Policy policy_ = Policy::Error;
    std::vector<std::string> keys_;
};

}  // namespace dbxfer
