// SPDX-License-Identifier: MIT

// include/dbxfer/path_or_stdio.hpp
#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "dbxfer/error.hpp"

namespace dbxfer {

/// A local path, or "-" for stdin (as a source) and stdout (as a destination).
class PathOrStdio {
public:
    static PathOrStdio Stdio() { return PathOrStdio(); }
    static PathOrStdio Path(std::filesystem::path path) { return PathOrStdio(std::move(path)); }

    /// Parse the part of @p locator after @p scheme.
    static std::expected<PathOrStdio, Error> Parse(std::string_view scheme,
                                                   std::string_view locator);

    bool is_stdio() const { return stdio_; }
    const std::filesystem::path& path() const { return path_; }

    /// True for paths written with a trailing '/', which name directories.
    bool is_directory() const { return !stdio_ && path_.string().ends_with('/'); }

    std::string ToLocator(std::string_view scheme) const;

private:
    PathOrStdio() = default;
    explicit PathOrStdio(std::filesystem::path path) : stdio_(false), path_(std::move(path)) {}

    bool stdio_ = true;
    std::filesystem::path path_;
};

}  // namespace dbxfer
