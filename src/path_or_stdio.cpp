// SPDX-License-Identifier: MIT

// src/path_or_stdio.cpp
#include "dbxfer/path_or_stdio.hpp"

#include <fmt/format.h>

namespace dbxfer {

std::expected<PathOrStdio, Error> PathOrStdio::Parse(std::string_view scheme,
                                                     std::string_view locator) {
    if (!locator.starts_with(scheme)) {
        return std::unexpected(Error{ErrorCode::InvalidLocator,
                                     fmt::format("expected {} to begin with {}", locator, scheme)});
    }
    auto rest = locator.substr(scheme.size());
    if (rest == "-") return Stdio();
    if (rest.empty()) {
        return std::unexpected(Error{ErrorCode::InvalidLocator,
                                     fmt::format("missing path in {}", locator)});
    }
    return Path(std::filesystem::path(std::string(rest)));
}

std::string PathOrStdio::ToLocator(std::string_view scheme) const {
    if (stdio_) return fmt::format("{}-", scheme);
    return fmt::format("{}{}", scheme, path_.string());
}

}  // namespace dbxfer
