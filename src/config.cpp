// SPDX-License-Identifier: MIT

// src/config.cpp
#include "dbxfer/config.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>

#include <fmt/format.h>

#include "dbxfer/logging.hpp"

namespace dbxfer {

std::expected<TransferConfig, Error> TransferConfig::FromEnvironment() {
    TransferConfig config = Defaults();

    if (const char* value = std::getenv("DBXFER_MAX_STREAMS")) {
        std::string_view s(value);
        std::size_t n = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
        if (ec != std::errc{} || ptr != s.data() + s.size() || n == 0) {
            return std::unexpected(Error{
                ErrorCode::InvalidArgument,
                fmt::format("DBXFER_MAX_STREAMS must be a positive integer, got {}", s)});
        }
        config.max_streams = n;
    }

    if (const char* value = std::getenv("DBXFER_LOG")) {
        auto level = ParseLogLevel(value);
        if (!level) return std::unexpected(level.error());
        config.log_level = *level;
    }

    return config;
}

}  // namespace dbxfer
