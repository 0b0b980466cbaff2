// SPDX-License-Identifier: MIT

// include/dbxfer/logging.hpp
#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "dbxfer/error.hpp"

namespace dbxfer {

/// Create a logger writing to stderr at @p level.
std::shared_ptr<spdlog::logger> MakeLogger(const std::string& name,
                                           spdlog::level::level_enum level);

/// Parse "trace", "debug", "info", "warn", "error" or "off".
std::expected<spdlog::level::level_enum, Error> ParseLogLevel(std::string_view name);

}  // namespace dbxfer
