// SPDX-License-Identifier: MIT

// src/logging.cpp
#include "dbxfer/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <fmt/format.h>

namespace dbxfer {

std::shared_ptr<spdlog::logger> MakeLogger(const std::string& name,
                                           spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_level(level);
    logger->set_pattern("%Y-%m-%dT%H:%M:%S.%e %^%-5l%$ %v");
    return logger;
}

std::expected<spdlog::level::level_enum, Error> ParseLogLevel(std::string_view name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return std::unexpected(Error{ErrorCode::InvalidArgument,
                                 fmt::format("unknown log level: {}", name)});
}

}  // namespace dbxfer
