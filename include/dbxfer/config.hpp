// SPDX-License-Identifier: MIT

// include/dbxfer/config.hpp
#pragma once

#include <cstddef>
#include <expected>

#include <spdlog/common.h>

#include "dbxfer/error.hpp"

namespace dbxfer {

/// Process-wide transfer settings.
struct TransferConfig {
    std::size_t max_streams = 4;                          ///< Partitions in flight at once
    spdlog::level::level_enum log_level = spdlog::level::info;

    /// Defaults for interactive use.
    static TransferConfig Defaults() { return TransferConfig{}; }

    /// Defaults overridden by DBXFER_MAX_STREAMS and DBXFER_LOG.
    static std::expected<TransferConfig, Error> FromEnvironment();
};

}  // namespace dbxfer
