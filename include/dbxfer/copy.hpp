// SPDX-License-Identifier: MIT

// include/dbxfer/copy.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>

#include <asio/awaitable.hpp>
#include <spdlog/spdlog.h>

#include "dbxfer/arguments.hpp"
#include "dbxfer/context.hpp"
#include "dbxfer/locator.hpp"

namespace dbxfer {

/// Everything needed to copy one table.
struct CopyRequest {
    BoxLocator from;
    BoxLocator to;
    IfExists if_exists;
    BoxLocator schema;  ///< Where to read the schema; null reads it from `from`
    bool create_schema = false;
    TemporaryStorage temporary_storage;
    DriverArgs from_args;
    DriverArgs to_args;
    std::optional<std::string> where_clause;
    std::size_t max_streams = 4;  ///< Partitions written at once (at least 1)
};

/// How data will move.
enum class CopyRoute {
    Remote,  ///< The destination pulls directly from the source
    Stream,  ///< Partitions flow through this process
};

/// Check @p request against both locators' features, without any I/O.
std::expected<CopyRoute, Error> NegotiateCopy(const CopyRequest& request);

/// Copy a table.
///
/// The request is negotiated before anything is read. If the destination can
/// pull from the source directly, that is the only call made. Otherwise the
/// source's partitions are streamed into the destination, with at most
/// max_streams partition writes in flight. Each write runs as a worker of
/// @p ctx; the first failure stops new writes and is rethrown once the
/// running ones finish.
asio::awaitable<void> CopyTable(Context ctx, CopyRequest request);

/// Read the schema at @p from and write it to @p to.
asio::awaitable<void> ConvertSchema(Context ctx, BoxLocator from, BoxLocator to,
                                    IfExists if_exists);

/// Run CopyTable under a fresh Context and wait for it and every background
/// task it started. Throws the first error any of them reported.
asio::awaitable<void> RunCopy(std::shared_ptr<spdlog::logger> logger, CopyRequest request);

/// Run ConvertSchema under a fresh Context.
asio::awaitable<void> RunConvertSchema(std::shared_ptr<spdlog::logger> logger, BoxLocator from,
                                       BoxLocator to, IfExists if_exists);

}  // namespace dbxfer
