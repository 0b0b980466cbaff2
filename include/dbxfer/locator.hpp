// SPDX-License-Identifier: MIT

// include/dbxfer/locator.hpp
#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <asio/awaitable.hpp>

#include "dbxfer/arguments.hpp"
#include "dbxfer/async_stream.hpp"
#include "dbxfer/context.hpp"
#include "dbxfer/csv_stream.hpp"
#include "dbxfer/error.hpp"
#include "dbxfer/features.hpp"
#include "dbxfer/if_exists.hpp"
#include "dbxfer/schema.hpp"

namespace dbxfer {

class Locator;

/// Locators are immutable once parsed and shared between tasks.
using BoxLocator = std::shared_ptr<const Locator>;

/// A storage endpoint: somewhere a table schema or table data can be read
/// from or written to.
///
/// Each implementation advertises what it can do through GetFeatures(). The
/// default implementation of every optional operation throws
/// TransferError{UnsupportedFeature}; the copy engine checks features first,
/// so reaching a default is a caller bug.
class Locator {
public:
    virtual ~Locator() = default;

    /// Scheme prefix including the colon, e.g. "csv:".
    virtual std::string_view Scheme() const = 0;

    /// Canonical locator string. ParseLocator(ToString()) yields an equal locator.
    virtual std::string ToString() const = 0;

    virtual Features GetFeatures() const = 0;

    /// The table schema stored at this location, or std::nullopt if there is none.
    virtual asio::awaitable<std::optional<Table>> Schema(Context ctx) const;

    /// Store @p table at this location.
    virtual asio::awaitable<void> WriteSchema(Context ctx, Table table, IfExists if_exists) const;

    /// Stream the data stored here as CSV partitions.
    /// @return std::nullopt if the location holds no data at all.
    virtual asio::awaitable<std::optional<BoxStream<CsvStream>>> LocalData(
        Context ctx, SharedArguments shared, SourceArguments source) const;

    /// Consume @p data, returning one completion per written unit.
    ///
    /// The returned stream is lazy: pulling an item starts at most one
    /// partition's write and awaiting it finishes that write.
    virtual asio::awaitable<BoxStream<asio::awaitable<void>>> WriteLocalData(
        Context ctx, BoxStream<CsvStream> data, SharedArguments shared,
        DestinationArguments dest) const;

    /// Whether this locator can pull data directly from @p source, without
    /// the data passing through this process.
    virtual bool SupportsWriteRemoteData(const Locator& source) const;

    /// Copy from @p source directly. Only valid if SupportsWriteRemoteData(*source).
    virtual asio::awaitable<void> WriteRemoteData(Context ctx, BoxLocator source,
                                                  SharedArguments shared,
                                                  SourceArguments source_args,
                                                  DestinationArguments dest_args) const;

protected:
    [[noreturn]] void ThrowUnsupported(std::string_view operation) const;
};

/// Parse "<scheme>:<location>" into the locator for that scheme.
std::expected<BoxLocator, Error> ParseLocator(std::string_view s);

/// A registered locator scheme and what it supports.
struct LocatorScheme {
    std::string_view scheme;
    Features features;
};

/// Every scheme ParseLocator() understands.
const std::vector<LocatorScheme>& LocatorSchemes();

}  // namespace dbxfer
