// SPDX-License-Identifier: MIT

// include/dbxfer/drivers/s3_locator.hpp
#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include "dbxfer/locator.hpp"
#include "dbxfer/object_store_client.hpp"

namespace dbxfer {

/// A prefix in S3, always written "s3://bucket/path/" with a trailing '/'.
///
/// Every object under the prefix is one CSV partition. Data can be loaded
/// into the prefix directly from a redshift: locator.
class S3Locator : public Locator {
public:
    static constexpr std::string_view kScheme = "s3:";

    S3Locator(std::string url, std::shared_ptr<IObjectStoreClient> client)
        : url_(std::move(url)), client_(std::move(client)) {}

    /// Parse with the default client (the aws CLI).
    static std::expected<S3Locator, Error> Parse(std::string_view s);

    /// Parse with a specific client.
    static std::expected<S3Locator, Error> Parse(std::string_view s,
                                                 std::shared_ptr<IObjectStoreClient> client);

    static Features StaticFeatures();

    /// The s3:// URL of the prefix.
    const std::string& url() const { return url_; }

    std::string_view Scheme() const override { return kScheme; }
    std::string ToString() const override { return url_; }
    Features GetFeatures() const override { return StaticFeatures(); }

    asio::awaitable<std::optional<BoxStream<CsvStream>>> LocalData(
        Context ctx, SharedArguments shared, SourceArguments source) const override;

    asio::awaitable<BoxStream<asio::awaitable<void>>> WriteLocalData(
        Context ctx, BoxStream<CsvStream> data, SharedArguments shared,
        DestinationArguments dest) const override;

    /// True only for redshift: sources, which can UNLOAD straight to S3.
    bool SupportsWriteRemoteData(const Locator& source) const override;

    asio::awaitable<void> WriteRemoteData(Context ctx, BoxLocator source, SharedArguments shared,
                                          SourceArguments source_args,
                                          DestinationArguments dest_args) const override;

    /// Make the prefix ready to receive data: remove existing objects for
    /// Overwrite, refuse a non-empty prefix for Error.
    asio::awaitable<void> PrepareAsDestination(Context ctx, IfExists if_exists) const;

private:
    std::string url_;
    std::shared_ptr<IObjectStoreClient> client_;
};

}  // namespace dbxfer
