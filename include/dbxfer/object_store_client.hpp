// SPDX-License-Identifier: MIT

// include/dbxfer/object_store_client.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>

#include <asio/awaitable.hpp>

#include "dbxfer/async_stream.hpp"
#include "dbxfer/context.hpp"

namespace dbxfer {

// Object storage operations the s3: locator needs. URLs are full
// "s3://bucket/key" strings; prefixes end with '/'.
class IObjectStoreClient {
public:
    virtual ~IObjectStoreClient() = default;

    /// URLs of every object under @p prefix, in any order.
    virtual asio::awaitable<std::vector<std::string>> ListObjects(Context ctx,
                                                                  std::string prefix) = 0;

    /// Contents of one object. The download starts when the stream is first pulled.
    virtual BoxStream<Bytes> ReadObject(Context ctx, std::string url) = 0;

    /// Upload @p data to @p url, completing once the object is stored.
    virtual asio::awaitable<void> WriteObject(Context ctx, std::string url,
                                              BoxStream<Bytes> data) = 0;

    /// Delete every object under @p prefix.
    virtual asio::awaitable<void> RemovePrefix(Context ctx, std::string prefix) = 0;
};

// Runs the `aws` command-line tool, which must be on PATH and configured
// with credentials.
class AwsCliClient : public IObjectStoreClient {
public:
    asio::awaitable<std::vector<std::string>> ListObjects(Context ctx,
                                                          std::string prefix) override;
    BoxStream<Bytes> ReadObject(Context ctx, std::string url) override;
    asio::awaitable<void> WriteObject(Context ctx, std::string url,
                                      BoxStream<Bytes> data) override;
    asio::awaitable<void> RemovePrefix(Context ctx, std::string prefix) override;
};

/// Parse the output of `aws s3 ls --recursive` into object URLs in @p bucket.
std::vector<std::string> ParseS3Listing(std::string_view output, std::string_view bucket);

}  // namespace dbxfer
