// SPDX-License-Identifier: MIT

// src/drivers/s3_locator.cpp
#include "dbxfer/drivers/s3_locator.hpp"

#include <algorithm>
#include <cerrno>
#include <functional>

#include <fmt/format.h>

#include "dbxfer/drivers/redshift_locator.hpp"

namespace dbxfer {

namespace {

constexpr std::string_view kUrlPrefix = "s3://";

// Keeps the client alive for as long as the upload runs.
asio::awaitable<void> UploadObject(std::shared_ptr<IObjectStoreClient> client, Context ctx,
                                   std::string url, BoxStream<Bytes> data) {
    co_await client->WriteObject(std::move(ctx), std::move(url), std::move(data));
}

}  // namespace

std::expected<S3Locator, Error> S3Locator::Parse(std::string_view s) {
    return Parse(s, std::make_shared<AwsCliClient>());
}

std::expected<S3Locator, Error> S3Locator::Parse(std::string_view s,
                                                 std::shared_ptr<IObjectStoreClient> client) {
    if (!s.starts_with(kScheme)) {
        return std::unexpected(Error{ErrorCode::InvalidLocator,
                                     fmt::format("expected {} to begin with s3://", s)});
    }
    // The bucket must be followed by an absolute path.
    auto bucket_end = s.starts_with(kUrlPrefix) ? s.find('/', kUrlPrefix.size())
                                                : std::string_view::npos;
    if (bucket_end == std::string_view::npos || bucket_end == kUrlPrefix.size()) {
        return std::unexpected(Error{ErrorCode::InvalidLocator,
                                     fmt::format("{} must start with s3://", s)});
    }
    if (!s.ends_with('/')) {
        return std::unexpected(Error{ErrorCode::InvalidLocator,
                                     fmt::format("{} must end with a '/'", s)});
    }
    return S3Locator(std::string(s), std::move(client));
}

Features S3Locator::StaticFeatures() {
    return Features{
        .locator = LocatorFeatures::LocalData | LocatorFeatures::WriteLocalData,
        .dest_if_exists = IfExistsFeatures::NoAppend,
    };
}

asio::awaitable<std::optional<BoxStream<CsvStream>>> S3Locator::LocalData(
    Context ctx, SharedArguments, SourceArguments source) const {
    if (auto ok = source.query.FailIfQueryDetailsProvided(); !ok) {
        throw TransferError(ok.error());
    }
    if (!source.driver_args.empty()) {
        throw TransferError(ErrorCode::UnsupportedFeature, "s3: does not accept --from-arg");
    }

    auto urls = co_await client_->ListObjects(ctx, url_);
    std::sort(urls.begin(), urls.end());
    ctx.Debug("found {} objects under {}", urls.size(), url_);

    // Check every name before any download starts.
    std::vector<CsvStream> streams;
    streams.reserve(urls.size());
    for (const auto& url : urls) {
        if (!url.ends_with(".csv") && !url.ends_with(".CSV")) {
            throw TransferError(ErrorCode::StructuralError,
                                fmt::format("{} must end in *.csv or *.CSV", url));
        }
        auto name = CsvStreamName(url_, url);
        if (!name) throw TransferError(name.error());
        auto child = ctx.Child({{"stream", *name}, {"url", url}});
        streams.push_back(CsvStream{
            .name = std::move(*name),
            .data = client_->ReadObject(std::move(child), url),
        });
    }
    co_return MakeVectorStream(std::move(streams));
}

asio::awaitable<void> S3Locator::PrepareAsDestination(Context ctx, IfExists if_exists) const {
    switch (if_exists.policy()) {
        case IfExists::Policy::Overwrite:
            ctx.Debug("deleting existing {}", url_);
            co_await client_->RemovePrefix(ctx, url_);
            co_return;
        case IfExists::Policy::Error: {
            auto existing = co_await client_->ListObjects(ctx, url_);
            if (!existing.empty()) {
                throw TransferError(ErrorCode::IoError,
                                    fmt::format("{} already contains data", url_), EEXIST);
            }
            co_return;
        }
        case IfExists::Policy::Append:
        case IfExists::Policy::Upsert:
            break;
    }
    throw TransferError(ErrorCode::UnsupportedFeature,
                        fmt::format("s3: does not support --if-exists={}", if_exists.ToString()));
}

asio::awaitable<BoxStream<asio::awaitable<void>>> S3Locator::WriteLocalData(
    Context ctx, BoxStream<CsvStream> data, SharedArguments, DestinationArguments dest) const {
    if (!dest.driver_args.empty()) {
        throw TransferError(ErrorCode::UnsupportedFeature, "s3: does not accept --to-arg");
    }
    co_await PrepareAsDestination(ctx, dest.if_exists);

    std::function<asio::awaitable<void>(CsvStream)> write =
        [ctx, client = client_, prefix = url_](CsvStream stream) {
            auto url = fmt::format("{}{}.csv", prefix, stream.name);
            auto child = ctx.Child({{"stream", stream.name}, {"url", url}});
            return UploadObject(client, std::move(child), std::move(url), std::move(stream.data));
        };
    co_return MakeMapStream(std::move(data), std::move(write));
}

bool S3Locator::SupportsWriteRemoteData(const Locator& source) const {
    return dynamic_cast<const RedshiftLocator*>(&source) != nullptr;
}

asio::awaitable<void> S3Locator::WriteRemoteData(Context ctx, BoxLocator source,
                                                 SharedArguments shared,
                                                 SourceArguments source_args,
                                                 DestinationArguments dest_args) const {
    const auto* redshift = dynamic_cast<const RedshiftLocator*>(source.get());
    if (!redshift) ThrowUnsupported(fmt::format("copying directly from {}", source->ToString()));
    if (!dest_args.driver_args.empty()) {
        throw TransferError(ErrorCode::UnsupportedFeature, "s3: does not accept --to-arg");
    }

    co_await PrepareAsDestination(ctx, dest_args.if_exists);
    co_await redshift->UnloadTo(ctx, url_, std::move(shared), std::move(source_args),
                                std::move(dest_args));
}

}  // namespace dbxfer
