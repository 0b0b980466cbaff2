// SPDX-License-Identifier: MIT

// src/locator.cpp
#include "dbxfer/locator.hpp"

#include <functional>

#include <fmt/format.h>

#include "dbxfer/drivers/bigquery_schema_locator.hpp"
#include "dbxfer/drivers/csv_locator.hpp"
#include "dbxfer/drivers/redshift_locator.hpp"
#include "dbxfer/drivers/s3_locator.hpp"

namespace dbxfer {

asio::awaitable<std::optional<Table>> Locator::Schema(Context) const {
    ThrowUnsupported("reading schemas");
}

asio::awaitable<void> Locator::WriteSchema(Context, Table, IfExists) const {
    ThrowUnsupported("writing schemas");
}

asio::awaitable<std::optional<BoxStream<CsvStream>>> Locator::LocalData(
    Context, SharedArguments, SourceArguments) const {
    ThrowUnsupported("reading data");
}

asio::awaitable<BoxStream<asio::awaitable<void>>> Locator::WriteLocalData(
    Context, BoxStream<CsvStream>, SharedArguments, DestinationArguments) const {
    ThrowUnsupported("writing data");
}

bool Locator::SupportsWriteRemoteData(const Locator&) const {
    return false;
}

asio::awaitable<void> Locator::WriteRemoteData(Context, BoxLocator source, SharedArguments,
                                               SourceArguments, DestinationArguments) const {
    ThrowUnsupported(fmt::format("copying directly from {}", source->ToString()));
}

void Locator::ThrowUnsupported(std::string_view operation) const {
    throw TransferError(ErrorCode::UnsupportedFeature,
                        fmt::format("{} does not support {}", ToString(), operation));
}

namespace {

struct SchemeEntry {
    std::string_view scheme;
    Features features;
    std::function<std::expected<BoxLocator, Error>(std::string_view)> parse;
};

template <typename L>
SchemeEntry MakeEntry() {
    return SchemeEntry{
        .scheme = L::kScheme,
        .features = L::StaticFeatures(),
        .parse = [](std::string_view s) -> std::expected<BoxLocator, Error> {
            auto parsed = L::Parse(s);
            if (!parsed) return std::unexpected(parsed.error());
            return BoxLocator(std::make_shared<const L>(std::move(*parsed)));
        },
    };
}

const std::vector<SchemeEntry>& Registry() {
    static const std::vector<SchemeEntry> entries = {
        MakeEntry<BigQuerySchemaLocator>(),
        MakeEntry<CsvLocator>(),
        MakeEntry<RedshiftLocator>(),
        MakeEntry<S3Locator>(),
    };
    return entries;
}

}  // namespace

std::expected<BoxLocator, Error> ParseLocator(std::string_view s) {
    auto colon = s.find(':');
    if (colon == std::string_view::npos) {
        return std::unexpected(Error{ErrorCode::InvalidLocator,
                                     fmt::format("locator {} is missing a scheme", s)});
    }
    auto scheme = s.substr(0, colon + 1);
    for (const auto& entry : Registry()) {
        if (entry.scheme == scheme) return entry.parse(s);
    }
    return std::unexpected(Error{ErrorCode::InvalidLocator,
                                 fmt::format("unknown locator scheme in {}", s)});
}

const std::vector<LocatorScheme>& LocatorSchemes() {
    static const std::vector<LocatorScheme> schemes = [] {
        std::vector<LocatorScheme> result;
        for (const auto& entry : Registry()) {
            result.push_back(LocatorScheme{entry.scheme, entry.features});
        }
        return result;
    }();
    return schemes;
}

}  // namespace dbxfer
