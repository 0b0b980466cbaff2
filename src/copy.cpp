// SPDX-License-Identifier: MIT

// src/copy.cpp
#include "dbxfer/copy.hpp"

#include <asio/co_spawn.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <fmt/format.h>

namespace dbxfer {

namespace {

std::unexpected<Error> Unsupported(std::string message) {
    return std::unexpected(Error{ErrorCode::UnsupportedFeature, std::move(message)});
}

// Shared by the partition writes of one copy. The timer never expires;
// cancelling it wakes the driver.
struct CompletionTracker {
    explicit CompletionTracker(const asio::any_io_executor& executor)
        : wakeup(executor, asio::steady_timer::time_point::max()) {}

    asio::steady_timer wakeup;
    std::size_t in_flight = 0;
    std::exception_ptr error;
};

asio::awaitable<void> TrackCompletion(std::shared_ptr<CompletionTracker> tracker,
                                      asio::awaitable<void> completion) {
    struct Settle {
        CompletionTracker& tracker;
        ~Settle() {
            --tracker.in_flight;
            tracker.wakeup.cancel();
        }
    } settle{*tracker};

    try {
        co_await std::move(completion);
    } catch (...) {
        // Remember the first failure for the driver; the context gets it too.
        if (!tracker->error) tracker->error = std::current_exception();
        throw;
    }
}

asio::awaitable<void> WaitForWakeup(CompletionTracker& tracker) {
    asio::error_code ec;
    co_await tracker.wakeup.async_wait(asio::redirect_error(asio::use_awaitable, ec));
}

asio::awaitable<void> DriveCompletions(Context ctx, BoxStream<asio::awaitable<void>> completions,
                                       std::size_t max_streams) {
    auto tracker = std::make_shared<CompletionTracker>(ctx.executor());
    std::size_t started = 0;

    while (!tracker->error) {
        while (tracker->in_flight >= max_streams && !tracker->error) {
            co_await WaitForWakeup(*tracker);
        }
        if (tracker->error) break;

        std::optional<asio::awaitable<void>> next;
        try {
            next = co_await completions->Next();
        } catch (...) {
            if (!tracker->error) tracker->error = std::current_exception();
            break;
        }
        if (!next) break;

        ++tracker->in_flight;
        ++started;
        ctx.SpawnWorker(TrackCompletion(tracker, std::move(*next)));
    }

    while (tracker->in_flight > 0) {
        co_await WaitForWakeup(*tracker);
    }
    if (tracker->error) {
        ctx.Debug("stopped after {} partition writes", started);
        std::rethrow_exception(tracker->error);
    }
    ctx.Debug("finished {} partition writes", started);
}

asio::awaitable<Table> ReadSchema(Context ctx, BoxLocator locator) {
    auto schema = co_await locator->Schema(ctx);
    if (!schema) {
        throw TransferError(ErrorCode::NotSupported,
                            fmt::format("no schema found at {}", locator->ToString()));
    }
    if (auto valid = ValidateTable(*schema); !valid) throw TransferError(valid.error());
    co_return std::move(*schema);
}

asio::awaitable<void> SpawnAndSupervise(Context ctx, asio::awaitable<void> task,
                                        asio::awaitable<void> supervisor) {
    ctx.SpawnWorker(std::move(task));
    // Release our copy so the supervisor can see the workers finish.
    { Context released = std::move(ctx); }
    co_await std::move(supervisor);
}

}  // namespace

std::expected<CopyRoute, Error> NegotiateCopy(const CopyRequest& request) {
    const auto& from = *request.from;
    const auto& to = *request.to;
    auto from_features = from.GetFeatures();
    auto to_features = to.GetFeatures();

    if (request.max_streams == 0) {
        return std::unexpected(
            Error{ErrorCode::InvalidArgument, "--max-streams must be at least 1"});
    }

    SourceArguments source{.driver_args = request.from_args,
                           .query = Query{.where_clause = request.where_clause}};
    if (auto ok = source.Verify(from_features.source_args); !ok) {
        return std::unexpected(ok.error());
    }
    DestinationArguments dest{.driver_args = request.to_args, .if_exists = request.if_exists};
    if (auto ok = dest.Verify(to_features); !ok) {
        return std::unexpected(ok.error());
    }

    const Locator& schema_source = request.schema ? *request.schema : from;
    if (!schema_source.GetFeatures().Supports(LocatorFeatures::Schema)) {
        return Unsupported(fmt::format("cannot read a schema from {}; use --schema",
                                       schema_source.ToString()));
    }

    if (request.create_schema) {
        if (!to_features.Supports(LocatorFeatures::WriteSchema)) {
            return Unsupported(fmt::format("{} cannot create a schema", to.ToString()));
        }
        if (!to_features.SupportsWriteSchemaIfExists(request.if_exists)) {
            return Unsupported(fmt::format("{} cannot create a schema with --if-exists={}",
                                           to.ToString(), request.if_exists.ToString()));
        }
    }

    if (to.SupportsWriteRemoteData(from)) return CopyRoute::Remote;

    if (!from_features.Supports(LocatorFeatures::LocalData)) {
        return Unsupported(fmt::format("cannot copy from {} to {}: {} cannot be read as data",
                                       from.ToString(), to.ToString(), from.ToString()));
    }
    if (!to_features.Supports(LocatorFeatures::WriteLocalData)) {
        return Unsupported(fmt::format("cannot copy from {} to {}: {} cannot be written as data",
                                       from.ToString(), to.ToString(), to.ToString()));
    }
    return CopyRoute::Stream;
}

asio::awaitable<void> CopyTable(Context ctx, CopyRequest request) {
    auto route = NegotiateCopy(request);
    if (!route) throw TransferError(route.error());

    ctx = ctx.Child({{"from", request.from->ToString()}, {"to", request.to->ToString()}});

    auto schema_source = request.schema ? request.schema : request.from;
    auto schema = co_await ReadSchema(ctx, schema_source);

    SharedArguments shared{
        .schema = schema,
        .temporary_storage = request.temporary_storage,
        .max_streams = request.max_streams,
    };
    SourceArguments source{.driver_args = request.from_args,
                           .query = Query{.where_clause = request.where_clause}};
    DestinationArguments dest{.driver_args = request.to_args, .if_exists = request.if_exists};

    if (*route == CopyRoute::Remote) {
        ctx.Info("copying directly");
        co_await request.to->WriteRemoteData(ctx, request.from, std::move(shared),
                                             std::move(source), std::move(dest));
        co_return;
    }

    if (request.create_schema) {
        ctx.Debug("creating destination schema");
        co_await request.to->WriteSchema(ctx, std::move(schema), request.if_exists);
    }

    ctx.Info("streaming data");
    auto partitions = co_await request.from->LocalData(ctx, shared, std::move(source));
    if (!partitions) {
        ctx.Debug("source has no data");
        partitions = MakeEmptyStream<CsvStream>();
    }
    auto completions = co_await request.to->WriteLocalData(ctx, std::move(*partitions),
                                                           std::move(shared), std::move(dest));
    co_await DriveCompletions(ctx, std::move(completions), request.max_streams);
}

asio::awaitable<void> ConvertSchema(Context ctx, BoxLocator from, BoxLocator to,
                                    IfExists if_exists) {
    if (!from->GetFeatures().Supports(LocatorFeatures::Schema)) {
        throw TransferError(ErrorCode::UnsupportedFeature,
                            fmt::format("cannot read a schema from {}", from->ToString()));
    }
    auto to_features = to->GetFeatures();
    if (!to_features.Supports(LocatorFeatures::WriteSchema)) {
        throw TransferError(ErrorCode::UnsupportedFeature,
                            fmt::format("{} cannot store a schema", to->ToString()));
    }
    if (!to_features.SupportsWriteSchemaIfExists(if_exists)) {
        throw TransferError(ErrorCode::UnsupportedFeature,
                            fmt::format("{} does not support --if-exists={}", to->ToString(),
                                        if_exists.ToString()));
    }

    auto schema = co_await ReadSchema(ctx, from);
    ctx.Info("writing schema with {} columns to {}", schema.columns.size(), to->ToString());
    co_await to->WriteSchema(ctx, std::move(schema), std::move(if_exists));
}

asio::awaitable<void> RunCopy(std::shared_ptr<spdlog::logger> logger, CopyRequest request) {
    auto executor = co_await asio::this_coro::executor;
    auto [ctx, supervisor] = Context::Create(executor, std::move(logger));
    auto task = CopyTable(ctx, std::move(request));
    co_await SpawnAndSupervise(std::move(ctx), std::move(task), std::move(supervisor));
}

asio::awaitable<void> RunConvertSchema(std::shared_ptr<spdlog::logger> logger, BoxLocator from,
                                       BoxLocator to, IfExists if_exists) {
    auto executor = co_await asio::this_coro::executor;
    auto [ctx, supervisor] = Context::Create(executor, std::move(logger));
    auto task = ConvertSchema(ctx, std::move(from), std::move(to), std::move(if_exists));
    co_await SpawnAndSupervise(std::move(ctx), std::move(task), std::move(supervisor));
}

}  // namespace dbxfer
