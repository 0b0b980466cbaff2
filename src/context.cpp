// SPDX-License-Identifier: MIT

// src/context.cpp
#include "dbxfer/context.hpp"

#include <asio/co_spawn.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace dbxfer {

namespace detail {

ErrorSender::~ErrorSender() {
    channel_->senders_closed = true;
    channel_->Wake();
}

SendResult ErrorSender::Send(std::exception_ptr error) {
    if (!channel_->receiver_alive) return SendResult::Closed;
    if (channel_->error) return SendResult::Full;
    channel_->error = std::move(error);
    channel_->Wake();
    return SendResult::Sent;
}

ErrorReceiver::~ErrorReceiver() {
    if (channel_) channel_->receiver_alive = false;
}

}  // namespace detail

namespace {

asio::awaitable<void> WaitForWorkers(detail::ErrorReceiver receiver) {
    auto& channel = receiver.channel();
    while (!channel.error && !channel.senders_closed) {
        asio::error_code ec;
        co_await channel.wakeup.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }
    if (channel.error) {
        std::rethrow_exception(channel.error);
    }
}

asio::awaitable<void> MonitorProcess(std::string name, ChildProcess process) {
    int status = co_await process.Wait();
    if (status != 0) {
        throw TransferError(ErrorCode::ProcessFailed,
                            fmt::format("{} failed with exit status {}", name, status));
    }
}

}  // namespace

std::string DescribeException(std::exception_ptr error) {
    if (!error) return "no error";
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

std::pair<Context, asio::awaitable<void>> Context::Create(
    asio::any_io_executor executor, std::shared_ptr<spdlog::logger> logger) {
    auto channel = std::make_shared<detail::ErrorChannel>(executor);
    auto sender = std::make_shared<detail::ErrorSender>(channel);
    Context ctx(std::move(executor), std::move(logger), {}, std::move(sender));
    return {std::move(ctx), WaitForWorkers(detail::ErrorReceiver(std::move(channel)))};
}

std::pair<Context, asio::awaitable<void>> Context::CreateForTest(
    asio::any_io_executor executor, const std::string& test_name) {
    auto logger = spdlog::get("test");
    if (!logger) {
        logger = spdlog::stderr_color_mt("test");
        logger->set_level(spdlog::level::debug);
    }
    auto [ctx, handle] = Create(std::move(executor), std::move(logger));
    return {ctx.Child({{"test", test_name}}), std::move(handle)};
}

Context Context::Child(LogFields fields) const {
    LogFields merged = fields_;
    merged.insert(merged.end(), std::make_move_iterator(fields.begin()),
                  std::make_move_iterator(fields.end()));
    return Context(executor_, logger_, std::move(merged), sender_);
}

void Context::SpawnWorker(asio::awaitable<void> worker) const {
    asio::co_spawn(executor_, std::move(worker), [ctx = *this](std::exception_ptr e) {
        if (e) ctx.ReportError(e);
    });
}

void Context::SpawnProcess(std::string name,
                           std::expected<ChildProcess, dbxfer::Error> process) const {
    if (!process) {
        ReportError(std::make_exception_ptr(TransferError(
            process.error().code,
            fmt::format("{} failed with error: {}", name, process.error().message),
            process.error().os_errno)));
        return;
    }
    Debug("started {} (pid {})", name, process->pid());
    SpawnWorker(MonitorProcess(std::move(name), std::move(*process)));
}

void Context::ReportError(std::exception_ptr error) const {
    switch (sender_->Send(error)) {
        case detail::SendResult::Sent:
            break;
        case detail::SendResult::Full:
            Debug("discarding background worker error: {}", DescribeException(error));
            break;
        case detail::SendResult::Closed:
            Debug("broken pipe reporting background worker error: {}",
                  DescribeException(error));
            break;
    }
}

void Context::Emit(spdlog::level::level_enum level, const std::string& message) const {
    if (fields_.empty()) {
        logger_->log(level, "{}", message);
        return;
    }
    std::string line = message;
    for (const auto& [key, value] : fields_) {
        line += fmt::format(" {}={}", key, value);
    }
    logger_->log(level, "{}", line);
}

}  // namespace dbxfer
