// SPDX-License-Identifier: MIT

// include/dbxfer/context.hpp
#pragma once

#include <exception>
#include <expected>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "dbxfer/error.hpp"
#include "dbxfer/process.hpp"

namespace dbxfer {

/// key=value pairs appended to every log line of a Context.
using LogFields = std::vector<std::pair<std::string, std::string>>;

namespace detail {

// State shared by the senders and the receiver of a Context's error channel.
// The timer never expires; cancelling it is the wakeup signal.
struct ErrorChannel {
    explicit ErrorChannel(const asio::any_io_executor& executor)
        : wakeup(executor, asio::steady_timer::time_point::max()) {}

    void Wake() {
        if (receiver_alive) wakeup.cancel();
    }

    asio::steady_timer wakeup;
    std::exception_ptr error;
    bool senders_closed = false;
    bool receiver_alive = true;
};

enum class SendResult {
    Sent,
    Full,    // An earlier error already occupies the slot
    Closed,  // Nobody is waiting any more
};

// Shared by every copy of a Context. Destroying the last copy closes the
// sending side of the channel.
class ErrorSender {
public:
    explicit ErrorSender(std::shared_ptr<ErrorChannel> channel) : channel_(std::move(channel)) {}
    ~ErrorSender();

    ErrorSender(const ErrorSender&) = delete;
    ErrorSender& operator=(const ErrorSender&) = delete;

    SendResult Send(std::exception_ptr error);

private:
    std::shared_ptr<ErrorChannel> channel_;
};

// Owned by the supervision coroutine. Once it is gone, errors have nowhere to go.
class ErrorReceiver {
public:
    explicit ErrorReceiver(std::shared_ptr<ErrorChannel> channel) : channel_(std::move(channel)) {}
    ~ErrorReceiver();

    ErrorReceiver(ErrorReceiver&& other) noexcept = default;
    ErrorReceiver& operator=(ErrorReceiver&&) = delete;
    ErrorReceiver(const ErrorReceiver&) = delete;
    ErrorReceiver& operator=(const ErrorReceiver&) = delete;

    ErrorChannel& channel() { return *channel_; }

private:
    std::shared_ptr<ErrorChannel> channel_;
};

}  // namespace detail

/// Scoped execution context for one transfer.
///
/// A Context carries a logger with structured fields, the executor every
/// background task runs on, and the sending side of an error channel with a
/// single slot. Copies are cheap and share the channel.
///
/// Create() also returns a supervision handle: an awaitable that completes
/// when every copy of the Context has been destroyed without an error being
/// reported, or throws the first reported error. Errors reported after the
/// slot is filled, or after the handle is gone, are logged at debug level and
/// dropped.
///
/// Thread safety: not thread-safe. All copies must be used from the thread
/// running the executor.
class Context {
public:
    /// @return The root context and its supervision handle.
    static std::pair<Context, asio::awaitable<void>> Create(
        asio::any_io_executor executor, std::shared_ptr<spdlog::logger> logger);

    /// Root context for unit tests, logging at debug level with a test=<name> field.
    static std::pair<Context, asio::awaitable<void>> CreateForTest(
        asio::any_io_executor executor, const std::string& test_name);

    /// A context sharing this one's channel, with @p fields added to its logs.
    Context Child(LogFields fields) const;

    /// Run @p worker in the background. If it throws, the exception is
    /// reported on the error channel.
    void SpawnWorker(asio::awaitable<void> worker) const;

    /// Watch a child process in the background. A launch failure or a
    /// non-zero exit status is reported like a worker error.
    void SpawnProcess(std::string name,
                      std::expected<ChildProcess, dbxfer::Error> process) const;

    /// Report @p error on the channel.
    void ReportError(std::exception_ptr error) const;

    const asio::any_io_executor& executor() const { return executor_; }
    const std::shared_ptr<spdlog::logger>& logger() const { return logger_; }
    const LogFields& fields() const { return fields_; }

    template <typename... Args>
    void Log(spdlog::level::level_enum level, fmt::format_string<Args...> format,
             Args&&... args) const {
        if (!logger_->should_log(level)) return;
        Emit(level, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void Trace(fmt::format_string<Args...> format, Args&&... args) const {
        Log(spdlog::level::trace, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Debug(fmt::format_string<Args...> format, Args&&... args) const {
        Log(spdlog::level::debug, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Info(fmt::format_string<Args...> format, Args&&... args) const {
        Log(spdlog::level::info, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Warn(fmt::format_string<Args...> format, Args&&... args) const {
        Log(spdlog::level::warn, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Error(fmt::format_string<Args...> format, Args&&... args) const {
        Log(spdlog::level::err, format, std::forward<Args>(args)...);
    }

private:
    Context(asio::any_io_executor executor, std::shared_ptr<spdlog::logger> logger,
            LogFields fields, std::shared_ptr<detail::ErrorSender> sender)
        : executor_(std::move(executor))
        , logger_(std::move(logger))
        , fields_(std::move(fields))
        , sender_(std::move(sender)) {}

    void Emit(spdlog::level::level_enum level, const std::string& message) const;

    asio::any_io_executor executor_;
    std::shared_ptr<spdlog::logger> logger_;
    LogFields fields_;
    std::shared_ptr<detail::ErrorSender> sender_;
};

/// Render an exception for a log line or error message.
std::string DescribeException(std::exception_ptr error);

}  // namespace dbxfer
