// SPDX-License-Identifier: MIT

// src/postgres.cpp
#include "dbxfer/postgres.hpp"

#include <poll.h>

#include <asio/posix/stream_descriptor.hpp>
#include <asio/use_awaitable.hpp>
#include <fmt/format.h>

#include "dbxfer/error.hpp"

namespace dbxfer {

namespace {

bool FdReady(int fd, short events) {
    struct pollfd pfd = {fd, events, 0};
    int rc = ::poll(&pfd, 1, 0);
    if (rc <= 0) return false;
    return (pfd.revents & (events | POLLERR | POLLHUP)) != 0;
}

// Escape a connection string value (single quotes, backslashes).
// Per libpq docs, values containing spaces/special chars need quoting.
std::string EscapeConninfoValue(std::string_view val) {
    bool needs_quoting = val.empty();
    for (char c : val) {
        if (c == ' ' || c == '\'' || c == '\\' || c == '=') {
            needs_quoting = true;
            break;
        }
    }
    if (!needs_quoting) {
        return std::string(val);
    }

    std::string result;
    result.reserve(val.size() + 2);
    result += '\'';
    for (char c : val) {
        if (c == '\'' || c == '\\') {
            result += '\\';
        }
        result += c;
    }
    result += '\'';
    return result;
}

std::string Quote(std::string_view s, char quote) {
    std::string result;
    result.reserve(s.size() + 2);
    result += quote;
    for (char c : s) {
        if (c == quote) result += quote;
        result += c;
    }
    result += quote;
    return result;
}

// Borrows libpq's socket for async waits without taking ownership of it.
class SocketWatcher {
public:
    SocketWatcher(const asio::any_io_executor& executor, int fd) : fd_(fd), socket_(executor, fd) {}
    ~SocketWatcher() { socket_.release(); }

    asio::awaitable<void> WaitReadable() {
        while (!FdReady(fd_, POLLIN)) {
            co_await socket_.async_wait(asio::posix::stream_descriptor::wait_read,
                                        asio::use_awaitable);
        }
    }

    asio::awaitable<void> WaitWritable() {
        while (!FdReady(fd_, POLLOUT)) {
            co_await socket_.async_wait(asio::posix::stream_descriptor::wait_write,
                                        asio::use_awaitable);
        }
    }

private:
    int fd_;
    asio::posix::stream_descriptor socket_;
};

}  // namespace

std::string PostgresConfig::ConnectionString() const {
    return fmt::format("host={} port={} dbname={} user={} password={}",
                       EscapeConninfoValue(host), port, EscapeConninfoValue(database),
                       EscapeConninfoValue(user), EscapeConninfoValue(password));
}

std::string QuoteIdentifier(std::string_view ident) {
    return Quote(ident, '"');
}

std::string QuoteLiteral(std::string_view value) {
    return Quote(value, '\'');
}

PostgresDatabase::PostgresDatabase(asio::any_io_executor executor, PostgresConfig config)
    : executor_(std::move(executor)), config_(std::move(config)) {}

PostgresDatabase::~PostgresDatabase() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

std::string PostgresDatabase::ConnectionError() const {
    std::string message = conn_ ? PQerrorMessage(conn_) : "no connection";
    while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) {
        message.pop_back();
    }
    return message;
}

asio::awaitable<void> PostgresDatabase::Connect() {
    if (conn_) co_return;

    conn_ = PQconnectdb(config_.ConnectionString().c_str());
    if (PQstatus(conn_) != CONNECTION_OK) {
        auto err = ConnectionError();
        PQfinish(conn_);
        conn_ = nullptr;
        throw TransferError(ErrorCode::DatabaseError,
                            fmt::format("cannot connect to {}:{}/{}: {}", config_.host,
                                        config_.port, config_.database, err));
    }

    if (PQsetnonblocking(conn_, 1) != 0) {
        auto err = ConnectionError();
        PQfinish(conn_);
        conn_ = nullptr;
        throw TransferError(ErrorCode::DatabaseError,
                            fmt::format("failed to set non-blocking mode: {}", err));
    }
}

bool PostgresDatabase::IsConnected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

asio::awaitable<PostgresDatabase::ResultPtr> PostgresDatabase::Run(std::string_view sql,
                                                                   ExecStatusType expected) {
    if (!IsConnected()) {
        throw TransferError(ErrorCode::DatabaseError, "not connected to database");
    }
    if (operation_in_flight_) {
        throw TransferError(ErrorCode::DatabaseError,
                            "concurrent operation on one database connection");
    }
    operation_in_flight_ = true;
    struct OperationGuard {
        bool& flag;
        ~OperationGuard() { flag = false; }
    } guard{operation_in_flight_};

    if (!PQsendQuery(conn_, std::string(sql).c_str())) {
        throw TransferError(ErrorCode::DatabaseError, ConnectionError());
    }

    int fd = PQsocket(conn_);
    if (fd < 0) {
        throw TransferError(ErrorCode::DatabaseError, "invalid socket from libpq connection");
    }
    SocketWatcher watcher(executor_, fd);

    // Nonblocking mode requires flushing the command ourselves.
    while (true) {
        int rc = PQflush(conn_);
        if (rc == 0) break;
        if (rc == -1) throw TransferError(ErrorCode::DatabaseError, ConnectionError());
        co_await watcher.WaitWritable();
    }

    while (PQisBusy(conn_)) {
        co_await watcher.WaitReadable();
        if (!PQconsumeInput(conn_)) {
            throw TransferError(ErrorCode::DatabaseError, ConnectionError());
        }
    }

    ResultPtr result(PQgetResult(conn_));
    // Drain anything after the first result to keep the connection usable.
    while (PGresult* extra = PQgetResult(conn_)) {
        PQclear(extra);
    }

    if (!result) {
        throw TransferError(ErrorCode::DatabaseError, "no result received");
    }
    if (PQresultStatus(result.get()) != expected) {
        std::string err = PQresultErrorMessage(result.get());
        while (!err.empty() && err.back() == '\n') err.pop_back();
        throw TransferError(ErrorCode::DatabaseError, fmt::format("query failed: {}", err));
    }
    co_return result;
}

asio::awaitable<QueryResult> PostgresDatabase::Query(std::string_view sql) {
    auto res = co_await Run(sql, PGRES_TUPLES_OK);

    int nrows = PQntuples(res.get());
    int ncols = PQnfields(res.get());

    std::vector<std::unique_ptr<IRow>> rows;
    rows.reserve(static_cast<size_t>(nrows));
    for (int r = 0; r < nrows; ++r) {
        std::vector<std::string> values;
        std::vector<bool> nulls;
        values.reserve(static_cast<size_t>(ncols));
        nulls.reserve(static_cast<size_t>(ncols));
        for (int c = 0; c < ncols; ++c) {
            nulls.push_back(PQgetisnull(res.get(), r, c) != 0);
            if (nulls.back()) {
                values.emplace_back();
            } else {
                values.emplace_back(PQgetvalue(res.get(), r, c));
            }
        }
        rows.push_back(std::make_unique<StringRow>(std::move(values), std::move(nulls)));
    }
    co_return QueryResult{std::move(rows)};
}

asio::awaitable<void> PostgresDatabase::Execute(std::string_view sql) {
    co_await Run(sql, PGRES_COMMAND_OK);
}

}  // namespace dbxfer
