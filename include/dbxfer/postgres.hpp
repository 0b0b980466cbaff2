// SPDX-License-Identifier: MIT

// include/dbxfer/postgres.hpp
#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <libpq-fe.h>

#include "dbxfer/database.hpp"

namespace dbxfer {

struct PostgresConfig {
    std::string host = "localhost";
    int port = 5432;
    std::string database;
    std::string user;
    std::string password;

    /// libpq conninfo string, with values quoted where needed.
    std::string ConnectionString() const;

    bool operator==(const PostgresConfig&) const = default;
};

/// Quote an SQL identifier ("name" with embedded quotes doubled).
std::string QuoteIdentifier(std::string_view ident);

/// Quote an SQL string literal ('text' with embedded quotes doubled).
std::string QuoteLiteral(std::string_view value);

// IDatabase over a nonblocking libpq connection. The connection socket is
// watched with a stream_descriptor on the executor so queries never block it.
//
// Not thread-safe, and only one operation may be in flight at a time.
class PostgresDatabase : public IDatabase {
public:
    PostgresDatabase(asio::any_io_executor executor, PostgresConfig config);
    ~PostgresDatabase() override;

    PostgresDatabase(const PostgresDatabase&) = delete;
    PostgresDatabase& operator=(const PostgresDatabase&) = delete;

    asio::awaitable<void> Connect() override;
    asio::awaitable<QueryResult> Query(std::string_view sql) override;
    asio::awaitable<void> Execute(std::string_view sql) override;

    bool IsConnected() const override;

private:
    struct ResultDeleter {
        void operator()(PGresult* res) const { PQclear(res); }
    };
    using ResultPtr = std::unique_ptr<PGresult, ResultDeleter>;

    // Send @p sql and wait for its result, which must have status @p expected.
    asio::awaitable<ResultPtr> Run(std::string_view sql, ExecStatusType expected);

    std::string ConnectionError() const;

    asio::any_io_executor executor_;
    PostgresConfig config_;
    PGconn* conn_ = nullptr;
    bool operation_in_flight_ = false;
};

}  // namespace dbxfer
