// SPDX-License-Identifier: MIT

// include/dbxfer/database.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <asio/awaitable.hpp>

namespace dbxfer {

// Query result row
class IRow {
public:
    virtual ~IRow() = default;

    virtual std::string_view GetString(std::size_t col) const = 0;
    virtual bool IsNull(std::size_t col) const = 0;
};

// Query result set
class QueryResult {
public:
    QueryResult() = default;
    explicit QueryResult(std::vector<std::unique_ptr<IRow>> rows)
        : rows_(std::move(rows)) {}

    bool empty() const { return rows_.empty(); }
    std::size_t size() const { return rows_.size(); }

    const IRow& operator[](std::size_t i) const { return *rows_[i]; }

    auto begin() const { return rows_.begin(); }
    auto end() const { return rows_.end(); }

private:
    std::vector<std::unique_ptr<IRow>> rows_;
};

// A SQL connection. One operation at a time; every call is awaited before the next.
class IDatabase {
public:
    virtual ~IDatabase() = default;

    virtual asio::awaitable<void> Connect() = 0;
    virtual asio::awaitable<QueryResult> Query(std::string_view sql) = 0;
    virtual asio::awaitable<void> Execute(std::string_view sql) = 0;

    virtual bool IsConnected() const = 0;
};

// Row of plain strings, used by PostgresDatabase and by test fakes.
class StringRow : public IRow {
public:
    StringRow(std::vector<std::string> values, std::vector<bool> nulls)
        : values_(std::move(values)), nulls_(std::move(nulls)) {}

    std::string_view GetString(std::size_t col) const override {
        if (col >= values_.size() || nulls_[col]) {
            return {};
        }
        return values_[col];
    }

    bool IsNull(std::size_t col) const override {
        return col >= nulls_.size() || nulls_[col];
    }

private:
    std::vector<std::string> values_;
    std::vector<bool> nulls_;
};

}  // namespace dbxfer
