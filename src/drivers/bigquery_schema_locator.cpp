// SPDX-License-Identifier: MIT

// src/drivers/bigquery_schema_locator.cpp
#include "dbxfer/drivers/bigquery_schema_locator.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <fmt/format.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include "dbxfer/io.hpp"
#include "dbxfer/json.hpp"

namespace dbxfer {

namespace {

constexpr std::string_view kPlaceholderTableName = "unnamed";

std::expected<DataType, std::string> FromBigQueryType(std::string_view type) {
    if (type == "BOOL" || type == "BOOLEAN") return DataType::Bool;
    if (type == "DATE") return DataType::Date;
    if (type == "NUMERIC") return DataType::Decimal;
    if (type == "FLOAT64" || type == "FLOAT") return DataType::Float64;
    if (type == "INT64" || type == "INTEGER") return DataType::Int64;
    if (type == "STRING") return DataType::Text;
    if (type == "DATETIME") return DataType::TimestampWithoutTimeZone;
    if (type == "TIMESTAMP") return DataType::TimestampWithTimeZone;
    if (type == "JSON") return DataType::Json;
    return std::unexpected(fmt::format("unsupported BigQuery type {}", type));
}

std::string_view ToBigQueryType(DataType type) {
    switch (type) {
        case DataType::Bool:
            return "BOOL";
        case DataType::Date:
            return "DATE";
        case DataType::Decimal:
            return "NUMERIC";
        case DataType::Float32:
        case DataType::Float64:
            return "FLOAT64";
        case DataType::Int16:
        case DataType::Int32:
        case DataType::Int64:
            return "INT64";
        case DataType::Json:
            return "JSON";
        case DataType::Text:
        case DataType::Uuid:
            return "STRING";
        case DataType::TimestampWithoutTimeZone:
            return "DATETIME";
        case DataType::TimestampWithTimeZone:
            return "TIMESTAMP";
    }
    return "STRING";
}

// Builds columns from a top-level array of column records.
class ColumnsBuilder {
public:
    using Result = std::vector<Column>;

    void OnKey(std::string_view key) { key_ = key; }

    void OnString(std::string_view value) {
        if (depth_ != 2) {
            Fail("expected an array of column objects");
            return;
        }
        if (key_ == "name") {
            name_ = value;
        } else if (key_ == "type") {
            type_ = value;
        } else if (key_ == "mode") {
            mode_ = value;
        } else if (key_ == "description") {
            description_ = value;
        }
    }

    void OnInt(int64_t) { UnexpectedScalar(); }
    void OnUint(uint64_t) { UnexpectedScalar(); }
    void OnDouble(double) { UnexpectedScalar(); }
    void OnBool(bool) { UnexpectedScalar(); }
    void OnNull() {}

    void OnStartObject() {
        ++depth_;
        if (depth_ == 1) {
            Fail("expected an array of column objects");
            return;
        }
        if (depth_ != 2) {
            Fail("nested fields are not supported");
            return;
        }
        name_.reset();
        type_.reset();
        mode_.reset();
        description_.reset();
    }

    void OnEndObject() {
        if (depth_ == 2) FinishColumn();
        --depth_;
    }

    void OnStartArray() {
        ++depth_;
        if (depth_ == 1) {
            saw_array_ = true;
        } else {
            Fail("nested fields are not supported");
        }
    }

    void OnEndArray() { --depth_; }

    std::expected<Result, std::string> Build() {
        if (error_) return std::unexpected(*error_);
        if (!saw_array_) return std::unexpected(std::string("expected an array of column objects"));
        return std::move(columns_);
    }

private:
    void Fail(std::string message) {
        if (!error_) error_ = std::move(message);
    }

    void UnexpectedScalar() {
        Fail(depth_ == 2 ? fmt::format("unexpected value for \"{}\"", key_)
                         : std::string("expected an array of column objects"));
    }

    void FinishColumn() {
        if (error_) return;
        if (!name_ || !type_) {
            Fail("every column needs a \"name\" and a \"type\"");
            return;
        }
        auto data_type = FromBigQueryType(*type_);
        if (!data_type) {
            Fail(data_type.error());
            return;
        }
        bool nullable = true;
        if (mode_ && *mode_ == "REQUIRED") {
            nullable = false;
        } else if (mode_ && *mode_ == "REPEATED") {
            Fail(fmt::format("REPEATED column {} is not supported", *name_));
            return;
        } else if (mode_ && *mode_ != "NULLABLE") {
            Fail(fmt::format("unknown mode {} for column {}", *mode_, *name_));
            return;
        }
        columns_.push_back(Column{
            .name = std::move(*name_),
            .data_type = *data_type,
            .is_nullable = nullable,
            .comment = std::move(description_),
        });
    }

    int depth_ = 0;
    bool saw_array_ = false;
    std::string key_;
    std::optional<std::string> name_;
    std::optional<std::string> type_;
    std::optional<std::string> mode_;
    std::optional<std::string> description_;
    std::vector<Column> columns_;
    std::optional<std::string> error_;
};

static_assert(JsonBuilder<ColumnsBuilder>);

asio::awaitable<void> WriteToPath(Context ctx, PathOrStdio path, std::string text,
                                  IfExists if_exists) {
    if (path.is_stdio()) {
        if_exists.WarnIfNotDefaultForStdout(ctx);
        co_await WriteStreamToFd(MakeOnceStream(ToBytes(text)), STDOUT_FILENO, "stdout");
        co_return;
    }

    auto flags = if_exists.ToOpenFlagsNoAppend();
    if (!flags) throw TransferError(flags.error());
    const auto& dest = path.path();
    FileDescriptor fd(::open(dest.c_str(), *flags, 0666));
    if (!fd.valid()) {
        int err = errno;
        throw TransferError(ErrorCode::IoError,
                            fmt::format("cannot open {}: {}", dest.string(), std::strerror(err)),
                            err);
    }
    co_await WriteStreamToFd(MakeOnceStream(ToBytes(text)), fd.get(), dest.string());
}

}  // namespace

std::expected<Table, Error> ParseBigQuerySchema(std::string_view json,
                                                std::string_view description) {
    ColumnsBuilder builder;
    auto columns = ParseJson(json, builder, description);
    if (!columns) return std::unexpected(columns.error());

    Table table{.name = std::string(kPlaceholderTableName), .columns = std::move(*columns)};
    if (auto valid = ValidateTable(table); !valid) return std::unexpected(valid.error());
    return table;
}

std::string FormatBigQuerySchema(const Table& table) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);

    auto write_string = [&writer](std::string_view s) {
        writer.String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
    };

    writer.StartArray();
    for (const auto& column : table.columns) {
        writer.StartObject();
        writer.Key("name");
        write_string(column.name);
        writer.Key("type");
        write_string(ToBigQueryType(column.data_type));
        writer.Key("mode");
        write_string(column.is_nullable ? "NULLABLE" : "REQUIRED");
        if (column.comment) {
            writer.Key("description");
            write_string(*column.comment);
        }
        writer.EndObject();
    }
    writer.EndArray();

    std::string out(buffer.GetString(), buffer.GetSize());
    out.push_back('\n');
    return out;
}

std::expected<BigQuerySchemaLocator, Error> BigQuerySchemaLocator::Parse(std::string_view s) {
    auto path = PathOrStdio::Parse(kScheme, s);
    if (!path) return std::unexpected(path.error());
    return BigQuerySchemaLocator(std::move(*path));
}

Features BigQuerySchemaLocator::StaticFeatures() {
    return Features{
        .locator = LocatorFeatures::Schema | LocatorFeatures::WriteSchema,
        .write_schema_if_exists = IfExistsFeatures::NoAppend,
    };
}

asio::awaitable<std::optional<Table>> BigQuerySchemaLocator::Schema(Context ctx) const {
    BoxStream<Bytes> input;
    if (path_.is_stdio()) {
        FileDescriptor in(::dup(STDIN_FILENO));
        if (!in.valid()) {
            int err = errno;
            throw TransferError(ErrorCode::IoError,
                                fmt::format("cannot read stdin: {}", std::strerror(err)), err);
        }
        input = ReadFdStream(std::move(in), "stdin");
    } else {
        input = ReadFileStream(path_.path());
    }

    ctx.Debug("reading BigQuery schema from {}", ToString());
    auto bytes = co_await ReadAll(std::move(input));
    auto table = ParseBigQuerySchema(AsStringView(bytes), ToString());
    if (!table) throw TransferError(table.error());
    co_return std::move(*table);
}

asio::awaitable<void> BigQuerySchemaLocator::WriteSchema(Context ctx, Table table,
                                                         IfExists if_exists) const {
    ctx.Debug("writing BigQuery schema for {} to {}", table.name, ToString());
    co_await WriteToPath(ctx, path_, FormatBigQuerySchema(table), std::move(if_exists));
}

}  // namespace dbxfer
