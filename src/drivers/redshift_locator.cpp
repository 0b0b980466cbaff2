// SPDX-License-Identifier: MIT

// src/drivers/redshift_locator.cpp
#include "dbxfer/drivers/redshift_locator.hpp"

#include <cctype>
#include <charconv>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "dbxfer/drivers/s3_locator.hpp"
#include "dbxfer/url_encode.hpp"

namespace dbxfer {

namespace {

constexpr std::string_view kUrlPrefix = "redshift://";

std::expected<DataType, Error> FromRedshiftType(std::string_view type, std::string_view column) {
    if (type == "boolean") return DataType::Bool;
    if (type == "date") return DataType::Date;
    if (type == "numeric") return DataType::Decimal;
    if (type == "real") return DataType::Float32;
    if (type == "double precision") return DataType::Float64;
    if (type == "smallint") return DataType::Int16;
    if (type == "integer") return DataType::Int32;
    if (type == "bigint") return DataType::Int64;
    if (type == "json" || type == "jsonb") return DataType::Json;
    if (type == "character varying" || type == "character" || type == "text") {
        return DataType::Text;
    }
    if (type == "timestamp without time zone") return DataType::TimestampWithoutTimeZone;
    if (type == "timestamp with time zone") return DataType::TimestampWithTimeZone;
    if (type == "uuid") return DataType::Uuid;
    return std::unexpected(Error{ErrorCode::SchemaMismatch,
                                 fmt::format("column {} has unsupported type {}", column, type)});
}

std::string_view ToRedshiftType(DataType type) {
    switch (type) {
        case DataType::Bool:
            return "BOOLEAN";
        case DataType::Date:
            return "DATE";
        case DataType::Decimal:
            return "NUMERIC(38,9)";
        case DataType::Float32:
            return "REAL";
        case DataType::Float64:
            return "DOUBLE PRECISION";
        case DataType::Int16:
            return "SMALLINT";
        case DataType::Int32:
            return "INTEGER";
        case DataType::Int64:
            return "BIGINT";
        case DataType::Json:
        case DataType::Text:
        case DataType::Uuid:
            return "VARCHAR(65535)";
        case DataType::TimestampWithoutTimeZone:
            return "TIMESTAMP";
        case DataType::TimestampWithTimeZone:
            return "TIMESTAMPTZ";
    }
    return "VARCHAR(65535)";
}

std::string ColumnList(const Table& table) {
    if (table.columns.empty()) return "*";
    std::vector<std::string> names;
    names.reserve(table.columns.size());
    for (const auto& column : table.columns) names.push_back(QuoteIdentifier(column.name));
    return fmt::format("{}", fmt::join(names, ", "));
}

bool IsSqlIdentifier(std::string_view key) {
    if (key.empty() || std::isdigit(static_cast<unsigned char>(key[0]))) return false;
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

std::expected<RedshiftLocator, Error> InvalidUrl(std::string_view s, std::string_view problem) {
    return std::unexpected(Error{ErrorCode::InvalidLocator, fmt::format("{} {}", s, problem)});
}

}  // namespace

DatabaseFactory DefaultDatabaseFactory() {
    return [](const asio::any_io_executor& executor,
              const PostgresConfig& config) -> std::unique_ptr<IDatabase> {
        return std::make_unique<PostgresDatabase>(executor, config);
    };
}

std::expected<RedshiftLocator, Error> RedshiftLocator::Parse(std::string_view s) {
    return Parse(s, DefaultDatabaseFactory());
}

std::expected<RedshiftLocator, Error> RedshiftLocator::Parse(std::string_view s,
                                                             DatabaseFactory factory) {
    if (!s.starts_with(kUrlPrefix)) {
        return std::unexpected(Error{ErrorCode::InvalidLocator,
                                     fmt::format("expected {} to begin with {}", s, kUrlPrefix)});
    }
    auto rest = s.substr(kUrlPrefix.size());

    auto hash = rest.find('#');
    if (hash == std::string_view::npos || hash + 1 == rest.size()) {
        return InvalidUrl(s, "must end with #table or #schema.table");
    }
    auto fragment = rest.substr(hash + 1);
    rest = rest.substr(0, hash);

    auto slash = rest.find('/');
    if (slash == std::string_view::npos || slash + 1 == rest.size()) {
        return InvalidUrl(s, "must include a database name");
    }
    auto authority = rest.substr(0, slash);
    auto database = UrlDecode(rest.substr(slash + 1));
    if (!database) return std::unexpected(database.error());

    auto at = authority.rfind('@');
    if (at == std::string_view::npos || at == 0) {
        return InvalidUrl(s, "must include a user name");
    }
    auto userinfo = authority.substr(0, at);
    auto hostport = authority.substr(at + 1);

    PostgresConfig config;
    config.database = std::move(*database);
    config.port = kDefaultPort;

    auto colon = userinfo.find(':');
    auto user = UrlDecode(userinfo.substr(0, colon));
    if (!user) return std::unexpected(user.error());
    config.user = std::move(*user);
    if (colon != std::string_view::npos) {
        auto password = UrlDecode(userinfo.substr(colon + 1));
        if (!password) return std::unexpected(password.error());
        config.password = std::move(*password);
    }

    auto port_colon = hostport.rfind(':');
    config.host = std::string(hostport.substr(0, port_colon));
    if (port_colon != std::string_view::npos) {
        auto port = hostport.substr(port_colon + 1);
        auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), config.port);
        if (ec != std::errc{} || ptr != port.data() + port.size() || port.empty()) {
            return InvalidUrl(s, "has an invalid port");
        }
    }
    if (config.host.empty()) return InvalidUrl(s, "must include a host");

    std::string table_schema = "public";
    std::string table_name;
    auto dot = fragment.find('.');
    if (dot == std::string_view::npos) {
        table_name = std::string(fragment);
    } else {
        table_schema = std::string(fragment.substr(0, dot));
        table_name = std::string(fragment.substr(dot + 1));
    }
    if (table_schema.empty() || table_name.empty()) {
        return InvalidUrl(s, "must end with #table or #schema.table");
    }

    return RedshiftLocator(std::move(config), std::move(table_schema), std::move(table_name),
                           std::move(factory));
}

Features RedshiftLocator::StaticFeatures() {
    auto if_exists = IfExistsFeatures::Error | IfExistsFeatures::Overwrite |
                     IfExistsFeatures::Append;
    return Features{
        .locator = LocatorFeatures::Schema | LocatorFeatures::WriteSchema,
        .write_schema_if_exists = if_exists,
        .dest_if_exists = if_exists,
        .source_args = SourceArgumentsFeatures::DriverArgs | SourceArgumentsFeatures::WhereClause,
        .dest_args = DestinationArgumentsFeatures::DriverArgs,
    };
}

std::string RedshiftLocator::QualifiedName() const {
    return fmt::format("{}.{}", QuoteIdentifier(table_schema_), QuoteIdentifier(table_name_));
}

std::string RedshiftLocator::ToString() const {
    std::string userinfo = UrlEncode(config_.user);
    if (!config_.password.empty()) {
        userinfo += ':';
        userinfo += UrlEncode(config_.password);
    }
    return fmt::format("{}{}@{}:{}/{}#{}.{}", kUrlPrefix, userinfo, config_.host, config_.port,
                       UrlEncode(config_.database), table_schema_, table_name_);
}

asio::awaitable<std::unique_ptr<IDatabase>> RedshiftLocator::Connect(const Context& ctx) const {
    ctx.Debug("connecting to {}:{}/{}", config_.host, config_.port, config_.database);
    auto db = factory_(ctx.executor(), config_);
    co_await db->Connect();
    co_return db;
}

asio::awaitable<std::optional<Table>> RedshiftLocator::Schema(Context ctx) const {
    auto db = co_await Connect(ctx);
    auto sql = fmt::format(
        "SELECT column_name, data_type, is_nullable FROM information_schema.columns "
        "WHERE table_schema = {} AND table_name = {} ORDER BY ordinal_position",
        QuoteLiteral(table_schema_), QuoteLiteral(table_name_));
    auto rows = co_await db->Query(sql);
    if (rows.empty()) co_return std::nullopt;

    Table table{.name = table_name_};
    for (const auto& row : rows) {
        std::string name(row->GetString(0));
        auto data_type = FromRedshiftType(row->GetString(1), name);
        if (!data_type) throw TransferError(data_type.error());
        table.columns.push_back(Column{
            .name = std::move(name),
            .data_type = *data_type,
            .is_nullable = row->GetString(2) == "YES",
        });
    }
    co_return table;
}

std::vector<std::string> CreateTableSql(const std::string& qualified_name, const Table& table,
                                        const IfExists& if_exists) {
    std::vector<std::string> columns;
    columns.reserve(table.columns.size());
    for (const auto& column : table.columns) {
        columns.push_back(fmt::format("{} {}{}", QuoteIdentifier(column.name),
                                      ToRedshiftType(column.data_type),
                                      column.is_nullable ? "" : " NOT NULL"));
    }
    auto body = fmt::format("{} ({})", qualified_name, fmt::join(columns, ", "));

    switch (if_exists.policy()) {
        case IfExists::Policy::Error:
            return {fmt::format("CREATE TABLE {}", body)};
        case IfExists::Policy::Overwrite:
            return {fmt::format("DROP TABLE IF EXISTS {}", qualified_name),
                    fmt::format("CREATE TABLE {}", body)};
        case IfExists::Policy::Append:
            return {fmt::format("CREATE TABLE IF NOT EXISTS {}", body)};
        case IfExists::Policy::Upsert:
            break;
    }
    throw TransferError(ErrorCode::UnsupportedFeature,
                        fmt::format("redshift: does not support --if-exists={}",
                                    if_exists.ToString()));
}

std::expected<std::string, Error> DriverArgsToSql(const DriverArgs& args) {
    std::vector<std::string> clauses;
    for (const auto& [key, value] : args.items()) {
        if (!IsSqlIdentifier(key)) {
            return std::unexpected(Error{ErrorCode::InvalidArgument,
                                         fmt::format("invalid redshift option name {}", key)});
        }
        std::string upper;
        for (char c : key) upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        clauses.push_back(fmt::format("{} {}", upper, QuoteLiteral(value)));
    }
    return fmt::format("{}", fmt::join(clauses, " "));
}

asio::awaitable<void> RedshiftLocator::WriteSchema(Context ctx, Table table,
                                                   IfExists if_exists) const {
    auto statements = CreateTableSql(QualifiedName(), table, if_exists);
    auto db = co_await Connect(ctx);
    for (const auto& sql : statements) {
        ctx.Debug("executing {}", sql);
        co_await db->Execute(sql);
    }
}

bool RedshiftLocator::SupportsWriteRemoteData(const Locator& source) const {
    return dynamic_cast<const S3Locator*>(&source) != nullptr;
}

asio::awaitable<void> RedshiftLocator::WriteRemoteData(Context ctx, BoxLocator source,
                                                       SharedArguments shared,
                                                       SourceArguments source_args,
                                                       DestinationArguments dest_args) const {
    const auto* s3 = dynamic_cast<const S3Locator*>(source.get());
    if (!s3) ThrowUnsupported(fmt::format("copying directly from {}", source->ToString()));
    if (auto ok = source_args.query.FailIfQueryDetailsProvided(); !ok) {
        throw TransferError(ok.error());
    }

    auto options = DriverArgsToSql(dest_args.driver_args);
    if (!options) throw TransferError(options.error());

    auto statements = CreateTableSql(QualifiedName(), shared.schema, dest_args.if_exists);
    statements.push_back(fmt::format("COPY {} ({}) FROM {}{} FORMAT AS CSV IGNOREHEADER 1",
                                     QualifiedName(), ColumnList(shared.schema),
                                     QuoteLiteral(s3->url()),
                                     options->empty() ? "" : " " + *options));

    auto db = co_await Connect(ctx);
    for (const auto& sql : statements) {
        ctx.Debug("executing {}", sql);
        co_await db->Execute(sql);
    }
}

asio::awaitable<void> RedshiftLocator::UnloadTo(Context ctx, std::string s3_url,
                                                SharedArguments shared,
                                                SourceArguments source_args,
                                                DestinationArguments dest_args) const {
    auto options = DriverArgsToSql(source_args.driver_args);
    if (!options) throw TransferError(options.error());

    auto select = fmt::format("SELECT {} FROM {}", ColumnList(shared.schema), QualifiedName());
    if (source_args.query.where_clause) {
        select += fmt::format(" WHERE {}", *source_args.query.where_clause);
    }
    bool overwrite = dest_args.if_exists.policy() == IfExists::Policy::Overwrite;
    auto sql = fmt::format("UNLOAD ({}) TO {}{} FORMAT AS CSV HEADER{}", QuoteLiteral(select),
                           QuoteLiteral(s3_url), options->empty() ? "" : " " + *options,
                           overwrite ? " ALLOWOVERWRITE" : "");

    auto db = co_await Connect(ctx);
    ctx.Debug("executing {}", sql);
    co_await db->Execute(sql);
}

}  // namespace dbxfer
