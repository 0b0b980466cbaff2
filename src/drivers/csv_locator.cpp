// SPDX-License-Identifier: MIT

// src/drivers/csv_locator.cpp
#include "dbxfer/drivers/csv_locator.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <functional>
#include <system_error>

#include <fmt/format.h>

#include "dbxfer/io.hpp"

namespace dbxfer {

namespace fs = std::filesystem;

namespace {

// Split one CSV record into fields, honoring double quotes and "" escapes.
std::vector<std::string> SplitCsvHeader(std::string_view line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else {
            field.push_back(c);
        }
    }
    fields.push_back(std::move(field));
    return fields;
}

asio::awaitable<void> WriteStreamToFile(Context ctx, BoxStream<Bytes> data, fs::path dest,
                                        IfExists if_exists) {
    auto flags = if_exists.ToOpenFlagsNoAppend();
    if (!flags) throw TransferError(flags.error());

    auto dir = dest.parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw TransferError(
                ErrorCode::IoError,
                fmt::format("unable to create directory {}: {}", dir.string(), ec.message()),
                ec.value());
        }
    }

    ctx.Debug("writing stream to file {}", dest.string());
    FileDescriptor fd(::open(dest.c_str(), *flags, 0666));
    if (!fd.valid()) {
        int err = errno;
        throw TransferError(ErrorCode::IoError,
                            fmt::format("cannot open {}: {}", dest.string(), std::strerror(err)),
                            err);
    }
    co_await WriteStreamToFd(std::move(data), fd.get(), dest.string());
}

asio::awaitable<void> WriteStreamToStdout(Context ctx, BoxStream<Bytes> data) {
    ctx.Debug("writing stream to stdout");
    co_await WriteStreamToFd(std::move(data), STDOUT_FILENO, "stdout");
}

}  // namespace

std::expected<CsvLocator, Error> CsvLocator::Parse(std::string_view s) {
    auto path = PathOrStdio::Parse(kScheme, s);
    if (!path) return std::unexpected(path.error());
    return CsvLocator(std::move(*path));
}

Features CsvLocator::StaticFeatures() {
    return Features{
        .locator = LocatorFeatures::Schema | LocatorFeatures::LocalData |
                   LocatorFeatures::WriteLocalData,
        .dest_if_exists = IfExistsFeatures::NoAppend,
    };
}

asio::awaitable<std::optional<Table>> CsvLocator::Schema(Context ctx) const {
    if (path_.is_stdio()) {
        throw TransferError(ErrorCode::NotSupported, "cannot yet read CSV schema from stdin");
    }

    const auto& path = path_.path();
    ctx.Debug("reading CSV header from {}", path.string());
    if (std::error_code ec; fs::is_directory(path, ec)) {
        throw TransferError(ErrorCode::NotSupported,
                            fmt::format("cannot read CSV schema from directory {}", path.string()));
    }
    std::ifstream in(path);
    if (!in) {
        int err = errno;
        throw TransferError(ErrorCode::IoError,
                            fmt::format("error opening {}: {}", path.string(), std::strerror(err)),
                            err);
    }

    std::string header;
    std::getline(in, header);
    if (in.bad()) {
        throw TransferError(ErrorCode::IoError, fmt::format("error reading {}", path.string()));
    }
    if (header.ends_with('\r')) header.pop_back();

    Table table;
    table.name = path.stem().string();
    if (table.name.empty()) table.name = "data";
    if (!header.empty()) {
        for (auto& name : SplitCsvHeader(header)) {
            table.columns.push_back(Column{
                .name = std::move(name),
                .data_type = DataType::Text,
                .is_nullable = true,
            });
        }
    }
    co_return table;
}

std::vector<fs::path> FindCsvFiles(const Context& ctx, const fs::path& base) {
    ctx.Debug("walking {}", base.string());

    std::vector<fs::path> found;
    // An entry with `leaving` set marks the end of a directory's children.
    struct Pending {
        fs::path path;
        bool leaving = false;
    };
    std::vector<Pending> pending{Pending{base}};
    // Canonical paths of the directories on the current descent path.
    std::vector<fs::path> ancestors;

    while (!pending.empty()) {
        auto [p, leaving] = std::move(pending.back());
        pending.pop_back();
        if (leaving) {
            ancestors.pop_back();
            continue;
        }
        ctx.Trace("found dirent {}", p.string());

        std::error_code ec;
        auto status = fs::status(p, ec);  // follows symlinks
        if (ec) {
            throw TransferError(ErrorCode::IoError,
                                fmt::format("error listing files in {}: {}: {}", base.string(),
                                            p.string(), ec.message()),
                                ec.value());
        }

        if (fs::is_directory(status)) {
            auto canonical = fs::canonical(p, ec);
            if (ec) {
                throw TransferError(ErrorCode::IoError,
                                    fmt::format("error listing files in {}: {}", base.string(),
                                                ec.message()),
                                    ec.value());
            }
            if (std::find(ancestors.begin(), ancestors.end(), canonical) != ancestors.end()) {
                throw TransferError(ErrorCode::StructuralError,
                                    fmt::format("symbolic link loop at {}", p.string()));
            }

            std::vector<fs::path> children;
            for (fs::directory_iterator it(p, ec), end; !ec && it != end; it.increment(ec)) {
                children.push_back(it->path());
            }
            if (ec) {
                throw TransferError(ErrorCode::IoError,
                                    fmt::format("error listing files in {}: {}", p.string(),
                                                ec.message()),
                                    ec.value());
            }
            // Reverse order so the smallest name is popped first.
            std::sort(children.begin(), children.end(), std::greater<>());
            ancestors.push_back(std::move(canonical));
            pending.push_back({.leaving = true});
            for (auto& child : children) pending.push_back({std::move(child)});
            continue;
        }

        if (!fs::is_regular_file(status)) {
            throw TransferError(ErrorCode::StructuralError,
                                fmt::format("not a file: {}", p.string()));
        }

        auto ext = p.extension();
        if (ext != ".csv" && ext != ".CSV") {
            throw TransferError(ErrorCode::StructuralError,
                                fmt::format("{} must end in *.csv or *.CSV", p.string()));
        }
        found.push_back(std::move(p));
    }
    return found;
}

asio::awaitable<std::optional<BoxStream<CsvStream>>> CsvLocator::LocalData(
    Context ctx, SharedArguments, SourceArguments source) const {
    if (auto ok = source.query.FailIfQueryDetailsProvided(); !ok) {
        throw TransferError(ok.error());
    }
    if (!source.driver_args.empty()) {
        throw TransferError(ErrorCode::UnsupportedFeature, "csv: does not accept --from-arg");
    }

    if (path_.is_stdio()) {
        FileDescriptor in(::dup(STDIN_FILENO));
        if (!in.valid()) {
            int err = errno;
            throw TransferError(ErrorCode::IoError,
                                fmt::format("cannot read stdin: {}", std::strerror(err)), err);
        }
        co_return MakeOnceStream(CsvStream{
            .name = "data",
            .data = ReadFdStream(std::move(in), "stdin"),
        });
    }

    // Walk up front so structural problems are reported before any data moves.
    auto base = path_.path();
    auto paths = FindCsvFiles(ctx, base);
    std::function<CsvStream(fs::path)> open = [ctx, base](fs::path file) {
        auto name = CsvStreamName(base.string(), file.string());
        if (!name) throw TransferError(name.error());
        ctx.Child({{"stream", *name}, {"path", file.string()}}).Debug("opening partition");
        return CsvStream{.name = std::move(*name), .data = ReadFileStream(file)};
    };
    co_return MakeMapStream(MakeVectorStream(std::move(paths)), std::move(open));
}

asio::awaitable<BoxStream<asio::awaitable<void>>> CsvLocator::WriteLocalData(
    Context ctx, BoxStream<CsvStream> data, SharedArguments, DestinationArguments dest) const {
    if (!dest.driver_args.empty()) {
        throw TransferError(ErrorCode::UnsupportedFeature, "csv: does not accept --to-arg");
    }

    if (path_.is_stdio()) {
        dest.if_exists.WarnIfNotDefaultForStdout(ctx);
        auto stream = ConcatenateCsvStreams(ctx, std::move(data));
        co_return MakeOnceStream(WriteStreamToStdout(ctx, std::move(stream.data)));
    }

    if (path_.is_directory()) {
        auto dir = path_.path();
        auto if_exists = dest.if_exists;
        std::function<asio::awaitable<void>(CsvStream)> write =
            [ctx, dir, if_exists](CsvStream stream) {
                auto csv_path = dir / (stream.name + ".csv");
                auto child = ctx.Child({{"stream", stream.name}, {"path", csv_path.string()}});
                return WriteStreamToFile(std::move(child), std::move(stream.data),
                                         std::move(csv_path), if_exists);
            };
        co_return MakeMapStream(std::move(data), std::move(write));
    }

    auto stream = ConcatenateCsvStreams(ctx, std::move(data));
    auto child = ctx.Child({{"stream", stream.name}, {"path", path_.path().string()}});
    co_return MakeOnceStream(
        WriteStreamToFile(std::move(child), std::move(stream.data), path_.path(), dest.if_exists));
}

}  // namespace dbxfer
