// SPDX-License-Identifier: MIT

// src/csv_stream.cpp
#include "dbxfer/csv_stream.hpp"

#include <algorithm>
#include <optional>

#include <fmt/format.h>

namespace dbxfer {

std::expected<std::string, Error> CsvStreamName(std::string_view base_path,
                                                std::string_view file_path) {
    std::string_view relative;
    if (file_path == base_path) {
        auto slash = file_path.rfind('/');
        relative = slash == std::string_view::npos ? file_path : file_path.substr(slash + 1);
    } else if (file_path.starts_with(base_path) &&
               (base_path.ends_with('/') || file_path.substr(base_path.size()).starts_with('/'))) {
        relative = file_path.substr(base_path.size());
        while (relative.starts_with('/')) relative.remove_prefix(1);
    } else {
        return std::unexpected(
            Error{ErrorCode::StructuralError,
                  fmt::format("file path {} did not start with {}", file_path, base_path)});
    }

    // Strip the extension of the last path component only.
    auto slash = relative.rfind('/');
    auto dot = relative.rfind('.');
    if (dot != std::string_view::npos && (slash == std::string_view::npos || dot > slash + 1)) {
        relative = relative.substr(0, dot);
    }
    if (relative.empty()) {
        return std::unexpected(Error{ErrorCode::StructuralError,
                                     fmt::format("cannot name a stream for {}", file_path)});
    }
    return std::string(relative);
}

namespace {

class ConcatenatedStream : public AsyncStream<Bytes> {
public:
    ConcatenatedStream(Context ctx, BoxStream<CsvStream> streams)
        : ctx_(std::move(ctx)), streams_(std::move(streams)) {}

    asio::awaitable<std::optional<Bytes>> Next() override {
        while (true) {
            if (!current_) {
                auto next = co_await streams_->Next();
                if (!next) co_return std::nullopt;
                ctx_.Debug("concatenating stream {}", next->name);
                current_ = std::move(next);
                skipping_header_ = header_written_;
                emitted_in_partition_ = false;
            }

            auto chunk = co_await current_->data->Next();
            if (!chunk) {
                // Any partition that produced bytes has produced the header.
                if (emitted_in_partition_) {
                    header_written_ = true;
                    needs_newline_ = last_byte_ != std::byte{'\n'};
                }
                current_.reset();
                continue;
            }

            if (skipping_header_) {
                auto newline = std::find(chunk->begin(), chunk->end(), std::byte{'\n'});
                if (newline == chunk->end()) continue;
                chunk->erase(chunk->begin(), newline + 1);
                skipping_header_ = false;
            }
            if (chunk->empty()) continue;

            if (!header_written_ &&
                std::find(chunk->begin(), chunk->end(), std::byte{'\n'}) != chunk->end()) {
                header_written_ = true;
            }
            // The previous partition ended mid-line.
            if (needs_newline_) {
                chunk->insert(chunk->begin(), std::byte{'\n'});
                needs_newline_ = false;
            }
            emitted_in_partition_ = true;
            last_byte_ = chunk->back();
            co_return chunk;
        }
    }

private:
    Context ctx_;
    BoxStream<CsvStream> streams_;
    std::optional<CsvStream> current_;
    bool header_written_ = false;
    bool skipping_header_ = false;
    bool emitted_in_partition_ = false;
    bool needs_newline_ = false;
    std::byte last_byte_{'\n'};
};

}  // namespace

CsvStream ConcatenateCsvStreams(Context ctx, BoxStream<CsvStream> streams) {
    return CsvStream{
        .name = "combined",
        .data = std::make_unique<ConcatenatedStream>(std::move(ctx), std::move(streams)),
    };
}

}  // namespace dbxfer
