// SPDX-License-Identifier: MIT

// src/io.cpp
#include "dbxfer/io.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <optional>
#include <utility>

#include <fmt/format.h>

#include "dbxfer/error.hpp"

namespace dbxfer {

void FileDescriptor::Reset() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

namespace {

class FdReadStream : public AsyncStream<Bytes> {
public:
    FdReadStream(FileDescriptor fd, std::string description)
        : fd_(std::move(fd)), description_(std::move(description)) {}

    asio::awaitable<std::optional<Bytes>> Next() override {
        if (!fd_.valid()) co_return std::nullopt;

        Bytes chunk(kBufferSize);
        ssize_t n;
        do {
            n = ::read(fd_.get(), chunk.data(), chunk.size());
        } while (n < 0 && errno == EINTR);

        if (n < 0) {
            int err = errno;
            throw TransferError(ErrorCode::IoError,
                                fmt::format("cannot read {}: {}", description_, std::strerror(err)),
                                err);
        }
        if (n == 0) {
            fd_.Reset();
            co_return std::nullopt;
        }
        chunk.resize(static_cast<size_t>(n));

        // Reads block; give other partitions a turn between chunks.
        auto executor = co_await asio::this_coro::executor;
        co_await asio::post(executor, asio::use_awaitable);
        co_return chunk;
    }

private:
    FileDescriptor fd_;
    std::string description_;
};

class PipeReadStream : public AsyncStream<Bytes> {
public:
    PipeReadStream(asio::posix::stream_descriptor pipe, std::string description)
        : pipe_(std::move(pipe)), description_(std::move(description)) {}

    asio::awaitable<std::optional<Bytes>> Next() override {
        if (done_) co_return std::nullopt;

        Bytes chunk(kBufferSize);
        asio::error_code ec;
        std::size_t n = co_await pipe_.async_read_some(
            asio::buffer(chunk), asio::redirect_error(asio::use_awaitable, ec));
        if (ec == asio::error::eof) {
            done_ = true;
            pipe_.close();
            co_return std::nullopt;
        }
        if (ec) {
            throw TransferError(ErrorCode::IoError,
                                fmt::format("cannot read {}: {}", description_, ec.message()),
                                ec.value());
        }
        chunk.resize(n);
        co_return chunk;
    }

private:
    asio::posix::stream_descriptor pipe_;
    std::string description_;
    bool done_ = false;
};

}  // namespace

BoxStream<Bytes> ReadFileStream(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        throw TransferError(ErrorCode::IoError,
                            fmt::format("cannot open {}: {}", path.string(), std::strerror(err)),
                            err);
    }
    return ReadFdStream(FileDescriptor(fd), path.string());
}

BoxStream<Bytes> ReadFdStream(FileDescriptor fd, std::string description) {
    return std::make_unique<FdReadStream>(std::move(fd), std::move(description));
}

BoxStream<Bytes> ReadPipeStream(asio::posix::stream_descriptor pipe, std::string description) {
    return std::make_unique<PipeReadStream>(std::move(pipe), std::move(description));
}

asio::awaitable<void> WriteStreamToFd(BoxStream<Bytes> data, int fd, std::string description) {
    while (auto chunk = co_await data->Next()) {
        const std::byte* p = chunk->data();
        std::size_t remaining = chunk->size();
        while (remaining > 0) {
            ssize_t n = ::write(fd, p, remaining);
            if (n < 0) {
                if (errno == EINTR) continue;
                int err = errno;
                throw TransferError(
                    ErrorCode::IoError,
                    fmt::format("error writing {}: {}", description, std::strerror(err)), err);
            }
            p += n;
            remaining -= static_cast<std::size_t>(n);
        }
    }
}

asio::awaitable<void> WriteStreamToPipe(BoxStream<Bytes> data,
                                        asio::posix::stream_descriptor pipe,
                                        std::string description) {
    while (auto chunk = co_await data->Next()) {
        asio::error_code ec;
        co_await asio::async_write(pipe, asio::buffer(*chunk),
                                   asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            throw TransferError(ErrorCode::IoError,
                                fmt::format("error writing {}: {}", description, ec.message()),
                                ec.value());
        }
    }
    // Closing signals end-of-input to the reader.
    pipe.close();
}

asio::awaitable<Bytes> ReadAll(BoxStream<Bytes> data) {
    Bytes out;
    while (auto chunk = co_await data->Next()) {
        out.insert(out.end(), chunk->begin(), chunk->end());
    }
    co_return out;
}

}  // namespace dbxfer
