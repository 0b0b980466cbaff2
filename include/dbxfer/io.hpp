// SPDX-License-Identifier: MIT

// include/dbxfer/io.hpp
#pragma once

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

#include <asio.hpp>

#include "dbxfer/async_stream.hpp"

namespace dbxfer {

/// Size of the chunks read from files, pipes and stdin.
inline constexpr std::size_t kBufferSize = 64 * 1024;

/// Owned POSIX file descriptor.
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { Reset(); }

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.Release()) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            Reset();
            fd_ = other.Release();
        }
        return *this;
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    int Release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void Reset();

private:
    int fd_ = -1;
};

/// Stream the contents of a file in kBufferSize chunks.
/// @throws TransferError{IoError} if the file cannot be opened.
BoxStream<Bytes> ReadFileStream(const std::filesystem::path& path);

/// Stream from an already-open blocking descriptor (stdin, a regular file).
/// @p description names the source in error messages.
BoxStream<Bytes> ReadFdStream(FileDescriptor fd, std::string description);

/// Stream from a pipe using asynchronous reads on the executor.
BoxStream<Bytes> ReadPipeStream(asio::posix::stream_descriptor pipe, std::string description);

/// Write every chunk of @p data to a blocking descriptor.
asio::awaitable<void> WriteStreamToFd(BoxStream<Bytes> data, int fd, std::string description);

/// Write every chunk of @p data to a pipe, then close it.
asio::awaitable<void> WriteStreamToPipe(BoxStream<Bytes> data,
                                        asio::posix::stream_descriptor pipe,
                                        std::string description);

/// Collect an entire stream into memory.
asio::awaitable<Bytes> ReadAll(BoxStream<Bytes> data);

inline Bytes ToBytes(std::string_view s) {
    const auto* p = reinterpret_cast<const std::byte*>(s.data());
    return Bytes(p, p + s.size());
}

inline std::string_view AsStringView(std::span<const std::byte> bytes) {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

}  // namespace dbxfer
