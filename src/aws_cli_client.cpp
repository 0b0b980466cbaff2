// SPDX-License-Identifier: MIT

// src/aws_cli_client.cpp
#include "dbxfer/object_store_client.hpp"

#include <optional>

#include <asio.hpp>
#include <fmt/format.h>

#include "dbxfer/io.hpp"
#include "dbxfer/process.hpp"

namespace dbxfer {

namespace {

std::string_view BucketOf(std::string_view url) {
    auto rest = url.substr(std::string_view("s3://").size());
    return rest.substr(0, rest.find('/'));
}

ChildProcess SpawnOrThrow(std::vector<std::string> argv, ProcessOptions options) {
    auto name = fmt::format("{} {} {}", argv[0], argv[1], argv[2]);
    auto child = ChildProcess::Spawn(std::move(argv), options);
    if (!child) {
        throw TransferError(ErrorCode::ProcessFailed,
                            fmt::format("{} failed with error: {}", name, child.error().message),
                            child.error().os_errno);
    }
    return std::move(*child);
}

asio::awaitable<void> CheckExit(ChildProcess& child, std::string_view what) {
    int status = co_await child.Wait();
    if (status != 0) {
        throw TransferError(ErrorCode::ProcessFailed,
                            fmt::format("{} failed with exit status {}", what, status));
    }
}

// Starts `aws s3 cp URL -` on the first pull and streams its stdout.
class ObjectDownloadStream : public AsyncStream<Bytes> {
public:
    ObjectDownloadStream(Context ctx, std::string url)
        : ctx_(std::move(ctx)), url_(std::move(url)) {}

    asio::awaitable<std::optional<Bytes>> Next() override {
        if (!output_) {
            ctx_.Debug("downloading {}", url_);
            auto child = ChildProcess::Spawn({"aws", "s3", "cp", url_, "-"},
                                             ProcessOptions{.pipe_stdout = true});
            if (!child) {
                throw TransferError(ErrorCode::ProcessFailed,
                                    fmt::format("aws s3 cp failed with error: {}",
                                                child.error().message),
                                    child.error().os_errno);
            }
            auto fd = child->TakeStdout();
            output_ = ReadPipeStream(
                asio::posix::stream_descriptor(ctx_.executor(), fd.Release()), url_);
            // A failed download ends the pipe early; the exit status is
            // reported through the context.
            ctx_.SpawnProcess("aws s3 cp", std::move(child));
        }
        co_return co_await output_->Next();
    }

private:
    Context ctx_;
    std::string url_;
    BoxStream<Bytes> output_;
};

}  // namespace

std::vector<std::string> ParseS3Listing(std::string_view output, std::string_view bucket) {
    std::vector<std::string> urls;
    while (!output.empty()) {
        auto eol = output.find('\n');
        auto line = output.substr(0, eol);
        output = eol == std::string_view::npos ? std::string_view{} : output.substr(eol + 1);

        // "2019-03-01 12:00:00       1234 path/to/key.csv"; keys may contain spaces.
        std::size_t pos = 0;
        for (int field = 0; field < 3 && pos != std::string_view::npos; ++field) {
            pos = line.find_first_not_of(' ', pos);
            if (pos == std::string_view::npos) break;
            pos = line.find(' ', pos);
        }
        if (pos == std::string_view::npos) continue;
        pos = line.find_first_not_of(' ', pos);
        if (pos == std::string_view::npos) continue;
        auto key = line.substr(pos);
        if (key.ends_with('\r')) key.remove_suffix(1);
        urls.push_back(fmt::format("s3://{}/{}", bucket, key));
    }
    return urls;
}

asio::awaitable<std::vector<std::string>> AwsCliClient::ListObjects(Context ctx,
                                                                    std::string prefix) {
    ctx.Debug("listing {}", prefix);
    auto child = SpawnOrThrow({"aws", "s3", "ls", "--recursive", prefix},
                              ProcessOptions{.pipe_stdout = true});
    auto fd = child.TakeStdout();
    auto output = co_await ReadAll(ReadPipeStream(
        asio::posix::stream_descriptor(ctx.executor(), fd.Release()), "aws s3 ls"));
    int status = co_await child.Wait();

    // `aws s3 ls` exits with 1 when nothing matches.
    if (status == 1 && output.empty()) co_return std::vector<std::string>{};
    if (status != 0) {
        throw TransferError(ErrorCode::ProcessFailed,
                            fmt::format("aws s3 ls failed with exit status {}", status));
    }

    // The listing matches key prefixes, not directories.
    std::vector<std::string> urls;
    for (auto& url : ParseS3Listing(AsStringView(output), BucketOf(prefix))) {
        if (url.starts_with(prefix)) urls.push_back(std::move(url));
    }
    co_return urls;
}

BoxStream<Bytes> AwsCliClient::ReadObject(Context ctx, std::string url) {
    return std::make_unique<ObjectDownloadStream>(std::move(ctx), std::move(url));
}

asio::awaitable<void> AwsCliClient::WriteObject(Context ctx, std::string url,
                                                BoxStream<Bytes> data) {
    ctx.Debug("uploading {}", url);
    auto child = SpawnOrThrow({"aws", "s3", "cp", "-", url}, ProcessOptions{.pipe_stdin = true});
    auto fd = child.TakeStdin();
    co_await WriteStreamToPipe(std::move(data),
                               asio::posix::stream_descriptor(ctx.executor(), fd.Release()),
                               fmt::format("upload of {}", url));
    co_await CheckExit(child, "aws s3 cp");
}

asio::awaitable<void> AwsCliClient::RemovePrefix(Context ctx, std::string prefix) {
    ctx.Debug("removing {}", prefix);
    auto child = SpawnOrThrow({"aws", "s3", "rm", "--recursive", prefix}, ProcessOptions{});
    co_await CheckExit(child, "aws s3 rm");
}

}  // namespace dbxfer
