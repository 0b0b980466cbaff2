// SPDX-License-Identifier: MIT

// tests/process_test.cpp
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <gtest/gtest.h>

#include "dbxfer/process.hpp"
#include "test_helpers.hpp"

namespace dbxfer {
namespace {

using testing::ChunkStream;
using testing::ReadString;
using testing::RunSync;

asio::awaitable<int> WaitFor(ChildProcess child) {
    co_return co_await child.Wait();
}

TEST(ProcessTest, SpawnEmptyCommand) {
    auto child = ChildProcess::Spawn({});
    ASSERT_FALSE(child.has_value());
    EXPECT_EQ(child.error().code, ErrorCode::ProcessFailed);
}

TEST(ProcessTest, SpawnMissingProgram) {
    auto child = ChildProcess::Spawn({"dbxfer-no-such-program"});
    ASSERT_FALSE(child.has_value());
    EXPECT_EQ(child.error().code, ErrorCode::ProcessFailed);
    EXPECT_TRUE(child.error().message.starts_with("cannot run dbxfer-no-such-program"));
}

TEST(ProcessTest, ExitStatus) {
    asio::io_context io;
    auto ok = ChildProcess::Spawn({"true"});
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(RunSync(io, WaitFor(std::move(*ok))), 0);

    auto failed = ChildProcess::Spawn({"sh", "-c", "exit 3"});
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->program(), "sh");
    EXPECT_EQ(RunSync(io, WaitFor(std::move(*failed))), 3);
}

TEST(ProcessTest, KilledBySignal) {
    asio::io_context io;
    auto child = ChildProcess::Spawn({"sh", "-c", "kill -9 $$"});
    ASSERT_TRUE(child.has_value());
    EXPECT_EQ(RunSync(io, WaitFor(std::move(*child))), 128 + 9);
}

asio::awaitable<std::string> ReadOutput(ChildProcess child) {
    auto executor = co_await asio::this_coro::executor;
    asio::posix::stream_descriptor out(executor, child.TakeStdout().Release());
    auto text = co_await ReadString(ReadPipeStream(std::move(out), "echo"));
    int status = co_await child.Wait();
    EXPECT_EQ(status, 0);
    co_return text;
}

TEST(ProcessTest, PipeStdout) {
    asio::io_context io;
    auto child = ChildProcess::Spawn({"echo", "hello"}, {.pipe_stdout = true});
    ASSERT_TRUE(child.has_value());
    EXPECT_EQ(RunSync(io, ReadOutput(std::move(*child))), "hello\n");
}

asio::awaitable<std::string> RoundTrip(ChildProcess child, std::vector<std::string> chunks) {
    auto executor = co_await asio::this_coro::executor;
    asio::posix::stream_descriptor in(executor, child.TakeStdin().Release());
    asio::posix::stream_descriptor out(executor, child.TakeStdout().Release());
    asio::co_spawn(executor,
                   WriteStreamToPipe(ChunkStream(std::move(chunks)), std::move(in), "cat"),
                   asio::detached);
    auto text = co_await ReadString(ReadPipeStream(std::move(out), "cat"));
    co_await child.Wait();
    co_return text;
}

TEST(ProcessTest, PipeStdinAndStdout) {
    asio::io_context io;
    auto child = ChildProcess::Spawn({"cat"}, {.pipe_stdin = true, .pipe_stdout = true});
    ASSERT_TRUE(child.has_value());
    EXPECT_EQ(RunSync(io, RoundTrip(std::move(*child), {"a,b\n", "1,2\n", "3,4\n"})),
              "a,b\n1,2\n3,4\n");
}

}  // namespace
}  // namespace dbxfer
