// SPDX-License-Identifier: MIT

// include/dbxfer/process.hpp
#pragma once

#include <sys/types.h>

#include <expected>
#include <string>
#include <vector>

#include <asio/awaitable.hpp>

#include "dbxfer/error.hpp"
#include "dbxfer/io.hpp"

namespace dbxfer {

/// Which standard streams of the child are connected to pipes we hold.
struct ProcessOptions {
    bool pipe_stdin = false;
    bool pipe_stdout = false;
};

/// An external process started with posix_spawnp.
///
/// Exit is observed without blocking the executor: through a pidfd where the
/// kernel supports it, otherwise by polling waitpid(WNOHANG) on a timer.
/// A ChildProcess destroyed before it was waited on is reaped if it already
/// exited and otherwise abandoned.
class ChildProcess {
public:
    /// Start @p argv (argv[0] is looked up in PATH).
    /// @return The running child, or a ProcessFailed error if it could not start.
    static std::expected<ChildProcess, Error> Spawn(std::vector<std::string> argv,
                                                    ProcessOptions options = {});

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ~ChildProcess();

    pid_t pid() const { return pid_; }
    const std::string& program() const { return program_; }

    /// Parent end of the child's stdin pipe (write side).
    FileDescriptor TakeStdin() { return std::move(stdin_); }

    /// Parent end of the child's stdout pipe (read side).
    FileDescriptor TakeStdout() { return std::move(stdout_); }

    /// Wait for the child to exit.
    /// @return The exit status; 128 + signal number if it was killed.
    asio::awaitable<int> Wait();

private:
    ChildProcess(pid_t pid, std::string program) : pid_(pid), program_(std::move(program)) {}

    bool TryReap();

    pid_t pid_ = -1;
    std::string program_;
    bool reaped_ = false;
    int exit_status_ = 0;
    FileDescriptor stdin_;
    FileDescriptor stdout_;
};

}  // namespace dbxfer
