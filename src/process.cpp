// SPDX-License-Identifier: MIT

// src/process.cpp
#include "dbxfer/process.hpp"

#include <fcntl.h>
#include <spawn.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <optional>
#include <utility>

#include <asio.hpp>
#include <fmt/format.h>

extern char** environ;

namespace dbxfer {

namespace {

struct Pipe {
    FileDescriptor read;
    FileDescriptor write;
};

std::expected<Pipe, Error> MakePipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        int err = errno;
        return std::unexpected(Error{ErrorCode::ProcessFailed,
                                     fmt::format("cannot create pipe: {}", std::strerror(err)),
                                     err});
    }
    return Pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}

// posix_spawn_file_actions_t cleanup on every exit path.
struct FileActions {
    posix_spawn_file_actions_t actions;
    FileActions() { posix_spawn_file_actions_init(&actions); }
    ~FileActions() { posix_spawn_file_actions_destroy(&actions); }
};

}  // namespace

std::expected<ChildProcess, Error> ChildProcess::Spawn(std::vector<std::string> argv,
                                                       ProcessOptions options) {
    if (argv.empty()) {
        return std::unexpected(Error{ErrorCode::ProcessFailed, "cannot spawn empty command"});
    }

    std::optional<Pipe> in_pipe;
    std::optional<Pipe> out_pipe;
    FileActions fa;

    if (options.pipe_stdin) {
        auto p = MakePipe();
        if (!p) return std::unexpected(p.error());
        in_pipe = std::move(*p);
        posix_spawn_file_actions_adddup2(&fa.actions, in_pipe->read.get(), STDIN_FILENO);
    }
    if (options.pipe_stdout) {
        auto p = MakePipe();
        if (!p) return std::unexpected(p.error());
        out_pipe = std::move(*p);
        posix_spawn_file_actions_adddup2(&fa.actions, out_pipe->write.get(), STDOUT_FILENO);
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (auto& arg : argv) cargv.push_back(arg.data());
    cargv.push_back(nullptr);

    pid_t pid = -1;
    int rc = ::posix_spawnp(&pid, cargv[0], &fa.actions, nullptr, cargv.data(), environ);
    if (rc != 0) {
        return std::unexpected(Error{
            ErrorCode::ProcessFailed,
            fmt::format("cannot run {}: {}", argv[0], std::strerror(rc)), rc});
    }

    ChildProcess child(pid, argv[0]);
    // The child holds its own copies of the pipe ends it uses.
    if (in_pipe) child.stdin_ = std::move(in_pipe->write);
    if (out_pipe) child.stdout_ = std::move(out_pipe->read);
    return child;
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1))
    , program_(std::move(other.program_))
    , reaped_(other.reaped_)
    , exit_status_(other.exit_status_)
    , stdin_(std::move(other.stdin_))
    , stdout_(std::move(other.stdout_)) {}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        pid_ = std::exchange(other.pid_, -1);
        program_ = std::move(other.program_);
        reaped_ = other.reaped_;
        exit_status_ = other.exit_status_;
        stdin_ = std::move(other.stdin_);
        stdout_ = std::move(other.stdout_);
    }
    return *this;
}

ChildProcess::~ChildProcess() {
    if (pid_ > 0 && !reaped_) {
        int status = 0;
        ::waitpid(pid_, &status, WNOHANG);
    }
}

bool ChildProcess::TryReap() {
    if (reaped_) return true;
    int status = 0;
    pid_t rc;
    do {
        rc = ::waitpid(pid_, &status, WNOHANG);
    } while (rc < 0 && errno == EINTR);

    if (rc == 0) return false;
    if (rc < 0) {
        int err = errno;
        throw TransferError(ErrorCode::ProcessFailed,
                            fmt::format("cannot wait for {}: {}", program_, std::strerror(err)),
                            err);
    }
    reaped_ = true;
    if (WIFEXITED(status)) {
        exit_status_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_status_ = 128 + WTERMSIG(status);
    }
    return true;
}

asio::awaitable<int> ChildProcess::Wait() {
    auto executor = co_await asio::this_coro::executor;

#ifdef SYS_pidfd_open
    if (!reaped_) {
        int pidfd = static_cast<int>(::syscall(SYS_pidfd_open, pid_, 0));
        if (pidfd >= 0) {
            // A pidfd becomes readable when the process exits.
            asio::posix::stream_descriptor watcher(executor, pidfd);
            asio::error_code ec;
            co_await watcher.async_wait(asio::posix::stream_descriptor::wait_read,
                                        asio::redirect_error(asio::use_awaitable, ec));
        }
    }
#endif

    asio::steady_timer timer(executor);
    while (!TryReap()) {
        timer.expires_after(std::chrono::milliseconds(10));
        co_await timer.async_wait(asio::use_awaitable);
    }
    co_return exit_status_;
}

}  // namespace dbxfer
