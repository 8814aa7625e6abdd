//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.cpp
// Purpose: fork/exec with stdio pipes, exec-failure reporting and graceful termination
//==========================================================================================================

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <mutex>

#include <boost/asio/steady_timer.hpp>
#include <fmt/format.h>
#include <boost/asio/use_awaitable.hpp>

#include "logging/Logger.h"
#include "mcphost/ChildProcess.hpp"
#include "mcphost/errors/Errors.h"

extern char** environ;

namespace mcphost {

namespace {

constexpr std::chrono::milliseconds kReapPollInterval{20};

std::string trimCopy(const std::string& s) {
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

struct Pipe {
    int fds[2]{-1, -1};
    ~Pipe() { closeBoth(); }
    void open() {
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw errors::McpException(errors::ErrorCategory::SpawnError,
                                       std::string("pipe2 failed: ") + std::strerror(errno));
        }
    }
    int release(int idx) { int fd = fds[idx]; fds[idx] = -1; return fd; }
    void closeEnd(int idx) { if (fds[idx] >= 0) { ::close(fds[idx]); fds[idx] = -1; } }
    void closeBoth() { closeEnd(0); closeEnd(1); }
};

// Writing to a pipe whose reader has exited must surface as EPIPE, not kill the host.
void ignoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, []() { ::signal(SIGPIPE, SIG_IGN); });
}

} // namespace

std::vector<std::string> NormalizeArgs(const std::vector<std::string>& args) {
    std::vector<std::string> out;
    out.reserve(args.size());
    for (const auto& arg : args) {
        if (arg.find(',') == std::string::npos) {
            out.push_back(arg);
            continue;
        }
        std::size_t start = 0;
        while (start <= arg.size()) {
            std::size_t comma = arg.find(',', start);
            std::size_t end = (comma == std::string::npos) ? arg.size() : comma;
            std::string piece = trimCopy(arg.substr(start, end - start));
            if (!piece.empty()) {
                out.push_back(std::move(piece));
            }
            if (comma == std::string::npos) break;
            start = comma + 1;
        }
    }
    return out;
}

std::vector<std::string> BuildChildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        const char* eq = std::strchr(*e, '=');
        if (eq == nullptr) continue;
        merged[std::string(*e, static_cast<std::size_t>(eq - *e))] = std::string(eq + 1);
    }
    for (const auto& [k, v] : overrides) {
        merged[k] = v;
    }
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [k, v] : merged) {
        out.push_back(k + "=" + v);
    }
    return out;
}

ChildProcess::ChildProcess(const net::any_io_executor& ex, pid_t pid, int inFd, int outFd, int errFd)
    : executor_(ex), pid_(pid), stdin_(ex, inFd), stdout_(ex, outFd), stderr_(ex, errFd), exited_(ex) {}

std::unique_ptr<ChildProcess> ChildProcess::Spawn(const net::any_io_executor& ex, const SpawnOptions& opts) {
    FUNC_SCOPE();
    if (opts.command.empty()) {
        throw errors::McpException(errors::ErrorCategory::SpawnError, "No command configured");
    }
    ignoreSigpipeOnce();

    // Everything the child touches is prepared before fork.
    std::vector<std::string> argStore;
    argStore.reserve(opts.args.size() + 1);
    argStore.push_back(opts.command);
    argStore.insert(argStore.end(), opts.args.begin(), opts.args.end());
    std::vector<char*> argv;
    for (auto& a : argStore) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> envStore = BuildChildEnvironment(opts.env);
    std::vector<char*> envp;
    for (auto& e : envStore) envp.push_back(e.data());
    envp.push_back(nullptr);

    Pipe in, out, err, execErr;
    in.open(); out.open(); err.open(); execErr.open();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw errors::McpException(errors::ErrorCategory::SpawnError,
                                   std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        ::dup2(in.fds[0], STDIN_FILENO);
        ::dup2(out.fds[1], STDOUT_FILENO);
        ::dup2(err.fds[1], STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);
        environ = envp.data();
        ::execvp(argv[0], argv.data());
        int code = errno;
        ssize_t ignored = ::write(execErr.fds[1], &code, sizeof(code));
        (void)ignored;
        ::_exit(127);
    }

    in.closeEnd(0);
    out.closeEnd(1);
    err.closeEnd(1);
    execErr.closeEnd(1);

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(execErr.fds[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        throw errors::McpException(errors::ErrorCategory::SpawnError,
            fmt::format("Failed to start '{}': {}", opts.command, std::strerror(childErrno)));
    }

    LOG_DEBUG("Spawned '{}' pid={}", opts.command, static_cast<int>(pid));
    return std::unique_ptr<ChildProcess>(
        new ChildProcess(ex, pid, in.release(1), out.release(0), err.release(0)));
}

ChildProcess::~ChildProcess() {
    closePipes();
    if (!reaped_) {
        kill();
    }
}

void ChildProcess::recordStatus(int status) {
    reaped_ = true;
    if (WIFEXITED(status)) {
        exitCode_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        termSignal_ = WTERMSIG(status);
    }
    exited_.fire();
}

bool ChildProcess::tryReap() {
    if (reaped_) {
        return true;
    }
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        recordStatus(status);
        return true;
    }
    if (r < 0 && errno == ECHILD) {
        // Reaped elsewhere (e.g. a SIGCHLD handler installed by the embedding application)
        reaped_ = true;
        exited_.fire();
        return true;
    }
    return false;
}

bool ChildProcess::running() {
    return !tryReap();
}

void ChildProcess::closePipes() {
    boost::system::error_code ec;
    if (stdin_.is_open()) stdin_.close(ec);
    if (stdout_.is_open()) stdout_.close(ec);
    if (stderr_.is_open()) stderr_.close(ec);
}

void ChildProcess::kill() {
    if (reaped_) {
        return;
    }
    ::kill(pid_, SIGKILL);
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) {
        recordStatus(status);
    } else {
        reaped_ = true;
        exited_.fire();
    }
}

net::awaitable<void> ChildProcess::terminate(std::chrono::milliseconds grace) {
    if (tryReap()) {
        co_return;
    }
    if (terminating_) {
        co_await exited_.wait();
        co_return;
    }
    terminating_ = true;
    ::kill(pid_, SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + grace;
    net::steady_timer poll(executor_);
    while (!tryReap() && std::chrono::steady_clock::now() < deadline) {
        poll.expires_after(kReapPollInterval);
        boost::system::error_code ec;
        co_await poll.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
    if (!reaped_) {
        LOG_WARN("pid {} ignored SIGTERM for {} ms; sending SIGKILL", static_cast<int>(pid_), grace.count());
        kill();
    }
}

} // namespace mcphost
