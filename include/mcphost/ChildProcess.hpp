//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.hpp
// Purpose: RAII owner of a spawned tool-server process and its three stdio pipes (POSIX)
//==========================================================================================================

#pragma once

#include <sys/types.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include "mcphost/async/Signal.h"

namespace mcphost {

namespace net = boost::asio;

//==========================================================================================================
// NormalizeArgs
// Purpose: Re-splits arguments that arrived as comma-separated lists (e.g. "a, b,c" from a single form
//          field) into discrete arguments. Pieces are trimmed; empty pieces are dropped. Arguments
//          without a comma pass through untouched, including surrounding whitespace.
//==========================================================================================================
std::vector<std::string> NormalizeArgs(const std::vector<std::string>& args);

//==========================================================================================================
// BuildChildEnvironment
// Purpose: Returns "KEY=VALUE" entries for the host environment with overrides applied on top.
//==========================================================================================================
std::vector<std::string> BuildChildEnvironment(const std::map<std::string, std::string>& overrides);

struct SpawnOptions {
    std::string command;
    std::vector<std::string> args;              // already normalized
    std::map<std::string, std::string> env;     // overlaid on the host environment
};

//==========================================================================================================
// ChildProcess
// Purpose: Spawns a command with piped stdin/stdout/stderr wrapped as asio stream descriptors.
// Notes:
//   - Spawn() reports exec failures (missing binary, permission) synchronously through a close-on-exec
//     error pipe and throws McpException(SpawnError).
//   - terminate() is the orderly path: SIGTERM, poll for exit up to the grace period, then SIGKILL.
//     Concurrent callers share one termination.
//   - The destructor force-kills and reaps a still-running child so no exit path leaks a process.
//==========================================================================================================
class ChildProcess {
public:
    static std::unique_ptr<ChildProcess> Spawn(const net::any_io_executor& ex, const SpawnOptions& opts);

    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }

    // True until the process has been reaped (polls waitpid without blocking).
    bool running();

    net::posix::stream_descriptor& stdinPipe() { return stdin_; }
    net::posix::stream_descriptor& stdoutPipe() { return stdout_; }
    net::posix::stream_descriptor& stderrPipe() { return stderr_; }

    // Closes every pipe; pending reads and writes complete with operation_aborted.
    void closePipes();

    net::awaitable<void> terminate(std::chrono::milliseconds grace);

    // SIGKILL and blocking reap. No-op once reaped.
    void kill();

    std::optional<int> exitCode() const { return exitCode_; }
    std::optional<int> termSignal() const { return termSignal_; }

private:
    ChildProcess(const net::any_io_executor& ex, pid_t pid, int inFd, int outFd, int errFd);

    bool tryReap();
    void recordStatus(int status);

    net::any_io_executor executor_;
    pid_t pid_{-1};
    bool reaped_{false};
    bool terminating_{false};
    std::optional<int> exitCode_;
    std::optional<int> termSignal_;
    net::posix::stream_descriptor stdin_;
    net::posix::stream_descriptor stdout_;
    net::posix::stream_descriptor stderr_;
    async::Signal exited_;
};

} // namespace mcphost
