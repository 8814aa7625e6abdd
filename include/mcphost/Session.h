//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: One live connection to a child-process MCP server speaking line-delimited JSON-RPC over stdio
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include "mcphost/ChildProcess.hpp"
#include "mcphost/Protocol.h"
#include "mcphost/ServerDefinition.h"
#include "mcphost/async/Signal.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

namespace net = boost::asio;

enum class ConnectionState { Disconnected, Connecting, Connected, Failed };

const char* connectionStateName(ConnectionState s);

//==========================================================================================================
// SessionOptions
// Purpose: Per-session tunables.
// Fields:
//   requestTimeout: deadline for every request/response pair (MCPHOST_REQUEST_TIMEOUT_MS).
//   killGrace: how long disconnect() waits after SIGTERM before SIGKILL (MCPHOST_KILL_GRACE_MS).
//   clientInfo: identity announced in initialize.
//   maxLineBytes: a stdout line longer than this is treated as a broken stream.
//==========================================================================================================
struct SessionOptions {
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds killGrace{2000};
    Implementation clientInfo;
    std::size_t maxLineBytes{16 * 1024 * 1024};

    SessionOptions();
    static SessionOptions FromEnvironment();
};

//==========================================================================================================
// SessionInfo
// Purpose: Snapshot returned by Session::info() and Supervisor::startServer().
//==========================================================================================================
struct SessionInfo {
    std::string serverId;
    std::string serverName;
    Implementation serverInfo;
    ServerCapabilities capabilities;
    bool isConnected{false};
    std::vector<Tool> tools;
    std::vector<Resource> resources;

    // { info, capabilities, isConnected, tools, resources }
    JSONValue ToJSON() const;
};

enum class SessionEventType {
    Connected,
    Disconnected,
    Error,
    ToolsUpdated,
    ResourcesUpdated,
    ResourceUpdated,
    Notification
};

//==========================================================================================================
// SessionEvent
// Purpose: Observer payload. method/params are set for Notification and ResourceUpdated; exitCode or
//          termSignal for Disconnected when the process status is already known; message for Error.
//          Notification carries only methods the session does not handle itself, so every server
//          notification reaches observers once.
//==========================================================================================================
struct SessionEvent {
    SessionEventType type;
    std::string serverId;
    std::string method;
    JSONValue params;
    std::optional<int> exitCode;
    std::optional<int> termSignal;
    std::string message;
};

//==========================================================================================================
// Session
// Purpose: Spawns the server process, performs the handshake, correlates requests with responses by id,
//          processes server notifications and keeps the tools/resources discovery caches.
// Lifecycle:
//   Disconnected -> connect() ok -> Connected -> (process exit | disconnect()) -> Disconnected
//   Disconnected -> connect() fails -> Failed
//   any state -> disconnect() -> Disconnected (also when connect() is still in flight)
//   A closed session is never reused; construct a new one to reconnect.
// Threading:
//   Single-threaded; every member must be used from the executor passed to Create().
//==========================================================================================================
class Session : public std::enable_shared_from_this<Session> {
public:
    using EventHandler = std::function<void(const SessionEvent&)>;

    static std::shared_ptr<Session> Create(const net::any_io_executor& ex,
                                           ServerDefinition definition,
                                           SessionOptions options = SessionOptions());
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    //==========================================================================================================
    // connect
    // Purpose: Spawn the process and run the handshake (initialize, notifications/initialized, then
    //          tools/list and resources/list when the server advertises those capabilities).
    // Throws:
    //   McpException(SpawnError) when the command can not be executed.
    //   McpException(HandshakeError) for any other failure; the process is terminated and state is Failed.
    //   McpException(ConnectionClosed) when called on a session that was already closed.
    //==========================================================================================================
    net::awaitable<void> connect();

    //==========================================================================================================
    // sendRequest
    // Purpose: Send one request and suspend until its response, its timeout or session shutdown.
    // Returns:
    //   The response's result value.
    // Throws:
    //   McpException(RemoteError) carrying the server's error message/code/data.
    //   McpException(RequestTimeout) with message "Request timeout: <method>".
    //   McpException(ConnectionClosed) when the process is gone or the session closes while pending.
    //==========================================================================================================
    net::awaitable<JSONValue> sendRequest(const std::string& method, JSONValue params = JSONValue(JSONValue::Object{}));

    // Fire-and-forget; dropped with a log line when the process is not running.
    void sendNotification(const std::string& method, std::optional<JSONValue> params = std::nullopt);

    // tools/call {name, arguments}; requires Connected (NotConnected otherwise).
    net::awaitable<JSONValue> callTool(const std::string& name, JSONValue arguments);

    // resources/read {uri}; requires Connected (NotConnected otherwise).
    net::awaitable<JSONValue> readResource(const std::string& uri);

    // Re-fetch discovery caches. Failures are logged and leave the cache empty.
    net::awaitable<void> refreshTools();
    net::awaitable<void> refreshResources();

    //==========================================================================================================
    // disconnect
    // Purpose: Idempotent orderly shutdown. Rejects all pending requests with ConnectionClosed, stops the
    //          readers, clears caches, then terminates the process (SIGTERM, grace period, SIGKILL).
    //==========================================================================================================
    net::awaitable<void> disconnect();

    // Synchronous variant of disconnect() that force-kills the process; used by destructors.
    void close();

    void SetEventHandler(EventHandler handler);

    ConnectionState state() const { return state_; }
    bool isConnected() const { return state_ == ConnectionState::Connected; }
    const ServerDefinition& definition() const { return definition_; }
    const std::string& id() const { return definition_.id; }
    const std::string& name() const { return definition_.name; }
    const Implementation& serverInfo() const { return serverInfo_; }
    const ServerCapabilities& serverCapabilities() const { return serverCapabilities_; }
    const std::vector<Tool>& tools() const { return tools_; }
    const std::vector<Resource>& resources() const { return resources_; }
    bool hasTool(const std::string& toolName) const;
    SessionInfo info() const;
    std::size_t pendingCount() const { return pendingRequests_.size(); }
    std::optional<pid_t> pid() const;

private:
    Session(const net::any_io_executor& ex, ServerDefinition definition, SessionOptions options);

    struct PendingRequest {
        PendingRequest(const net::any_io_executor& ex, std::string m)
            : method(std::move(m)), timer(ex) {}
        std::string method;
        std::optional<JSONValue> result;
        std::optional<errors::McpError> failure;
        bool settled{false};
        net::steady_timer timer;
    };

    net::awaitable<void> readLoop();
    net::awaitable<void> stderrLoop();
    net::awaitable<void> writeLoop();
    net::awaitable<void> runHandshake();

    void enqueueLine(std::string line);
    void handleLine(const std::string& line);
    void handleResponse(const JSONValue& msg);
    void handleNotification(const JSONValue& msg);
    void handleServerRequest(const JSONValue& msg);
    void settle(int64_t id, std::optional<JSONValue> result, std::optional<errors::McpError> failure);
    void rejectAllPending(const errors::McpError& err);
    void onStreamClosed();
    void shutdownNow(ConnectionState finalState);
    void emit(SessionEvent ev);
    bool processAlive() const;

    net::any_io_executor executor_;
    ServerDefinition definition_;
    SessionOptions options_;
    ConnectionState state_{ConnectionState::Disconnected};
    bool closed_{false};
    bool disconnectRequested_{false};
    std::unique_ptr<ChildProcess> process_;
    int64_t nextRequestId_{1};
    std::unordered_map<int64_t, std::shared_ptr<PendingRequest>> pendingRequests_;
    Implementation serverInfo_;
    ServerCapabilities serverCapabilities_;
    std::vector<Tool> tools_;
    std::vector<Resource> resources_;
    std::deque<std::string> writeQueue_;
    bool writing_{false};
    async::Signal connectDone_;
    EventHandler eventHandler_;
};

} // namespace mcphost
