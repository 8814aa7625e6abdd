//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Supervisor.h
// Purpose: Owns the running sessions: lifecycle, catalog aggregation, tool routing, config testing
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "mcphost/ConfigStore.h"
#include "mcphost/Session.h"

namespace mcphost {

namespace net = boost::asio;

//==========================================================================================================
// SupervisorOptions
// Fields:
//   restartDelay: settle time between stop and start in restartServer (MCPHOST_RESTART_DELAY_MS).
//   testTimeout: connect deadline for testServerConfig (MCPHOST_TEST_TIMEOUT_MS).
//   session: options handed to every Session the supervisor creates.
//==========================================================================================================
struct SupervisorOptions {
    std::chrono::milliseconds restartDelay{1000};
    std::chrono::milliseconds testTimeout{15000};
    SessionOptions session;

    static SupervisorOptions FromEnvironment();
};

//==========================================================================================================
// QualifiedToolName / ParseQualifiedToolName
// Purpose: "Server__tool" splits at the FIRST "__": serverName = "Server", toolName = the rest (which may
//          itself contain "__"). A name without "__", or with an empty qualifier ("__tool"), is bare:
//          serverName is unset and every running server is searched.
// Notes:
//   A server whose name contains "__" can not be addressed through a qualified name.
//==========================================================================================================
struct QualifiedToolName {
    std::optional<std::string> serverName;
    std::string toolName;
};

QualifiedToolName ParseQualifiedToolName(const std::string& name);

// Catalog entries annotated with the owning server.
struct ServerTool {
    std::string serverId;
    std::string serverName;
    Tool tool;

    JSONValue ToJSON() const;
};

struct ServerResource {
    std::string serverId;
    std::string serverName;
    Resource resource;

    JSONValue ToJSON() const;
};

//==========================================================================================================
// ServerStatus
// Purpose: getServerStatus() result. info is set only when running.
//==========================================================================================================
struct ServerStatus {
    bool running{false};
    std::optional<SessionInfo> info;

    JSONValue ToJSON() const;
};

//==========================================================================================================
// TestResult
// Purpose: testServerConfig() outcome. On success: serverInfo, counts and a name/description preview of
//          the tools. On failure: message and error (category name plus message).
//==========================================================================================================
struct TestResult {
    struct ToolPreview {
        std::string name;
        std::string description;
    };

    bool success{false};
    std::string message;
    std::optional<errors::McpError> error;
    Implementation serverInfo;
    std::size_t toolCount{0};
    std::size_t resourceCount{0};
    std::vector<ToolPreview> tools;

    JSONValue ToJSON() const;
};

enum class SupervisorEventType {
    ServerConnected,
    ServerDisconnected,
    ServerError,
    ToolsUpdated,
    ResourcesUpdated,
    ResourceUpdated
};

struct SupervisorEvent {
    SupervisorEventType type;
    std::string serverId;
    JSONValue payload;
};

//==========================================================================================================
// Supervisor
// Purpose: Keeps sessions keyed by server id; only connected sessions are registered. Sessions that exit
//          on their own are removed when their Disconnected event arrives.
// Threading:
//   Single-threaded like Session. Concurrent startServer() calls for one id share a single attempt.
//==========================================================================================================
class Supervisor : public std::enable_shared_from_this<Supervisor> {
public:
    using EventHandler = std::function<void(const SupervisorEvent&)>;

    static std::shared_ptr<Supervisor> Create(const net::any_io_executor& ex,
                                              std::shared_ptr<IConfigStore> store,
                                              SupervisorOptions options = SupervisorOptions());
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // Starts every enabled+autoStart definition; failures are logged. Second call is a logged no-op.
    net::awaitable<void> initialize();

    //==========================================================================================================
    // startServer
    // Purpose: Returns info of the running session for id, starting it when needed.
    // Throws:
    //   McpException(ServerNotFound) "Server config not found: <id>"
    //   McpException(ServerDisabled) "Server <name> is disabled"
    //   SpawnError / HandshakeError from Session::connect().
    //==========================================================================================================
    net::awaitable<SessionInfo> startServer(const std::string& id);

    // No-op when not running.
    net::awaitable<void> stopServer(const std::string& id);

    // stop, wait restartDelay, start.
    net::awaitable<SessionInfo> restartServer(const std::string& id);

    // Disconnects all sessions concurrently and waits for every one of them.
    net::awaitable<void> stopAll();

    std::vector<ServerTool> getAllTools() const;
    std::vector<ServerResource> getAllResources() const;

    // Throws McpException(ServerNotRunning) "Server <id> not running" when id has no session.
    net::awaitable<JSONValue> callTool(const std::string& serverId, const std::string& toolName, JSONValue args);
    net::awaitable<JSONValue> readResource(const std::string& serverId, const std::string& uri);

    //==========================================================================================================
    // callToolByName
    // Purpose: Routes "Server__tool" to that server only; a bare name goes to the first running server (in
    //          start order) whose catalog has it.
    // Throws:
    //   McpException(ToolNotFound) "Tool not found: <name>"
    //==========================================================================================================
    net::awaitable<JSONValue> callToolByName(const std::string& name, JSONValue args);

    // Never throws; the candidate is neither persisted nor registered.
    net::awaitable<TestResult> testServerConfig(ServerDefinition candidate);

    //==========================================================================================================
    // cancelAllToolCalls
    // Purpose: Tool calls in flight when this is invoked fail with McpException(Cancelled) once they
    //          settle; later calls are unaffected. Requests themselves are not aborted on the wire.
    //==========================================================================================================
    void cancelAllToolCalls();
    uint64_t cancelGeneration() const { return cancelGeneration_; }

    bool isServerRunning(const std::string& id) const;
    std::size_t getRunningCount() const;
    ServerStatus getServerStatus(const std::string& id) const;
    std::map<std::string, ServerStatus> getAllServerStatus() const;
    std::shared_ptr<Session> session(const std::string& id) const;

    void SetEventHandler(EventHandler handler);

    const std::shared_ptr<IConfigStore>& store() const { return store_; }
    const SupervisorOptions& options() const { return options_; }

private:
    Supervisor(const net::any_io_executor& ex, std::shared_ptr<IConfigStore> store, SupervisorOptions options);

    struct StartAttempt {
        explicit StartAttempt(const net::any_io_executor& ex) : done(ex) {}
        async::Signal done;
        std::optional<SessionInfo> info;
        std::optional<errors::McpError> failure;
    };

    net::awaitable<SessionInfo> doStart(const std::string& id, std::shared_ptr<StartAttempt> attempt);
    net::awaitable<JSONValue> guardCancellation(net::awaitable<JSONValue> call);
    void onSessionEvent(const std::string& id, const std::weak_ptr<Session>& who, const SessionEvent& ev);
    void registerSession(std::shared_ptr<Session> s);
    void unregisterSession(const std::string& id);
    void emit(SupervisorEvent ev);

    net::any_io_executor executor_;
    std::shared_ptr<IConfigStore> store_;
    SupervisorOptions options_;
    bool initialized_{false};
    // Running sessions in start order; lookups are linear, counts are small.
    std::vector<std::pair<std::string, std::shared_ptr<Session>>> sessions_;
    std::map<std::string, std::shared_ptr<StartAttempt>> starting_;
    uint64_t cancelGeneration_{0};
    EventHandler eventHandler_;
};

} // namespace mcphost
