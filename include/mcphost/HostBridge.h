//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HostBridge.h
// Purpose: Command surface a host application drives: server definition CRUD plus supervisor lifecycle
//==========================================================================================================

#pragma once

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
#include "mcphost/Supervisor.h"

namespace mcphost {

// A stored definition together with its current run state.
struct ServerListing {
    ServerDefinition definition;
    bool isRunning{false};

    JSONValue ToJSON() const;
};

enum class HostEventType {
    ServersChanged,
    ServerConnected,
    ServerDisconnected,
    ServerError,
    ToolsUpdated,
    ResourcesUpdated,
    ResourceUpdated
};

// Wire names used by hosts that forward events ("mcp-servers-updated", "mcp-server-connected", ...).
const char* hostEventName(HostEventType type);

struct HostEvent {
    HostEventType type;
    std::string serverId;
    JSONValue payload;
};

//==========================================================================================================
// HostBridge
// Purpose: Thin adapter in front of a config store and a Supervisor. Every command either reads or
//          mutates the store, or forwards to the Supervisor.
// Notes:
//   updateServer*/deleteServer* stop a running server before touching its definition.
//   toggleServerEnabled stops the server when the toggle disabled it.
//   Every successful create/update/delete/toggle emits HostEventType::ServersChanged.
//   Supervisor events are forwarded with the matching HostEventType.
//   Errors propagate as McpException except from testServer(), which always returns a TestResult.
//==========================================================================================================
class HostBridge {
public:
    using EventHandler = std::function<void(const HostEvent&)>;

    HostBridge(const net::any_io_executor& ex,
               std::shared_ptr<IConfigStore> store,
               SupervisorOptions options = SupervisorOptions());
    ~HostBridge();

    HostBridge(const HostBridge&) = delete;
    HostBridge& operator=(const HostBridge&) = delete;

    // Auto-starts configured servers. shutdown() stops every running server.
    net::awaitable<void> initialize();
    net::awaitable<void> shutdown();

    ///////////////////////////////////////// Definitions ///////////////////////////////////////////
    std::vector<ServerListing> listServers();
    std::optional<ServerListing> getServer(const std::string& id);
    ServerDefinition createServer(ServerDefinition def);
    net::awaitable<std::optional<ServerDefinition>> updateServer(const std::string& id, ServerDefinitionPatch patch);
    net::awaitable<std::optional<ServerDefinition>> updateServerByName(const std::string& name, ServerDefinitionPatch patch);
    net::awaitable<bool> deleteServer(const std::string& id);
    net::awaitable<bool> deleteServerByName(const std::string& name);
    net::awaitable<std::optional<ServerDefinition>> toggleServerEnabled(const std::string& id);

    ///////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    net::awaitable<SessionInfo> startServer(const std::string& id);
    net::awaitable<void> stopServer(const std::string& id);
    net::awaitable<SessionInfo> restartServer(const std::string& id);
    ServerStatus getServerStatus(const std::string& id) const;
    std::map<std::string, ServerStatus> getAllServerStatus() const;
    std::size_t getRunningCount() const;

    ///////////////////////////////////////// Catalog and calls ///////////////////////////////////////////
    std::vector<ServerTool> getAllTools() const;
    std::vector<ServerResource> getAllResources() const;
    net::awaitable<JSONValue> callTool(const std::string& serverId, const std::string& toolName, JSONValue args);
    net::awaitable<JSONValue> callToolByName(const std::string& name, JSONValue args);
    net::awaitable<JSONValue> readResource(const std::string& serverId, const std::string& uri);
    net::awaitable<TestResult> testServer(ServerDefinition candidate);
    void cancelAllToolCalls();

    void SetEventHandler(EventHandler handler);

    const std::shared_ptr<Supervisor>& supervisor() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphost
