//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HostBridge.cpp
// Purpose: HostBridge implementation
//==========================================================================================================

#include "logging/Logger.h"
#include "mcphost/HostBridge.h"

namespace mcphost {

JSONValue ServerListing::ToJSON() const {
    JSONValue obj = ServerDefinitionToJSON(definition);
    SetMember(obj, "isRunning", JSONValue(isRunning));
    return obj;
}

const char* hostEventName(HostEventType type) {
    switch (type) {
        case HostEventType::ServersChanged: return "mcp-servers-updated";
        case HostEventType::ServerConnected: return "mcp-server-connected";
        case HostEventType::ServerDisconnected: return "mcp-server-disconnected";
        case HostEventType::ServerError: return "mcp-server-error";
        case HostEventType::ToolsUpdated: return "mcp-tools-updated";
        case HostEventType::ResourcesUpdated: return "mcp-resources-updated";
        case HostEventType::ResourceUpdated: return "mcp-resource-updated";
    }
    return "unknown";
}

namespace {
HostEventType toHostEventType(SupervisorEventType t) {
    switch (t) {
        case SupervisorEventType::ServerConnected: return HostEventType::ServerConnected;
        case SupervisorEventType::ServerDisconnected: return HostEventType::ServerDisconnected;
        case SupervisorEventType::ServerError: return HostEventType::ServerError;
        case SupervisorEventType::ToolsUpdated: return HostEventType::ToolsUpdated;
        case SupervisorEventType::ResourcesUpdated: return HostEventType::ResourcesUpdated;
        case SupervisorEventType::ResourceUpdated: return HostEventType::ResourceUpdated;
    }
    return HostEventType::ServerError;
}
} // namespace

class HostBridge::Impl {
public:
    Impl(const net::any_io_executor& ex, std::shared_ptr<IConfigStore> s, SupervisorOptions options)
        : store(std::move(s)),
          supervisor(Supervisor::Create(ex, store, std::move(options))),
          handler(std::make_shared<EventHandler>()) {
        // The handler slot is shared so a supervisor event arriving after the bridge is gone is dropped.
        std::weak_ptr<EventHandler> weakHandler = handler;
        supervisor->SetEventHandler([weakHandler](const SupervisorEvent& ev) {
            auto h = weakHandler.lock();
            if (h && *h) {
                (*h)(HostEvent{toHostEventType(ev.type), ev.serverId, ev.payload});
            }
        });
    }

    void emitServersChanged(const std::string& serverId) {
        if (!*handler) {
            return;
        }
        try {
            (*handler)(HostEvent{HostEventType::ServersChanged, serverId, JSONValue()});
        } catch (const std::exception& e) {
            LOG_ERROR("ServersChanged handler threw: {}", e.what());
        }
    }

    net::awaitable<void> stopIfRunning(const std::string& id) {
        if (supervisor->isServerRunning(id)) {
            LOG_INFO("Stopping server {} before changing its definition", id);
            co_await supervisor->stopServer(id);
        }
    }

    std::shared_ptr<IConfigStore> store;
    std::shared_ptr<Supervisor> supervisor;
    std::shared_ptr<EventHandler> handler;
};

HostBridge::HostBridge(const net::any_io_executor& ex, std::shared_ptr<IConfigStore> store, SupervisorOptions options)
    : pImpl(std::make_unique<Impl>(ex, std::move(store), std::move(options))) {}

HostBridge::~HostBridge() = default;

void HostBridge::SetEventHandler(EventHandler handler) {
    *pImpl->handler = std::move(handler);
}

const std::shared_ptr<Supervisor>& HostBridge::supervisor() const {
    return pImpl->supervisor;
}

net::awaitable<void> HostBridge::initialize() {
    co_await pImpl->supervisor->initialize();
}

net::awaitable<void> HostBridge::shutdown() {
    LOG_INFO("Host bridge shutting down");
    co_await pImpl->supervisor->stopAll();
}

std::vector<ServerListing> HostBridge::listServers() {
    std::vector<ServerListing> out;
    for (auto& def : pImpl->store->listConfigs()) {
        const bool running = pImpl->supervisor->isServerRunning(def.id);
        out.push_back(ServerListing{std::move(def), running});
    }
    return out;
}

std::optional<ServerListing> HostBridge::getServer(const std::string& id) {
    auto def = pImpl->store->getConfig(id);
    if (!def) {
        return std::nullopt;
    }
    return ServerListing{*def, pImpl->supervisor->isServerRunning(id)};
}

ServerDefinition HostBridge::createServer(ServerDefinition def) {
    auto saved = pImpl->store->save(std::move(def));
    pImpl->emitServersChanged(saved.id);
    return saved;
}

net::awaitable<std::optional<ServerDefinition>> HostBridge::updateServer(const std::string& id, ServerDefinitionPatch patch) {
    co_await pImpl->stopIfRunning(id);
    auto updated = pImpl->store->update(id, patch);
    if (updated) {
        LOG_INFO("Updated server definition {}", updated->name);
        pImpl->emitServersChanged(id);
    }
    co_return updated;
}

net::awaitable<std::optional<ServerDefinition>> HostBridge::updateServerByName(const std::string& name,
                                                                               ServerDefinitionPatch patch) {
    auto existing = pImpl->store->getConfigByName(name);
    if (!existing) {
        co_return std::nullopt;
    }
    co_return co_await updateServer(existing->id, std::move(patch));
}

net::awaitable<bool> HostBridge::deleteServer(const std::string& id) {
    co_await pImpl->stopIfRunning(id);
    const bool removed = pImpl->store->remove(id);
    if (removed) {
        LOG_INFO("Deleted server definition {}", id);
        pImpl->emitServersChanged(id);
    }
    co_return removed;
}

net::awaitable<bool> HostBridge::deleteServerByName(const std::string& name) {
    auto existing = pImpl->store->getConfigByName(name);
    if (!existing) {
        co_return false;
    }
    co_return co_await deleteServer(existing->id);
}

net::awaitable<std::optional<ServerDefinition>> HostBridge::toggleServerEnabled(const std::string& id) {
    auto toggled = pImpl->store->toggleEnabled(id);
    if (!toggled) {
        co_return std::nullopt;
    }
    if (!toggled->enabled) {
        co_await pImpl->stopIfRunning(id);
    }
    pImpl->emitServersChanged(id);
    co_return toggled;
}

net::awaitable<SessionInfo> HostBridge::startServer(const std::string& id) {
    co_return co_await pImpl->supervisor->startServer(id);
}

net::awaitable<void> HostBridge::stopServer(const std::string& id) {
    co_await pImpl->supervisor->stopServer(id);
}

net::awaitable<SessionInfo> HostBridge::restartServer(const std::string& id) {
    co_return co_await pImpl->supervisor->restartServer(id);
}

ServerStatus HostBridge::getServerStatus(const std::string& id) const {
    return pImpl->supervisor->getServerStatus(id);
}

std::map<std::string, ServerStatus> HostBridge::getAllServerStatus() const {
    return pImpl->supervisor->getAllServerStatus();
}

std::size_t HostBridge::getRunningCount() const {
    return pImpl->supervisor->getRunningCount();
}

std::vector<ServerTool> HostBridge::getAllTools() const {
    return pImpl->supervisor->getAllTools();
}

std::vector<ServerResource> HostBridge::getAllResources() const {
    return pImpl->supervisor->getAllResources();
}

net::awaitable<JSONValue> HostBridge::callTool(const std::string& serverId, const std::string& toolName, JSONValue args) {
    co_return co_await pImpl->supervisor->callTool(serverId, toolName, std::move(args));
}

net::awaitable<JSONValue> HostBridge::callToolByName(const std::string& name, JSONValue args) {
    co_return co_await pImpl->supervisor->callToolByName(name, std::move(args));
}

net::awaitable<JSONValue> HostBridge::readResource(const std::string& serverId, const std::string& uri) {
    co_return co_await pImpl->supervisor->readResource(serverId, uri);
}

net::awaitable<TestResult> HostBridge::testServer(ServerDefinition candidate) {
    co_return co_await pImpl->supervisor->testServerConfig(std::move(candidate));
}

void HostBridge::cancelAllToolCalls() {
    pImpl->supervisor->cancelAllToolCalls();
}

} // namespace mcphost
