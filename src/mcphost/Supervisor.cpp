//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Supervisor.cpp
// Purpose: Session lifecycle, aggregation, routing, cancellation generation and config testing
//==========================================================================================================

#include <algorithm>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <fmt/format.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphost/Supervisor.h"

namespace mcphost {

namespace {
constexpr const char* kQualifierSeparator = "__";
} // namespace

SupervisorOptions SupervisorOptions::FromEnvironment() {
    SupervisorOptions o;
    o.restartDelay = std::chrono::milliseconds(
        GetEnvPositiveIntOrDefault("MCPHOST_RESTART_DELAY_MS", o.restartDelay.count()));
    o.testTimeout = std::chrono::milliseconds(
        GetEnvPositiveIntOrDefault("MCPHOST_TEST_TIMEOUT_MS", o.testTimeout.count()));
    o.session = SessionOptions::FromEnvironment();
    return o;
}

QualifiedToolName ParseQualifiedToolName(const std::string& name) {
    QualifiedToolName q;
    const auto pos = name.find(kQualifierSeparator);
    if (pos == std::string::npos) {
        q.toolName = name;
        return q;
    }
    // An empty qualifier ("__tool") searches every server
    if (pos > 0) {
        q.serverName = name.substr(0, pos);
    }
    q.toolName = name.substr(pos + 2);
    return q;
}

///////////////////////////////////////// Result shapes ///////////////////////////////////////////

JSONValue ServerTool::ToJSON() const {
    JSONValue obj = ToolToJSON(tool);
    SetMember(obj, "serverId", JSONValue(serverId));
    SetMember(obj, "serverName", JSONValue(serverName));
    return obj;
}

JSONValue ServerResource::ToJSON() const {
    JSONValue obj = ResourceToJSON(resource);
    SetMember(obj, "serverId", JSONValue(serverId));
    SetMember(obj, "serverName", JSONValue(serverName));
    return obj;
}

JSONValue ServerStatus::ToJSON() const {
    if (!running || !info) {
        return MakeObject({{"running", JSONValue(false)}});
    }
    JSONValue obj = info->ToJSON();
    SetMember(obj, "running", JSONValue(true));
    return obj;
}

JSONValue TestResult::ToJSON() const {
    JSONValue obj = MakeObject({
        {"success", JSONValue(success)},
        {"message", JSONValue(message)}
    });
    if (success) {
        SetMember(obj, "serverInfo", ImplementationToJSON(serverInfo));
        SetMember(obj, "toolCount", JSONValue(static_cast<int64_t>(toolCount)));
        SetMember(obj, "resourceCount", JSONValue(static_cast<int64_t>(resourceCount)));
        JSONValue arr = MakeArray();
        for (const auto& t : tools) {
            PushBack(arr, MakeObject({{"name", JSONValue(t.name)}, {"description", JSONValue(t.description)}}));
        }
        SetMember(obj, "tools", std::move(arr));
    }
    if (error) {
        SetMember(obj, "error", MakeObject({
            {"category", JSONValue(errors::categoryName(error->category))},
            {"message", JSONValue(error->message)}
        }));
    }
    return obj;
}

///////////////////////////////////////// Supervisor ///////////////////////////////////////////

std::shared_ptr<Supervisor> Supervisor::Create(const net::any_io_executor& ex,
                                               std::shared_ptr<IConfigStore> store,
                                               SupervisorOptions options) {
    return std::shared_ptr<Supervisor>(new Supervisor(ex, std::move(store), std::move(options)));
}

Supervisor::Supervisor(const net::any_io_executor& ex, std::shared_ptr<IConfigStore> store, SupervisorOptions options)
    : executor_(ex), store_(std::move(store)), options_(std::move(options)) {}

Supervisor::~Supervisor() {
    if (!sessions_.empty()) {
        LOG_WARN("Supervisor destroyed with {} running sessions; killing them", sessions_.size());
    }
    for (auto& [id, s] : sessions_) {
        s->close();
    }
}

void Supervisor::SetEventHandler(EventHandler handler) {
    eventHandler_ = std::move(handler);
}

void Supervisor::emit(SupervisorEvent ev) {
    if (!eventHandler_) {
        return;
    }
    auto handler = eventHandler_;
    try {
        handler(ev);
    } catch (const std::exception& e) {
        LOG_ERROR("Supervisor event handler threw: {}", e.what());
    }
}

std::shared_ptr<Session> Supervisor::session(const std::string& id) const {
    auto it = std::find_if(sessions_.begin(), sessions_.end(), [&](const auto& p) { return p.first == id; });
    return it == sessions_.end() ? nullptr : it->second;
}

void Supervisor::registerSession(std::shared_ptr<Session> s) {
    const std::string id = s->id();
    unregisterSession(id);
    sessions_.emplace_back(id, std::move(s));
}

void Supervisor::unregisterSession(const std::string& id) {
    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(), [&](const auto& p) { return p.first == id; }),
                    sessions_.end());
}

net::awaitable<void> Supervisor::initialize() {
    FUNC_SCOPE();
    auto self = shared_from_this();
    if (initialized_) {
        LOG_INFO("Supervisor already initialized");
        co_return;
    }
    initialized_ = true;
    const auto autoStart = store_->listAutoStart();
    LOG_INFO("Initializing MCP supervisor: {} servers marked for auto-start", autoStart.size());
    for (const auto& def : autoStart) {
        try {
            co_await startServer(def.id);
        } catch (const errors::McpException& e) {
            LOG_ERROR("Auto-start of {} failed ({}): {}", def.name, errors::categoryName(e.category()), e.what());
        }
    }
    LOG_INFO("MCP supervisor initialized: {} running", sessions_.size());
}

net::awaitable<SessionInfo> Supervisor::startServer(const std::string& id) {
    FUNC_SCOPE();
    auto self = shared_from_this();
    if (auto existing = session(id); existing && existing->isConnected()) {
        co_return existing->info();
    }
    if (auto it = starting_.find(id); it != starting_.end()) {
        auto attempt = it->second;
        LOG_DEBUG("Start of {} already in progress; waiting", id);
        co_await attempt->done.wait();
        if (attempt->failure) {
            throw errors::McpException(*attempt->failure);
        }
        co_return *attempt->info;
    }

    auto attempt = std::make_shared<StartAttempt>(executor_);
    starting_[id] = attempt;
    std::optional<errors::McpError> failure;
    std::optional<SessionInfo> info;
    try {
        info = co_await doStart(id, attempt);
    } catch (const errors::McpException& e) {
        failure = e.error();
    } catch (const std::exception& e) {
        failure = errors::McpError{0, e.what(), std::nullopt, errors::ErrorCategory::Unknown};
    }
    starting_.erase(id);
    if (failure) {
        attempt->failure = failure;
        attempt->done.fire();
        throw errors::McpException(*failure);
    }
    attempt->info = info;
    attempt->done.fire();
    co_return *info;
}

net::awaitable<SessionInfo> Supervisor::doStart(const std::string& id, std::shared_ptr<StartAttempt> /*attempt*/) {
    if (auto stale = session(id)) {
        LOG_INFO("Discarding non-connected session for {}", id);
        unregisterSession(id);
        co_await stale->disconnect();
    }
    auto def = store_->getConfig(id);
    if (!def) {
        throw errors::McpException(errors::ErrorCategory::ServerNotFound, "Server config not found: " + id);
    }
    if (!def->enabled) {
        throw errors::McpException(errors::ErrorCategory::ServerDisabled, "Server " + def->name + " is disabled");
    }

    auto s = Session::Create(executor_, *def, options_.session);
    std::weak_ptr<Supervisor> weakSelf = weak_from_this();
    std::weak_ptr<Session> weakSession = s;
    s->SetEventHandler([weakSelf, id, weakSession](const SessionEvent& ev) {
        if (auto sup = weakSelf.lock()) {
            sup->onSessionEvent(id, weakSession, ev);
        }
    });
    co_await s->connect();
    registerSession(s);
    LOG_INFO("MCP server {} ({}) running", def->name, id);
    emit(SupervisorEvent{SupervisorEventType::ServerConnected, id, s->info().ToJSON()});
    co_return s->info();
}

net::awaitable<void> Supervisor::stopServer(const std::string& id) {
    FUNC_SCOPE();
    auto self = shared_from_this();
    auto s = session(id);
    if (!s) {
        co_return;
    }
    unregisterSession(id);
    co_await s->disconnect();
    LOG_INFO("Stopped MCP server {} ({})", s->name(), id);
}

net::awaitable<SessionInfo> Supervisor::restartServer(const std::string& id) {
    FUNC_SCOPE();
    auto self = shared_from_this();
    co_await stopServer(id);
    net::steady_timer settle(executor_, options_.restartDelay);
    boost::system::error_code ec;
    co_await settle.async_wait(net::redirect_error(net::use_awaitable, ec));
    co_return co_await startServer(id);
}

net::awaitable<void> Supervisor::stopAll() {
    FUNC_SCOPE();
    auto self = shared_from_this();
    auto running = std::move(sessions_);
    sessions_.clear();
    if (running.empty()) {
        co_return;
    }
    LOG_INFO("Stopping {} MCP servers", running.size());
    auto remaining = std::make_shared<std::size_t>(running.size());
    auto allDone = std::make_shared<async::Signal>(executor_);
    for (auto& entry : running) {
        auto s = entry.second;
        net::co_spawn(executor_, [s, remaining, allDone]() -> net::awaitable<void> {
            try {
                co_await s->disconnect();
            } catch (const std::exception& e) {
                LOG_ERROR("Stopping {} failed: {}", s->name(), e.what());
            }
            if (--*remaining == 0) {
                allDone->fire();
            }
        }, net::detached);
    }
    co_await allDone->wait();
    LOG_INFO("All MCP servers stopped");
}

std::vector<ServerTool> Supervisor::getAllTools() const {
    std::vector<ServerTool> out;
    for (const auto& [id, s] : sessions_) {
        for (const auto& t : s->tools()) {
            out.push_back(ServerTool{id, s->name(), t});
        }
    }
    return out;
}

std::vector<ServerResource> Supervisor::getAllResources() const {
    std::vector<ServerResource> out;
    for (const auto& [id, s] : sessions_) {
        for (const auto& r : s->resources()) {
            out.push_back(ServerResource{id, s->name(), r});
        }
    }
    return out;
}

net::awaitable<JSONValue> Supervisor::guardCancellation(net::awaitable<JSONValue> call) {
    const uint64_t generation = cancelGeneration_;
    JSONValue result = co_await std::move(call);
    if (generation != cancelGeneration_) {
        throw errors::McpException(errors::ErrorCategory::Cancelled, "Tool call cancelled");
    }
    co_return result;
}

void Supervisor::cancelAllToolCalls() {
    ++cancelGeneration_;
    LOG_INFO("Cancelling in-flight tool calls (generation {})", cancelGeneration_);
}

net::awaitable<JSONValue> Supervisor::callTool(const std::string& serverId, const std::string& toolName, JSONValue args) {
    auto self = shared_from_this();
    auto s = session(serverId);
    if (!s) {
        throw errors::McpException(errors::ErrorCategory::ServerNotRunning, "Server " + serverId + " not running");
    }
    LOG_DEBUG("Calling {} on {}", toolName, s->name());
    co_return co_await guardCancellation(s->callTool(toolName, std::move(args)));
}

net::awaitable<JSONValue> Supervisor::readResource(const std::string& serverId, const std::string& uri) {
    auto self = shared_from_this();
    auto s = session(serverId);
    if (!s) {
        throw errors::McpException(errors::ErrorCategory::ServerNotRunning, "Server " + serverId + " not running");
    }
    co_return co_await s->readResource(uri);
}

net::awaitable<JSONValue> Supervisor::callToolByName(const std::string& name, JSONValue args) {
    auto self = shared_from_this();
    const QualifiedToolName q = ParseQualifiedToolName(name);
    std::shared_ptr<Session> target;
    for (const auto& [id, s] : sessions_) {
        if (q.serverName && s->name() != *q.serverName) {
            continue;
        }
        if (s->hasTool(q.toolName)) {
            target = s;
            break;
        }
    }
    if (!target) {
        throw errors::McpException(errors::ErrorCategory::ToolNotFound, "Tool not found: " + name);
    }
    co_return co_await callTool(target->id(), q.toolName, std::move(args));
}

net::awaitable<TestResult> Supervisor::testServerConfig(ServerDefinition candidate) {
    FUNC_SCOPE();
    auto self = shared_from_this();
    TestResult result;
    const auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    candidate.id = "test_" + std::to_string(stamp);
    candidate.enabled = true;
    LOG_INFO("Testing server config {} ({})", candidate.name, candidate.command);

    struct Race {
        explicit Race(const net::any_io_executor& ex) : done(ex) {}
        async::Signal done;
        std::optional<errors::McpError> failure;
    };
    auto s = Session::Create(executor_, candidate, options_.session);
    auto race = std::make_shared<Race>(executor_);
    net::co_spawn(executor_, [s, race]() -> net::awaitable<void> {
        try {
            co_await s->connect();
        } catch (const errors::McpException& e) {
            race->failure = e.error();
        } catch (const std::exception& e) {
            race->failure = errors::McpError{0, e.what(), std::nullopt, errors::ErrorCategory::Unknown};
        }
        race->done.fire();
    }, net::detached);

    bool finished = false;
    try {
        finished = co_await race->done.waitFor(options_.testTimeout);
    } catch (const std::exception& e) {
        race->failure = errors::McpError{0, e.what(), std::nullopt, errors::ErrorCategory::Unknown};
        finished = true;
    }
    if (!finished) {
        race->failure = errors::McpError{
            0, fmt::format("Connection timeout ({}s)", options_.testTimeout.count() / 1000), std::nullopt,
            errors::ErrorCategory::RequestTimeout};
    }

    if (race->failure) {
        result.success = false;
        result.message = race->failure->message;
        result.error = race->failure;
        LOG_WARN("Server config test for {} failed: {}", candidate.name, result.message);
    } else {
        const SessionInfo info = s->info();
        result.success = true;
        result.message = "Connection successful";
        result.serverInfo = info.serverInfo;
        result.toolCount = info.tools.size();
        result.resourceCount = info.resources.size();
        for (const auto& t : info.tools) {
            result.tools.push_back(TestResult::ToolPreview{t.name, t.description});
        }
        LOG_INFO("Server config test for {} succeeded: {} tools, {} resources", candidate.name,
                 result.toolCount, result.resourceCount);
    }

    try {
        co_await s->disconnect();
    } catch (const std::exception& e) {
        LOG_ERROR("Cleanup after config test of {} failed: {}", candidate.name, e.what());
    }
    co_return result;
}

bool Supervisor::isServerRunning(const std::string& id) const {
    auto s = session(id);
    return s && s->isConnected();
}

std::size_t Supervisor::getRunningCount() const {
    return sessions_.size();
}

ServerStatus Supervisor::getServerStatus(const std::string& id) const {
    ServerStatus st;
    if (auto s = session(id)) {
        st.running = true;
        st.info = s->info();
    }
    return st;
}

std::map<std::string, ServerStatus> Supervisor::getAllServerStatus() const {
    std::map<std::string, ServerStatus> out;
    for (const auto& [id, s] : sessions_) {
        out[id] = ServerStatus{true, s->info()};
    }
    return out;
}

void Supervisor::onSessionEvent(const std::string& id, const std::weak_ptr<Session>& who, const SessionEvent& ev) {
    auto s = who.lock();
    switch (ev.type) {
        case SessionEventType::Disconnected: {
            auto current = session(id);
            if (current && current == s) {
                LOG_WARN("MCP server {} disconnected unexpectedly", s->name());
                unregisterSession(id);
            }
            JSONValue payload = MakeObject();
            if (ev.exitCode) SetMember(payload, "exitCode", JSONValue(static_cast<int64_t>(*ev.exitCode)));
            if (ev.termSignal) SetMember(payload, "signal", JSONValue(static_cast<int64_t>(*ev.termSignal)));
            emit(SupervisorEvent{SupervisorEventType::ServerDisconnected, id, std::move(payload)});
            break;
        }
        case SessionEventType::Error:
            emit(SupervisorEvent{SupervisorEventType::ServerError, id, MakeObject({{"message", JSONValue(ev.message)}})});
            break;
        case SessionEventType::ToolsUpdated: {
            JSONValue arr = MakeArray();
            if (s) for (const auto& t : s->tools()) PushBack(arr, ToolToJSON(t));
            emit(SupervisorEvent{SupervisorEventType::ToolsUpdated, id, std::move(arr)});
            break;
        }
        case SessionEventType::ResourcesUpdated: {
            JSONValue arr = MakeArray();
            if (s) for (const auto& r : s->resources()) PushBack(arr, ResourceToJSON(r));
            emit(SupervisorEvent{SupervisorEventType::ResourcesUpdated, id, std::move(arr)});
            break;
        }
        case SessionEventType::ResourceUpdated:
            emit(SupervisorEvent{SupervisorEventType::ResourceUpdated, id, ev.params});
            break;
        case SessionEventType::Connected:
        case SessionEventType::Notification:
            break;
    }
}

} // namespace mcphost
