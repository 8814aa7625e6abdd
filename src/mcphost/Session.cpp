//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.cpp
// Purpose: Child-process MCP session: handshake, request correlation, notifications, discovery caches
//==========================================================================================================

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <fmt/format.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphost/Session.h"
#include "mcphost/version.h"

namespace mcphost {

namespace {

constexpr std::size_t kLoggedLineMax = 200;

std::string trimCopy(const std::string& s) {
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::string clip(const std::string& s) {
    if (s.size() <= kLoggedLineMax) return s;
    return s.substr(0, kLoggedLineMax) + "...";
}

bool extractIntegerId(const JSONValue& idVal, int64_t& out) {
    if (std::holds_alternative<int64_t>(idVal.value)) {
        out = std::get<int64_t>(idVal.value);
        return true;
    }
    if (std::holds_alternative<double>(idVal.value)) {
        const double d = std::get<double>(idVal.value);
        // [-2^63, 2^63) is exactly representable; anything outside (or NaN) can not be one of our ids
        if (!(d >= -9223372036854775808.0 && d < 9223372036854775808.0)) {
            return false;
        }
        out = static_cast<int64_t>(d);
        return static_cast<double>(out) == d;
    }
    if (idVal.isString()) {
        const auto& s = std::get<std::string>(idVal.value);
        try {
            std::size_t used = 0;
            out = std::stoll(s, &used);
            return used == s.size();
        } catch (const std::logic_error&) {
            return false;
        }
    }
    return false;
}

} // namespace

const char* connectionStateName(ConnectionState s) {
    switch (s) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Connected: return "Connected";
        case ConnectionState::Failed: return "Failed";
    }
    return "Unknown";
}

SessionOptions::SessionOptions() : clientInfo("mcphost", getVersionString()) {}

SessionOptions SessionOptions::FromEnvironment() {
    SessionOptions o;
    o.requestTimeout = std::chrono::milliseconds(
        GetEnvPositiveIntOrDefault("MCPHOST_REQUEST_TIMEOUT_MS", o.requestTimeout.count()));
    o.killGrace = std::chrono::milliseconds(
        GetEnvPositiveIntOrDefault("MCPHOST_KILL_GRACE_MS", o.killGrace.count()));
    return o;
}

JSONValue SessionInfo::ToJSON() const {
    JSONValue out = MakeObject({
        {"serverId", JSONValue(serverId)},
        {"serverName", JSONValue(serverName)},
        {"isConnected", JSONValue(isConnected)}
    });
    SetMember(out, "info", ImplementationToJSON(serverInfo));
    SetMember(out, "capabilities", capabilities.raw);
    JSONValue toolArr = MakeArray();
    for (const auto& t : tools) PushBack(toolArr, ToolToJSON(t));
    SetMember(out, "tools", std::move(toolArr));
    JSONValue resArr = MakeArray();
    for (const auto& r : resources) PushBack(resArr, ResourceToJSON(r));
    SetMember(out, "resources", std::move(resArr));
    return out;
}

std::shared_ptr<Session> Session::Create(const net::any_io_executor& ex,
                                         ServerDefinition definition,
                                         SessionOptions options) {
    return std::shared_ptr<Session>(new Session(ex, std::move(definition), std::move(options)));
}

Session::Session(const net::any_io_executor& ex, ServerDefinition definition, SessionOptions options)
    : executor_(ex),
      definition_(std::move(definition)),
      options_(std::move(options)),
      connectDone_(ex) {}

Session::~Session() {
    // ChildProcess's destructor kills and reaps a process that is still alive
    if (process_ && !closed_) {
        LOG_DEBUG("Session {} destroyed while open; killing pid {}", definition_.name, static_cast<int>(process_->pid()));
    }
}

void Session::SetEventHandler(EventHandler handler) {
    eventHandler_ = std::move(handler);
}

void Session::emit(SessionEvent ev) {
    if (!eventHandler_) {
        return;
    }
    auto handler = eventHandler_;
    try {
        handler(ev);
    } catch (const std::exception& e) {
        LOG_ERROR("Event handler for {} threw: {}", definition_.name, e.what());
    }
}

bool Session::processAlive() const {
    return !closed_ && process_ && process_->stdinPipe().is_open();
}

std::optional<pid_t> Session::pid() const {
    if (!process_) {
        return std::nullopt;
    }
    return process_->pid();
}

bool Session::hasTool(const std::string& toolName) const {
    return std::any_of(tools_.begin(), tools_.end(), [&](const Tool& t) { return t.name == toolName; });
}

SessionInfo Session::info() const {
    SessionInfo i;
    i.serverId = definition_.id;
    i.serverName = definition_.name;
    i.serverInfo = serverInfo_;
    i.capabilities = serverCapabilities_;
    i.isConnected = isConnected();
    i.tools = tools_;
    i.resources = resources_;
    return i;
}

////////////////////////////////////////// connect / handshake //////////////////////////////////////////

net::awaitable<void> Session::connect() {
    FUNC_SCOPE();
    auto self = shared_from_this();
    if (state_ == ConnectionState::Connected) {
        co_return;
    }
    if (state_ == ConnectionState::Connecting) {
        co_await connectDone_.wait();
        if (state_ != ConnectionState::Connected) {
            throw errors::McpException(errors::ErrorCategory::HandshakeError,
                                       fmt::format("Connection to {} failed", definition_.name));
        }
        co_return;
    }
    if (closed_) {
        throw errors::McpException(errors::ErrorCategory::ConnectionClosed,
                                   "Session is closed; create a new session to reconnect");
    }

    state_ = ConnectionState::Connecting;
    SpawnOptions spawn{definition_.command, NormalizeArgs(definition_.args), definition_.env};
    LOG_INFO("Starting MCP server {}: {} ({} args)", definition_.name, spawn.command, spawn.args.size());
    try {
        process_ = ChildProcess::Spawn(executor_, spawn);
    } catch (const errors::McpException& e) {
        LOG_ERROR("Failed to spawn MCP server {}: {}", definition_.name, e.what());
        closed_ = true;
        state_ = ConnectionState::Failed;
        connectDone_.fire();
        throw;
    }

    net::co_spawn(executor_, readLoop(), net::detached);
    net::co_spawn(executor_, stderrLoop(), net::detached);

    std::optional<errors::McpError> failure;
    try {
        co_await runHandshake();
    } catch (const errors::McpException& e) {
        failure = e.error();
    } catch (const std::exception& e) {
        failure = errors::McpError{0, e.what(), std::nullopt, errors::ErrorCategory::HandshakeError};
    }
    if (!failure && closed_) {
        failure = errors::McpError{0, "Server exited during handshake", std::nullopt,
                                   errors::ErrorCategory::ConnectionClosed};
    }

    if (failure) {
        LOG_ERROR("Handshake with {} failed: {}", definition_.name, failure->message);
        shutdownNow(ConnectionState::Failed);
        state_ = disconnectRequested_ ? ConnectionState::Disconnected : ConnectionState::Failed;
        co_await process_->terminate(options_.killGrace);
        errors::McpError err{0, "Handshake failed: " + failure->message, failure->data,
                             errors::ErrorCategory::HandshakeError};
        throw errors::McpException(std::move(err));
    }

    state_ = ConnectionState::Connected;
    connectDone_.fire();
    LOG_INFO("Connected to {} ({} {}): {} tools, {} resources", definition_.name,
             serverInfo_.name, serverInfo_.version, tools_.size(), resources_.size());
    emit(SessionEvent{SessionEventType::Connected, definition_.id});
}

net::awaitable<void> Session::runHandshake() {
    JSONValue result = co_await sendRequest(Methods::Initialize, BuildInitializeParams(options_.clientInfo));
    if (!result.isObject()) {
        throw errors::McpException(errors::ErrorCategory::HandshakeError, "initialize returned a non-object result");
    }
    serverCapabilities_ = ParseServerCapabilities(result);
    serverInfo_ = ParseServerInfo(result);
    sendNotification(Methods::Initialized);

    if (serverCapabilities_.tools) {
        co_await refreshTools();
    }
    if (serverCapabilities_.resources) {
        co_await refreshResources();
    }
}

////////////////////////////////////////// requests //////////////////////////////////////////

net::awaitable<JSONValue> Session::sendRequest(const std::string& method, JSONValue params) {
    auto self = shared_from_this();
    if (!processAlive()) {
        throw errors::McpException(errors::ErrorCategory::ConnectionClosed, "MCP Server not running");
    }
    const int64_t id = nextRequestId_++;
    auto pending = std::make_shared<PendingRequest>(executor_, method);
    pending->timer.expires_after(options_.requestTimeout);
    pendingRequests_.emplace(id, pending);

    JSONRPCRequest request(id, method, std::move(params));
    LOG_DEBUG("-> {} id={} {}", definition_.name, id, method);
    enqueueLine(request.Serialize() + "\n");

    while (!pending->settled) {
        boost::system::error_code ec;
        co_await pending->timer.async_wait(net::redirect_error(net::use_awaitable, ec));
        if (!pending->settled && ec != net::error::operation_aborted) {
            pendingRequests_.erase(id);
            pending->settled = true;
            LOG_WARN("Request {} id={} to {} timed out after {} ms", method, id, definition_.name,
                     options_.requestTimeout.count());
            throw errors::McpException(errors::ErrorCategory::RequestTimeout, "Request timeout: " + method);
        }
    }
    if (pending->failure) {
        throw errors::McpException(std::move(*pending->failure));
    }
    co_return std::move(*pending->result);
}

void Session::sendNotification(const std::string& method, std::optional<JSONValue> params) {
    if (!processAlive()) {
        LOG_WARN("Dropping notification {} for {}: MCP Server not running", method, definition_.name);
        return;
    }
    JSONRPCNotification n(method, std::move(params));
    enqueueLine(n.Serialize() + "\n");
}

net::awaitable<JSONValue> Session::callTool(const std::string& name, JSONValue arguments) {
    auto self = shared_from_this();
    if (!isConnected()) {
        throw errors::McpException(errors::ErrorCategory::NotConnected, "MCP Server not connected");
    }
    JSONValue params = MakeObject({{"name", JSONValue(name)}});
    SetMember(params, "arguments", arguments.isNull() ? MakeObject() : std::move(arguments));
    co_return co_await sendRequest(Methods::CallTool, std::move(params));
}

net::awaitable<JSONValue> Session::readResource(const std::string& uri) {
    auto self = shared_from_this();
    if (!isConnected()) {
        throw errors::McpException(errors::ErrorCategory::NotConnected, "MCP Server not connected");
    }
    JSONValue params = MakeObject({{"uri", JSONValue(uri)}});
    co_return co_await sendRequest(Methods::ReadResource, std::move(params));
}

net::awaitable<void> Session::refreshTools() {
    auto self = shared_from_this();
    if (!serverCapabilities_.tools) {
        co_return;
    }
    bool ok = false;
    try {
        JSONValue result = co_await sendRequest(Methods::ListTools, MakeObject());
        tools_ = ParseToolsList(result);
        ok = true;
    } catch (const errors::McpException& e) {
        LOG_ERROR("Failed to list tools for {}: {}", definition_.name, e.what());
        tools_.clear();
    }
    if (ok) {
        LOG_DEBUG("{} exposes {} tools", definition_.name, tools_.size());
        emit(SessionEvent{SessionEventType::ToolsUpdated, definition_.id});
    }
}

net::awaitable<void> Session::refreshResources() {
    auto self = shared_from_this();
    if (!serverCapabilities_.resources) {
        co_return;
    }
    bool ok = false;
    try {
        JSONValue result = co_await sendRequest(Methods::ListResources, MakeObject());
        resources_ = ParseResourcesList(result);
        ok = true;
    } catch (const errors::McpException& e) {
        LOG_ERROR("Failed to list resources for {}: {}", definition_.name, e.what());
        resources_.clear();
    }
    if (ok) {
        LOG_DEBUG("{} exposes {} resources", definition_.name, resources_.size());
        emit(SessionEvent{SessionEventType::ResourcesUpdated, definition_.id});
    }
}

////////////////////////////////////////// settlement //////////////////////////////////////////

void Session::settle(int64_t id, std::optional<JSONValue> result, std::optional<errors::McpError> failure) {
    auto it = pendingRequests_.find(id);
    if (it == pendingRequests_.end()) {
        LOG_WARN("{}: dropping response for unknown or expired request id={}", definition_.name, id);
        return;
    }
    auto pending = it->second;
    pendingRequests_.erase(it);
    pending->result = std::move(result);
    pending->failure = std::move(failure);
    pending->settled = true;
    pending->timer.cancel();
}

void Session::rejectAllPending(const errors::McpError& err) {
    std::unordered_map<int64_t, std::shared_ptr<PendingRequest>> drained;
    drained.swap(pendingRequests_);
    for (auto& [id, pending] : drained) {
        pending->failure = err;
        pending->settled = true;
        pending->timer.cancel();
    }
    if (!drained.empty()) {
        LOG_DEBUG("{}: rejected {} pending requests: {}", definition_.name, drained.size(), err.message);
    }
}

////////////////////////////////////////// incoming //////////////////////////////////////////

void Session::handleLine(const std::string& raw) {
    const std::string line = trimCopy(raw);
    if (line.empty()) {
        return;
    }
    JSONValue msg;
    try {
        msg = ParseJSON(line);
    } catch (const JSONParseError& e) {
        LOG_WARN("{}: ProtocolParseError, dropping line ({}): {}", definition_.name, e.what(), clip(line));
        return;
    }
    switch (ClassifyMessage(msg)) {
        case MessageKind::Response:
            handleResponse(msg);
            break;
        case MessageKind::Notification:
            handleNotification(msg);
            break;
        case MessageKind::Request:
            handleServerRequest(msg);
            break;
        case MessageKind::Invalid:
            LOG_WARN("{}: ignoring message that is neither response nor notification: {}", definition_.name, clip(line));
            break;
    }
}

void Session::handleResponse(const JSONValue& msg) {
    int64_t id = 0;
    const JSONValue* idVal = msg.find("id");
    if (idVal == nullptr || !extractIntegerId(*idVal, id)) {
        const JSONValue* err = msg.find("error");
        LOG_WARN("{}: response without a usable id: {}", definition_.name,
                 err ? SerializeJSON(*err) : std::string("(no error)"));
        return;
    }
    const JSONValue* err = msg.find("error");
    if (err != nullptr && !err->isNull()) {
        settle(id, std::nullopt, errors::mcpErrorFromErrorValue(*err));
        return;
    }
    const JSONValue* result = msg.find("result");
    settle(id, result ? *result : JSONValue(nullptr), std::nullopt);
}

void Session::handleNotification(const JSONValue& msg) {
    const std::string method = GetString(msg, "method");
    const JSONValue* p = msg.find("params");
    JSONValue params = p ? *p : MakeObject();

    if (method == Methods::ToolListChanged) {
        LOG_INFO("{}: tool list changed, refreshing", definition_.name);
        net::co_spawn(executor_, refreshTools(), net::detached);
    } else if (method == Methods::ResourceListChanged) {
        LOG_INFO("{}: resource list changed, refreshing", definition_.name);
        net::co_spawn(executor_, refreshResources(), net::detached);
    } else if (method == Methods::ResourceUpdated) {
        emit(SessionEvent{SessionEventType::ResourceUpdated, definition_.id, method, std::move(params)});
    } else {
        LOG_DEBUG("{}: forwarding notification {}", definition_.name, method);
        emit(SessionEvent{SessionEventType::Notification, definition_.id, method, std::move(params)});
    }
}

void Session::handleServerRequest(const JSONValue& msg) {
    JSONRPCRequest req;
    if (!req.FromJSON(msg)) {
        return;
    }
    LOG_WARN("{}: server request {} is not supported by this client", definition_.name, req.method);
    auto resp = CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
    enqueueLine(resp->Serialize() + "\n");
}

////////////////////////////////////////// I/O loops //////////////////////////////////////////

void Session::enqueueLine(std::string line) {
    writeQueue_.push_back(std::move(line));
    if (!writing_) {
        writing_ = true;
        net::co_spawn(executor_, writeLoop(), net::detached);
    }
}

net::awaitable<void> Session::writeLoop() {
    auto self = shared_from_this();
    while (!writeQueue_.empty() && processAlive()) {
        std::string line = std::move(writeQueue_.front());
        writeQueue_.pop_front();
        boost::system::error_code ec;
        co_await net::async_write(process_->stdinPipe(), net::buffer(line),
                                  net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (ec != net::error::operation_aborted) {
                LOG_WARN("{}: write to server stdin failed: {}", definition_.name, ec.message());
                emit(SessionEvent{SessionEventType::Error, definition_.id, {}, JSONValue(), std::nullopt,
                                  std::nullopt, "stdin write failed: " + ec.message()});
            }
            writeQueue_.clear();
            break;
        }
    }
    writing_ = false;
}

net::awaitable<void> Session::readLoop() {
    auto self = shared_from_this();
    std::string buffer;
    while (!closed_) {
        boost::system::error_code ec;
        std::size_t n = co_await net::async_read_until(process_->stdoutPipe(),
                                                       net::dynamic_buffer(buffer, options_.maxLineBytes), '\n',
                                                       net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (ec != net::error::eof && ec != net::error::operation_aborted && ec != net::error::bad_descriptor) {
                LOG_WARN("{}: stdout read failed: {}", definition_.name, ec.message());
            }
            break;
        }
        std::string line = buffer.substr(0, n);
        buffer.erase(0, n);
        handleLine(line);
    }
    if (!closed_ && !buffer.empty()) {
        // A final line without a trailing newline
        handleLine(buffer);
    }
    onStreamClosed();
}

net::awaitable<void> Session::stderrLoop() {
    auto self = shared_from_this();
    std::string buffer;
    while (!closed_) {
        boost::system::error_code ec;
        std::size_t n = co_await net::async_read_until(process_->stderrPipe(),
                                                       net::dynamic_buffer(buffer, options_.maxLineBytes), '\n',
                                                       net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            break;
        }
        std::string line = trimCopy(buffer.substr(0, n));
        buffer.erase(0, n);
        if (!line.empty()) {
            LOG_INFO("[{}][stderr] {}", definition_.name, line);
        }
    }
}

void Session::onStreamClosed() {
    if (closed_) {
        return;
    }
    LOG_WARN("MCP server {} closed its output; treating as exited", definition_.name);
    shutdownNow(state_ == ConnectionState::Connecting ? ConnectionState::Failed : ConnectionState::Disconnected);
    auto self = shared_from_this();
    net::co_spawn(executor_, [self]() -> net::awaitable<void> {
        co_await self->process_->terminate(self->options_.killGrace);
        LOG_DEBUG("{} reaped (exit={}, signal={})", self->definition_.name,
                  self->process_->exitCode().value_or(-1), self->process_->termSignal().value_or(0));
    }, net::detached);
}

////////////////////////////////////////// shutdown //////////////////////////////////////////

void Session::shutdownNow(ConnectionState finalState) {
    if (closed_) {
        return;
    }
    const bool wasConnected = (state_ == ConnectionState::Connected);
    closed_ = true;
    state_ = finalState;
    rejectAllPending(errors::McpError{0, "Connection closed", std::nullopt, errors::ErrorCategory::ConnectionClosed});
    tools_.clear();
    resources_.clear();
    writeQueue_.clear();
    if (process_) {
        process_->closePipes();
    }
    connectDone_.fire();
    if (wasConnected) {
        SessionEvent ev{SessionEventType::Disconnected, definition_.id};
        if (process_ && !process_->running()) {
            ev.exitCode = process_->exitCode();
            ev.termSignal = process_->termSignal();
        }
        emit(std::move(ev));
    }
}

net::awaitable<void> Session::disconnect() {
    FUNC_SCOPE();
    auto self = shared_from_this();
    if (!closed_) {
        LOG_INFO("Disconnecting from MCP server {}", definition_.name);
    }
    disconnectRequested_ = true;
    shutdownNow(ConnectionState::Disconnected);
    // A session closed earlier (failed connect, stream loss) may still report Failed
    state_ = ConnectionState::Disconnected;
    if (process_) {
        co_await process_->terminate(options_.killGrace);
    }
}

void Session::close() {
    disconnectRequested_ = true;
    shutdownNow(ConnectionState::Disconnected);
    state_ = ConnectionState::Disconnected;
    if (process_) {
        process_->kill();
    }
}

} // namespace mcphost
