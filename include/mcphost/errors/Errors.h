//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error taxonomy for sessions and the supervisor, plus JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {
namespace errors {

// What went wrong, independent of the JSON-RPC code (if any) that carried it.
enum class ErrorCategory {
    SpawnError,          // child process could not be started
    HandshakeError,      // initialize failed or returned a malformed result
    RequestTimeout,      // no response within the request timeout
    ConnectionClosed,    // session went away while the request was pending
    NotConnected,        // operation requires a Connected session
    RemoteError,         // server answered with a JSON-RPC error object
    ToolNotFound,
    ServerNotFound,
    ServerDisabled,
    ServerNotRunning,
    DuplicateServer,
    Cancelled,
    ProtocolParseError,
    ConfigError,
    Unknown
};

// Stable, log-friendly name for a category.
inline const char* categoryName(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::SpawnError: return "SpawnError";
        case ErrorCategory::HandshakeError: return "HandshakeError";
        case ErrorCategory::RequestTimeout: return "RequestTimeout";
        case ErrorCategory::ConnectionClosed: return "ConnectionClosed";
        case ErrorCategory::NotConnected: return "NotConnected";
        case ErrorCategory::RemoteError: return "RemoteError";
        case ErrorCategory::ToolNotFound: return "ToolNotFound";
        case ErrorCategory::ServerNotFound: return "ServerNotFound";
        case ErrorCategory::ServerDisabled: return "ServerDisabled";
        case ErrorCategory::ServerNotRunning: return "ServerNotRunning";
        case ErrorCategory::DuplicateServer: return "DuplicateServer";
        case ErrorCategory::Cancelled: return "Cancelled";
        case ErrorCategory::ProtocolParseError: return "ProtocolParseError";
        case ErrorCategory::ConfigError: return "ConfigError";
        default: return "Unknown";
    }
}

// Typed error representation. code is the JSON-RPC code for RemoteError, 0 otherwise.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

//==========================================================================================================
// McpException
// Purpose: Exception type thrown by every suspending operation; what() is the bare message so callers
//          can surface it to users unchanged.
//==========================================================================================================
class McpException : public std::runtime_error {
public:
    explicit McpException(McpError err)
        : std::runtime_error(err.message), error_(std::move(err)) {}
    McpException(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), error_{0, message, std::nullopt, category} {}

    const McpError& error() const noexcept { return error_; }
    ErrorCategory category() const noexcept { return error_.category; }

private:
    McpError error_;
};

// Convert a JSON-RPC error object to McpError with category RemoteError.
// A missing or non-string message falls back to the serialized error object; a missing code yields 0.
//
// Args:
//   errVal: JSONValue expected to be an Object with code/message and optional data.
//
// Returns:
//   McpError describing the remote failure.
inline McpError mcpErrorFromErrorValue(const JSONValue& errVal) {
    McpError e;
    e.category = ErrorCategory::RemoteError;
    if (!errVal.isObject()) {
        e.message = SerializeJSON(errVal);
        return e;
    }
    e.code = static_cast<int>(GetInt(errVal, "code", 0));
    auto msg = GetOptionalString(errVal, "message");
    e.message = msg.has_value() ? *msg : SerializeJSON(errVal);
    if (const JSONValue* d = errVal.find("data")) {
        e.data = *d;
    }
    return e;
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience constructors.
inline McpException makeError(ErrorCategory category, const std::string& message) {
    return McpException(category, message);
}

} // namespace errors
} // namespace mcphost
