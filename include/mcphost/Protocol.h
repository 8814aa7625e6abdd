//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures, method names and their JSON mappings
//==========================================================================================================

#pragma once

#include "mcphost/JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace mcphost {
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// The only handshake version this client speaks.
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information (clientInfo / serverInfo)
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

//==========================================================================================================
// ServerCapabilities
// Purpose: Capabilities advertised in the initialize result. tools/resources presence gates discovery;
//          raw keeps the full object for status reporting.
//==========================================================================================================
struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
    JSONValue raw{JSONValue::Object{}};
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;

    Resource() = default;
    Resource(std::string uri, std::string name,
             std::optional<std::string> description = std::nullopt,
             std::optional<std::string> mimeType = std::nullopt)
        : uri(std::move(uri)), name(std::move(name)),
          description(std::move(description)), mimeType(std::move(mimeType)) {}
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
    constexpr const char* ResourceListChanged = "notifications/resources/list_changed";
    constexpr const char* ResourceUpdated = "notifications/resources/updated";
}

///////////////////////////////////////// JSON mappings ///////////////////////////////////////////
// Client capability announcement sent with initialize: { roots: { listChanged: true }, sampling: {} }.
JSONValue ClientCapabilitiesJSON();

// Build initialize params { protocolVersion, capabilities, clientInfo }.
JSONValue BuildInitializeParams(const Implementation& clientInfo);

// Parse capabilities from an initialize result; a missing or non-object member yields empty capabilities.
ServerCapabilities ParseServerCapabilities(const JSONValue& initializeResult);

// Parse serverInfo from an initialize result; missing fields are left empty.
Implementation ParseServerInfo(const JSONValue& initializeResult);

JSONValue ImplementationToJSON(const Implementation& info);

// tools/list and resources/list result parsing. Entries without a name (tools) or uri (resources)
// are skipped with a warning.
std::vector<Tool> ParseToolsList(const JSONValue& result);
std::vector<Resource> ParseResourcesList(const JSONValue& result);

JSONValue ToolToJSON(const Tool& tool);
JSONValue ResourceToJSON(const Resource& resource);

} // namespace mcphost
