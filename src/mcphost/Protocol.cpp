//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: JSON mappings for handshake, capabilities and discovery results
//==========================================================================================================

#include "mcphost/Protocol.h"
#include "logging/Logger.h"

namespace mcphost {

JSONValue ClientCapabilitiesJSON() {
    JSONValue caps = MakeObject();
    SetMember(caps, "roots", MakeObject({{"listChanged", JSONValue(true)}}));
    SetMember(caps, "sampling", MakeObject());
    return caps;
}

JSONValue ImplementationToJSON(const Implementation& info) {
    return MakeObject({
        {"name", JSONValue(info.name)},
        {"version", JSONValue(info.version)}
    });
}

JSONValue BuildInitializeParams(const Implementation& clientInfo) {
    JSONValue params = MakeObject({{"protocolVersion", JSONValue(PROTOCOL_VERSION)}});
    SetMember(params, "capabilities", ClientCapabilitiesJSON());
    SetMember(params, "clientInfo", ImplementationToJSON(clientInfo));
    return params;
}

ServerCapabilities ParseServerCapabilities(const JSONValue& initializeResult) {
    ServerCapabilities caps;
    const JSONValue* capsVal = initializeResult.find("capabilities");
    if (capsVal == nullptr || !capsVal->isObject()) {
        return caps;
    }
    caps.raw = *capsVal;
    if (const JSONValue* tools = capsVal->find("tools")) {
        caps.tools = ToolsCapability{GetBool(*tools, "listChanged", false)};
    }
    if (const JSONValue* resources = capsVal->find("resources")) {
        caps.resources = ResourcesCapability{GetBool(*resources, "subscribe", false),
                                             GetBool(*resources, "listChanged", false)};
    }
    return caps;
}

Implementation ParseServerInfo(const JSONValue& initializeResult) {
    Implementation info;
    const JSONValue* si = initializeResult.find("serverInfo");
    if (si != nullptr) {
        info.name = GetString(*si, "name");
        info.version = GetString(*si, "version");
    }
    return info;
}

std::vector<Tool> ParseToolsList(const JSONValue& result) {
    std::vector<Tool> tools;
    const JSONValue* arr = result.find("tools");
    if (arr == nullptr || !arr->isArray()) {
        LOG_WARN("tools/list result has no tools array");
        return tools;
    }
    for (const auto& toolJson : std::get<JSONValue::Array>(arr->value)) {
        if (!toolJson || !toolJson->isObject()) {
            continue;
        }
        Tool tool;
        tool.name = GetString(*toolJson, "name");
        if (tool.name.empty()) {
            LOG_WARN("Skipping tool entry without a name");
            continue;
        }
        tool.description = GetString(*toolJson, "description");
        if (const JSONValue* schema = toolJson->find("inputSchema")) {
            tool.inputSchema = *schema;
        }
        tools.push_back(std::move(tool));
    }
    return tools;
}

std::vector<Resource> ParseResourcesList(const JSONValue& result) {
    std::vector<Resource> resources;
    const JSONValue* arr = result.find("resources");
    if (arr == nullptr || !arr->isArray()) {
        LOG_WARN("resources/list result has no resources array");
        return resources;
    }
    for (const auto& resJson : std::get<JSONValue::Array>(arr->value)) {
        if (!resJson || !resJson->isObject()) {
            continue;
        }
        Resource res;
        res.uri = GetString(*resJson, "uri");
        if (res.uri.empty()) {
            LOG_WARN("Skipping resource entry without a uri");
            continue;
        }
        res.name = GetString(*resJson, "name");
        res.description = GetOptionalString(*resJson, "description");
        res.mimeType = GetOptionalString(*resJson, "mimeType");
        resources.push_back(std::move(res));
    }
    return resources;
}

JSONValue ToolToJSON(const Tool& tool) {
    JSONValue obj = MakeObject({
        {"name", JSONValue(tool.name)},
        {"description", JSONValue(tool.description)}
    });
    SetMember(obj, "inputSchema", tool.inputSchema.isNull()
        ? MakeObject({{"type", JSONValue("object")}})
        : tool.inputSchema);
    return obj;
}

JSONValue ResourceToJSON(const Resource& resource) {
    JSONValue obj = MakeObject({
        {"uri", JSONValue(resource.uri)},
        {"name", JSONValue(resource.name)}
    });
    if (resource.description.has_value()) {
        SetMember(obj, "description", JSONValue(resource.description.value()));
    }
    if (resource.mimeType.has_value()) {
        SetMember(obj, "mimeType", JSONValue(resource.mimeType.value()));
    }
    return obj;
}

} // namespace mcphost
