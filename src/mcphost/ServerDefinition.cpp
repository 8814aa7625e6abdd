//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerDefinition.cpp
// Purpose: JSON mapping and patching for server definitions
//==========================================================================================================

#include <chrono>
#include <ctime>

#include <fmt/format.h>

#include "mcphost/ServerDefinition.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

namespace {

std::vector<std::string> stringArray(const JSONValue& v) {
    std::vector<std::string> out;
    if (!v.isArray()) {
        return out;
    }
    for (const auto& item : std::get<JSONValue::Array>(v.value)) {
        if (item && item->isString()) {
            out.push_back(std::get<std::string>(item->value));
        }
    }
    return out;
}

std::map<std::string, std::string> stringMap(const JSONValue& v) {
    std::map<std::string, std::string> out;
    if (!v.isObject()) {
        return out;
    }
    for (const auto& [k, item] : std::get<JSONValue::Object>(v.value)) {
        if (!item) continue;
        if (item->isString()) {
            out[k] = std::get<std::string>(item->value);
        } else if (!item->isNull()) {
            // Numbers and booleans are accepted and stored in their JSON spelling
            out[k] = SerializeJSON(*item);
        }
    }
    return out;
}

} // namespace

JSONValue ServerDefinitionToJSON(const ServerDefinition& def) {
    JSONValue obj = MakeObject({
        {"_id", JSONValue(def.id)},
        {"name", JSONValue(def.name)},
        {"command", JSONValue(def.command)},
        {"enabled", JSONValue(def.enabled)},
        {"autoStart", JSONValue(def.autoStart)},
        {"description", JSONValue(def.description)},
        {"icon", JSONValue(def.icon)},
        {"showInToolbar", JSONValue(def.showInToolbar)},
        {"toolbarOrder", JSONValue(def.toolbarOrder)},
        {"createdAt", JSONValue(def.createdAt)},
        {"updatedAt", JSONValue(def.updatedAt)}
    });
    JSONValue args = MakeArray();
    for (const auto& a : def.args) {
        PushBack(args, JSONValue(a));
    }
    SetMember(obj, "args", std::move(args));
    JSONValue env = MakeObject();
    for (const auto& [k, v] : def.env) {
        SetMember(env, k, JSONValue(v));
    }
    SetMember(obj, "env", std::move(env));
    return obj;
}

ServerDefinition ServerDefinitionFromJSON(const JSONValue& v) {
    if (!v.isObject()) {
        throw errors::McpException(errors::ErrorCategory::ConfigError, "Server definition must be a JSON object");
    }
    ServerDefinition def;
    def.id = GetString(v, "_id", GetString(v, "id"));
    def.name = GetString(v, "name");
    def.command = GetString(v, "command");
    if (const JSONValue* a = v.find("args")) def.args = stringArray(*a);
    if (const JSONValue* e = v.find("env")) def.env = stringMap(*e);
    def.enabled = GetBool(v, "enabled", true);
    def.autoStart = GetBool(v, "autoStart", false);
    def.description = GetString(v, "description");
    def.icon = GetString(v, "icon", def.icon);
    def.showInToolbar = GetBool(v, "showInToolbar", true);
    def.toolbarOrder = GetInt(v, "toolbarOrder", 0);
    def.createdAt = GetString(v, "createdAt");
    def.updatedAt = GetString(v, "updatedAt");
    return def;
}

void ServerDefinitionPatch::applyTo(ServerDefinition& def) const {
    if (name) def.name = *name;
    if (command) def.command = *command;
    if (args) def.args = *args;
    if (env) def.env = *env;
    if (enabled) def.enabled = *enabled;
    if (autoStart) def.autoStart = *autoStart;
    if (description) def.description = *description;
    if (icon) def.icon = *icon;
    if (showInToolbar) def.showInToolbar = *showInToolbar;
    if (toolbarOrder) def.toolbarOrder = *toolbarOrder;
}

ServerDefinitionPatch ServerDefinitionPatchFromJSON(const JSONValue& v) {
    ServerDefinitionPatch p;
    if (!v.isObject()) {
        throw errors::McpException(errors::ErrorCategory::ConfigError, "Server update must be a JSON object");
    }
    p.name = GetOptionalString(v, "name");
    p.command = GetOptionalString(v, "command");
    p.description = GetOptionalString(v, "description");
    p.icon = GetOptionalString(v, "icon");
    if (const JSONValue* a = v.find("args")) p.args = stringArray(*a);
    if (const JSONValue* e = v.find("env")) p.env = stringMap(*e);
    if (const JSONValue* b = v.find("enabled"); b && std::holds_alternative<bool>(b->value)) {
        p.enabled = std::get<bool>(b->value);
    }
    if (const JSONValue* b = v.find("autoStart"); b && std::holds_alternative<bool>(b->value)) {
        p.autoStart = std::get<bool>(b->value);
    }
    if (const JSONValue* b = v.find("showInToolbar"); b && std::holds_alternative<bool>(b->value)) {
        p.showInToolbar = std::get<bool>(b->value);
    }
    if (const JSONValue* o = v.find("toolbarOrder"); o && o->isNumber()) {
        p.toolbarOrder = GetInt(v, "toolbarOrder", 0);
    }
    return p;
}

std::string CurrentTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm buf{};
    ::gmtime_r(&t, &buf);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       buf.tm_year + 1900, buf.tm_mon + 1, buf.tm_mday,
                       buf.tm_hour, buf.tm_min, buf.tm_sec, static_cast<int>(ms));
}

} // namespace mcphost
