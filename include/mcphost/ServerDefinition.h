//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerDefinition.h
// Purpose: Persisted description of one tool server (how to launch it, whether to auto-start it)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {

//==========================================================================================================
// ServerDefinition
// Purpose: Owned by a config store; sessions and the supervisor only read it.
// Fields:
//   id:        stable identity (generated by the store on create).
//   name:      unique human-facing name, also the qualifier in "Name__tool".
//   command/args/env: launch recipe. env entries overlay the host environment.
//   enabled:   disabled definitions can not be started.
//   autoStart: started by Supervisor::initialize() when also enabled.
//   description/icon/showInToolbar/toolbarOrder: display metadata, carried through untouched.
//   createdAt/updatedAt: ISO-8601 UTC timestamps maintained by the store.
//==========================================================================================================
struct ServerDefinition {
    std::string id;
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool enabled{true};
    bool autoStart{false};
    std::string description;
    std::string icon{"\xF0\x9F\x94\xA7"}; // U+1F527 wrench
    bool showInToolbar{true};
    int64_t toolbarOrder{0};
    std::string createdAt;
    std::string updatedAt;
};

// Persisted shape uses "_id" for the identity field.
JSONValue ServerDefinitionToJSON(const ServerDefinition& def);

// Missing fields take their defaults; throws McpException(ConfigError) when the value is not an object.
ServerDefinition ServerDefinitionFromJSON(const JSONValue& v);

//==========================================================================================================
// ServerDefinitionPatch
// Purpose: Partial update; only engaged members are applied. id and createdAt are not patchable.
//==========================================================================================================
struct ServerDefinitionPatch {
    std::optional<std::string> name;
    std::optional<std::string> command;
    std::optional<std::vector<std::string>> args;
    std::optional<std::map<std::string, std::string>> env;
    std::optional<bool> enabled;
    std::optional<bool> autoStart;
    std::optional<std::string> description;
    std::optional<std::string> icon;
    std::optional<bool> showInToolbar;
    std::optional<int64_t> toolbarOrder;

    void applyTo(ServerDefinition& def) const;
};

// Builds a patch from a JSON object; unknown keys, "_id" and "createdAt" are ignored.
ServerDefinitionPatch ServerDefinitionPatchFromJSON(const JSONValue& v);

// Current time as ISO-8601 UTC with milliseconds, e.g. 2025-01-31T09:15:02.123Z.
std::string CurrentTimestamp();

} // namespace mcphost
