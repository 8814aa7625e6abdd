//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConfigStore.cpp
// Purpose: In-memory and JSON-file server definition stores
//==========================================================================================================

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "logging/Logger.h"
#include "mcphost/ConfigStore.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

std::string GenerateServerId() {
    static thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

///////////////////////////////////////// IConfigStore helpers ///////////////////////////////////////////

std::vector<ServerDefinition> IConfigStore::listEnabled() {
    auto all = listConfigs();
    all.erase(std::remove_if(all.begin(), all.end(), [](const ServerDefinition& d) { return !d.enabled; }), all.end());
    return all;
}

std::vector<ServerDefinition> IConfigStore::listAutoStart() {
    auto all = listConfigs();
    all.erase(std::remove_if(all.begin(), all.end(),
                             [](const ServerDefinition& d) { return !(d.enabled && d.autoStart); }),
              all.end());
    return all;
}

std::optional<ServerDefinition> IConfigStore::updateByName(const std::string& name, const ServerDefinitionPatch& patch) {
    auto existing = getConfigByName(name);
    if (!existing) {
        return std::nullopt;
    }
    return update(existing->id, patch);
}

bool IConfigStore::removeByName(const std::string& name) {
    auto existing = getConfigByName(name);
    return existing ? remove(existing->id) : false;
}

std::optional<ServerDefinition> IConfigStore::toggleEnabled(const std::string& id) {
    auto existing = getConfig(id);
    if (!existing) {
        return std::nullopt;
    }
    ServerDefinitionPatch patch;
    patch.enabled = !existing->enabled;
    return update(id, patch);
}

///////////////////////////////////////// InMemoryConfigStore ///////////////////////////////////////////

InMemoryConfigStore::InMemoryConfigStore(std::vector<ServerDefinition> initial) {
    replaceAll(std::move(initial));
}

void InMemoryConfigStore::replaceAll(std::vector<ServerDefinition> records) {
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto& r : records) {
        if (r.id.empty()) r.id = GenerateServerId();
        if (r.createdAt.empty()) r.createdAt = CurrentTimestamp();
        if (r.updatedAt.empty()) r.updatedAt = r.createdAt;
    }
    records_ = std::move(records);
}

void InMemoryConfigStore::onChanged(const std::vector<ServerDefinition>& /*records*/) {}

std::vector<ServerDefinition> InMemoryConfigStore::listConfigs() {
    std::vector<ServerDefinition> out;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        out = records_;
    }
    std::stable_sort(out.begin(), out.end(), [](const ServerDefinition& a, const ServerDefinition& b) {
        return a.createdAt > b.createdAt;
    });
    return out;
}

std::optional<ServerDefinition> InMemoryConfigStore::getConfig(const std::string& id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = std::find_if(records_.begin(), records_.end(), [&](const ServerDefinition& d) { return d.id == id; });
    if (it == records_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<ServerDefinition> InMemoryConfigStore::getConfigByName(const std::string& name) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = std::find_if(records_.begin(), records_.end(), [&](const ServerDefinition& d) { return d.name == name; });
    if (it == records_.end()) {
        return std::nullopt;
    }
    return *it;
}

ServerDefinition InMemoryConfigStore::save(ServerDefinition def) {
    if (def.name.empty() || def.command.empty()) {
        throw errors::McpException(errors::ErrorCategory::ConfigError, "Server name and command are required");
    }
    std::lock_guard<std::mutex> lk(mutex_);
    bool taken = std::any_of(records_.begin(), records_.end(), [&](const ServerDefinition& d) { return d.name == def.name; });
    if (taken) {
        throw errors::McpException(errors::ErrorCategory::DuplicateServer,
                                   "Server with name '" + def.name + "' already exists");
    }
    def.id = GenerateServerId();
    def.createdAt = CurrentTimestamp();
    def.updatedAt = def.createdAt;
    // Persist first; a failed write leaves the store as it was
    std::vector<ServerDefinition> candidate = records_;
    candidate.push_back(def);
    onChanged(candidate);
    records_ = std::move(candidate);
    LOG_INFO("Created server definition {} ({})", def.name, def.id);
    return def;
}

std::optional<ServerDefinition> InMemoryConfigStore::update(const std::string& id, const ServerDefinitionPatch& patch) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = std::find_if(records_.begin(), records_.end(), [&](const ServerDefinition& d) { return d.id == id; });
    if (it == records_.end()) {
        return std::nullopt;
    }
    if (patch.name && *patch.name != it->name) {
        bool taken = std::any_of(records_.begin(), records_.end(),
                                 [&](const ServerDefinition& d) { return d.id != id && d.name == *patch.name; });
        if (taken) {
            throw errors::McpException(errors::ErrorCategory::DuplicateServer,
                                       "Server with name '" + *patch.name + "' already exists");
        }
        if (patch.name->empty()) {
            throw errors::McpException(errors::ErrorCategory::ConfigError, "Server name can not be empty");
        }
    }
    std::vector<ServerDefinition> candidate = records_;
    ServerDefinition& target = candidate[static_cast<size_t>(it - records_.begin())];
    patch.applyTo(target);
    target.updatedAt = CurrentTimestamp();
    ServerDefinition updated = target;
    onChanged(candidate);
    records_ = std::move(candidate);
    return updated;
}

bool InMemoryConfigStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<ServerDefinition> candidate = records_;
    candidate.erase(std::remove_if(candidate.begin(), candidate.end(), [&](const ServerDefinition& d) { return d.id == id; }),
                    candidate.end());
    if (candidate.size() == records_.size()) {
        return false;
    }
    onChanged(candidate);
    records_ = std::move(candidate);
    return true;
}

///////////////////////////////////////// JsonFileConfigStore ///////////////////////////////////////////

JsonFileConfigStore::JsonFileConfigStore(std::string path) : path_(std::move(path)) {
    std::ifstream in(path_);
    if (!in.is_open()) {
        LOG_INFO("Config file {} not found; starting with no servers", path_);
        return;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    JSONValue doc;
    try {
        doc = ParseJSON(ss.str());
    } catch (const JSONParseError& e) {
        throw errors::McpException(errors::ErrorCategory::ConfigError,
                                   "Invalid config file " + path_ + ": " + e.what());
    }
    // Accept either a bare array or { "servers": [...] }
    const JSONValue* arr = doc.isArray() ? &doc : doc.find("servers");
    if (arr == nullptr || !arr->isArray()) {
        throw errors::McpException(errors::ErrorCategory::ConfigError,
                                   "Config file " + path_ + " must contain an array of servers");
    }
    std::vector<ServerDefinition> records;
    for (const auto& item : std::get<JSONValue::Array>(arr->value)) {
        if (item) {
            records.push_back(ServerDefinitionFromJSON(*item));
        }
    }
    LOG_INFO("Loaded {} server definitions from {}", records.size(), path_);
    replaceAll(std::move(records));
}

void JsonFileConfigStore::onChanged(const std::vector<ServerDefinition>& records) {
    JSONValue arr = MakeArray();
    for (const auto& r : records) {
        PushBack(arr, ServerDefinitionToJSON(r));
    }
    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            throw errors::McpException(errors::ErrorCategory::ConfigError, "Can not write " + tmp);
        }
        out << SerializeJSONPretty(arr) << "\n";
        if (!out.good()) {
            throw errors::McpException(errors::ErrorCategory::ConfigError, "Short write to " + tmp);
        }
    }
    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        throw errors::McpException(errors::ErrorCategory::ConfigError, "Can not replace " + path_);
    }
}

} // namespace mcphost
