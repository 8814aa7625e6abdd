//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConfigStore.h
// Purpose: Record-store interface for server definitions plus in-memory and JSON-file implementations
//==========================================================================================================

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/ServerDefinition.h"

namespace mcphost {

//==========================================================================================================
// IConfigStore
// Purpose: What the supervisor and host bridge need from persistence.
// Methods:
//   listConfigs(): all definitions, newest (createdAt) first.
//   getConfig(id) / getConfigByName(name): lookup; std::nullopt when absent.
//   save(def): create. Assigns a fresh id and timestamps; throws McpException(DuplicateServer) when the
//              name is taken and McpException(ConfigError) when name or command is empty.
//   update(id, patch): applies the patch and refreshes updatedAt; std::nullopt when the id is unknown.
//              Renaming onto another definition's name throws McpException(DuplicateServer).
//   remove(id): true when a definition was deleted.
//==========================================================================================================
class IConfigStore {
public:
    virtual ~IConfigStore() = default;

    virtual std::vector<ServerDefinition> listConfigs() = 0;
    virtual std::optional<ServerDefinition> getConfig(const std::string& id) = 0;
    virtual std::optional<ServerDefinition> getConfigByName(const std::string& name) = 0;
    virtual ServerDefinition save(ServerDefinition def) = 0;
    virtual std::optional<ServerDefinition> update(const std::string& id, const ServerDefinitionPatch& patch) = 0;
    virtual bool remove(const std::string& id) = 0;

    // Convenience queries built on the primitives above.
    std::vector<ServerDefinition> listEnabled();
    std::vector<ServerDefinition> listAutoStart();   // enabled && autoStart
    std::optional<ServerDefinition> updateByName(const std::string& name, const ServerDefinitionPatch& patch);
    bool removeByName(const std::string& name);
    std::optional<ServerDefinition> toggleEnabled(const std::string& id);
};

//==========================================================================================================
// InMemoryConfigStore
// Purpose: Thread-safe store kept in process memory. Subclasses persist through onChanged().
//==========================================================================================================
class InMemoryConfigStore : public IConfigStore {
public:
    InMemoryConfigStore() = default;
    explicit InMemoryConfigStore(std::vector<ServerDefinition> initial);

    std::vector<ServerDefinition> listConfigs() override;
    std::optional<ServerDefinition> getConfig(const std::string& id) override;
    std::optional<ServerDefinition> getConfigByName(const std::string& name) override;
    ServerDefinition save(ServerDefinition def) override;
    std::optional<ServerDefinition> update(const std::string& id, const ServerDefinitionPatch& patch) override;
    bool remove(const std::string& id) override;

protected:
    // Called with the store mutex held and the would-be contents before a mutation is committed.
    // Throwing rejects the mutation.
    virtual void onChanged(const std::vector<ServerDefinition>& records);

    void replaceAll(std::vector<ServerDefinition> records);

private:
    std::mutex mutex_;
    std::vector<ServerDefinition> records_;
};

//==========================================================================================================
// JsonFileConfigStore
// Purpose: Persists definitions as a pretty-printed JSON array. A missing file is an empty store; a file
//          that does not parse throws McpException(ConfigError) from the constructor.
// Notes:
//   Writes go to "<path>.tmp" and are renamed over the target.
//==========================================================================================================
class JsonFileConfigStore : public InMemoryConfigStore {
public:
    explicit JsonFileConfigStore(std::string path);

    const std::string& path() const { return path_; }

protected:
    void onChanged(const std::vector<ServerDefinition>& records) override;

private:
    std::string path_;
};

// New random identifier (UUID v4 text form).
std::string GenerateServerId();

} // namespace mcphost
