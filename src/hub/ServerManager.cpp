// SPDX-License-Identifier: Apache-2.0
#include "ServerManager.hpp"

#include <core/Log.hpp>

#include <format>

namespace mcphub
{

ServerManager::ServerManager(ToolRegistry& registry,
                             std::shared_ptr<ConnectionFactory> factory,
                             ServerManagerOptions options):
    _registry(registry), _factory(std::move(factory)), _options(options)
{
}

ServerManager::~ServerManager()
{
    stopAll();
}

auto ServerManager::addServer(ServerDefinition definition) -> VoidResult
{
    auto valid = validateDefinition(definition);
    if (!valid)
        return valid;

    auto const name = definition.name;
    auto slot = std::make_shared<ServerSlot>(std::move(definition));

    auto const lock = std::unique_lock(_mutex);
    if (auto const existing = _servers.find(name); existing != _servers.end())
    {
        if (existing->second->connection || existing->second->state != ServerState::Configured)
            return makeError(ErrorCode::InvalidArgument,
                             std::format("Server '{}' is running; stop it before redefining it", name));
        existing->second->removed = true;
        existing->second = std::move(slot);
        log::info("Server '{}' redefined ({})",
                  name,
                  transportKindToString(existing->second->definition.transportKind));
        return {};
    }

    log::info("Server '{}' added ({})", name, transportKindToString(slot->definition.transportKind));
    _servers.emplace(name, std::move(slot));
    return {};
}

auto ServerManager::removeServer(std::string_view name) -> bool
{
    auto slot = findSlot(name);
    if (!slot)
    {
        log::warning("Cannot remove unknown server '{}'", name);
        return false;
    }

    auto lock = std::unique_lock(slot->lifecycleMutex, std::defer_lock);
    if (!lock.try_lock_for(_options.stopTimeout))
    {
        log::error("Timed out waiting to remove server '{}'", name);
        return false;
    }

    auto const key = std::string(name);
    stopLocked(key, *slot);

    {
        auto const guard = std::unique_lock(_mutex);
        slot->removed = true;
        if (auto const it = _servers.find(name); it != _servers.end() && it->second == slot)
            _servers.erase(it);
    }

    log::info("Server '{}' removed", name);
    return true;
}

auto ServerManager::start(std::string_view name) -> bool
{
    auto slot = findSlot(name);
    if (!slot)
    {
        log::error("Cannot start unknown server '{}'", name);
        return false;
    }

    auto lock = std::unique_lock(slot->lifecycleMutex, std::defer_lock);
    if (!lock.try_lock_for(_options.startLockTimeout))
    {
        log::error("Timed out waiting to start server '{}'", name);
        return false;
    }

    {
        auto const guard = std::shared_lock(_mutex);
        if (slot->removed)
        {
            log::error("Server '{}' was removed before it could start", name);
            return false;
        }
        if (slot->state == ServerState::Ready)
            return true;
    }

    auto const key = std::string(name);
    auto const& definition = slot->definition;
    log::info("Starting server '{}' ({})", key, transportKindToString(definition.transportKind));
    setState(*slot, ServerState::Starting);

    auto connection = std::shared_ptr<Connection> {};
    try
    {
        auto connected = _factory->connect(definition);
        if (!connected)
        {
            log::error("Failed to start server '{}': {}", key, connected.error());
            setState(*slot, ServerState::Configured);
            return false;
        }
        connection = std::move(*connected);

        {
            auto const guard = std::unique_lock(_mutex);
            slot->connection = connection;
        }

        auto const registered =
            _registry.registerMany(key, connection->kind(), connection, connection->discoveredTools());

        setState(*slot, ServerState::Ready);
        log::info("Server '{}' ready with {} tools", key, registered);
        return true;
    }
    catch (const std::exception& e)
    {
        log::error("Failed to start server '{}': {}", key, e.what());
    }

    // Only reached when an exception interrupted the start.
    if (connection)
    {
        auto stopped = connection->stop(_options.stopTimeout);
        if (!stopped)
            log::warning("Error while stopping server '{}': {}", key, stopped.error());
    }
    _registry.removeByServer(key);
    {
        auto const guard = std::unique_lock(_mutex);
        slot->connection.reset();
        slot->state = ServerState::Configured;
    }
    return false;
}

auto ServerManager::startAll() -> std::map<std::string, bool>
{
    auto results = std::map<std::string, bool> {};
    for (auto const& name: serverNames())
        results[name] = start(name);
    return results;
}

auto ServerManager::stop(std::string_view name) -> bool
{
    auto slot = findSlot(name);
    if (!slot)
    {
        log::warning("Cannot stop unknown server '{}'", name);
        return false;
    }

    auto lock = std::unique_lock(slot->lifecycleMutex, std::defer_lock);
    if (!lock.try_lock_for(_options.stopTimeout))
    {
        log::error("Timed out waiting to stop server '{}'", name);
        return false;
    }

    stopLocked(std::string(name), *slot);
    return true;
}

void ServerManager::stopAll()
{
    auto active = std::vector<std::string> {};
    {
        auto const guard = std::shared_lock(_mutex);
        for (auto const& [name, slot]: _servers)
        {
            if (slot->connection || slot->state != ServerState::Configured)
                active.push_back(name);
        }
    }

    for (auto const& name: active)
    {
        if (!stop(name))
            log::error("Skipping server '{}' during shutdown", name);
    }
}

auto ServerManager::state(std::string_view name) const -> std::optional<ServerState>
{
    auto const guard = std::shared_lock(_mutex);
    auto const it = _servers.find(name);
    if (it == _servers.end())
        return std::nullopt;
    return it->second->state;
}

auto ServerManager::isReady(std::string_view name) const -> bool
{
    return state(name) == ServerState::Ready;
}

auto ServerManager::definition(std::string_view name) const -> std::optional<ServerDefinition>
{
    auto const guard = std::shared_lock(_mutex);
    auto const it = _servers.find(name);
    if (it == _servers.end())
        return std::nullopt;
    return it->second->definition;
}

auto ServerManager::serverNames() const -> std::vector<std::string>
{
    auto names = std::vector<std::string> {};
    auto const guard = std::shared_lock(_mutex);
    for (auto const& [name, slot]: _servers)
        names.push_back(name);
    return names;
}

auto ServerManager::activeCount() const -> size_t
{
    auto count = size_t { 0 };
    auto const guard = std::shared_lock(_mutex);
    for (auto const& [name, slot]: _servers)
    {
        if (slot->connection)
            ++count;
    }
    return count;
}

auto ServerManager::snapshot() const -> std::vector<ServerSnapshot>
{
    auto servers = std::vector<ServerSnapshot> {};
    {
        auto const guard = std::shared_lock(_mutex);
        for (auto const& [name, slot]: _servers)
            servers.push_back(ServerSnapshot { .definition = slot->definition, .state = slot->state });
    }
    for (auto& server: servers)
        server.toolCount = _registry.countByServer(server.definition.name);
    return servers;
}

auto ServerManager::findSlot(std::string_view name) const -> std::shared_ptr<ServerSlot>
{
    auto const guard = std::shared_lock(_mutex);
    auto const it = _servers.find(name);
    return it == _servers.end() ? nullptr : it->second;
}

void ServerManager::setState(ServerSlot& slot, ServerState state)
{
    auto const guard = std::unique_lock(_mutex);
    slot.state = state;
}

void ServerManager::stopLocked(const std::string& name, ServerSlot& slot)
{
    auto connection = std::shared_ptr<Connection> {};
    {
        auto const guard = std::unique_lock(_mutex);
        connection = slot.connection;
        if (connection)
            slot.state = ServerState::Stopping;
    }

    if (connection)
    {
        log::info("Stopping server '{}'", name);
        try
        {
            auto stopped = connection->stop(_options.stopTimeout);
            if (!stopped)
                log::warning("Error while stopping server '{}': {}", name, stopped.error());
        }
        catch (const std::exception& e)
        {
            log::warning("Error while stopping server '{}': {}", name, e.what());
        }
    }

    // The registry and the active set are cleaned up whatever the backend did.
    auto const removed = _registry.removeByServer(name);
    {
        auto const guard = std::unique_lock(_mutex);
        slot.connection.reset();
        slot.state = ServerState::Configured;
    }

    if (connection)
        log::info("Stopped server '{}' ({} tools removed)", name, removed);
}

} // namespace mcphub
