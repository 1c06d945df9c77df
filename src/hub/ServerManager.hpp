// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <hub/Connection.hpp>
#include <hub/ServerDefinition.hpp>
#include <hub/ToolRegistry.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief Lifecycle state of a configured server.
enum class ServerState
{
    Configured,
    Starting,
    Ready,
    Stopping,
};

[[nodiscard]] constexpr auto serverStateToString(ServerState state) -> std::string_view
{
    switch (state)
    {
        case ServerState::Configured: return "configured";
        case ServerState::Starting: return "starting";
        case ServerState::Ready: return "ready";
        case ServerState::Stopping: return "stopping";
    }
    return "unknown";
}

/// @brief Bounds of lifecycle operations.
struct ServerManagerOptions
{
    /// @brief Grace period of a stop, and how long a stop waits for a running start.
    std::chrono::milliseconds stopTimeout { 10000 };

    /// @brief How long a start waits for another start/stop of the same server.
    std::chrono::milliseconds startLockTimeout { 60000 };
};

/// @brief A configured server together with its current state.
struct ServerSnapshot
{
    ServerDefinition definition;
    ServerState state = ServerState::Configured;
    size_t toolCount = 0;
};

/// @brief Owns the configured servers, starts and stops them, and keeps the registry in sync.
///
/// Start and stop of one server are serialized by a per-server lock; different
/// servers proceed in parallel. Lifecycle operations never throw: failures are
/// logged and reported as false.
class ServerManager
{
  public:
    ServerManager(ToolRegistry& registry,
                  std::shared_ptr<ConnectionFactory> factory,
                  ServerManagerOptions options = {});
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    /// @brief Adds or replaces a server definition.
    /// @return ErrorCode::ConfigError for an invalid definition,
    ///         ErrorCode::InvalidArgument if a server of that name is running.
    [[nodiscard]] auto addServer(ServerDefinition definition) -> VoidResult;

    /// @brief Stops the server if needed and forgets its definition.
    /// @return False if no such server is configured (or its stop could not begin in time).
    auto removeServer(std::string_view name) -> bool;

    /// @brief Starts the server; succeeds immediately if it is already ready.
    auto start(std::string_view name) -> bool;

    /// @brief Starts every configured server.
    /// @return Whether each server is ready afterwards.
    auto startAll() -> std::map<std::string, bool>;

    /// @brief Stops the server and purges its tools, even if stopping the backend fails.
    /// @return False if the server is unknown or a start of it did not finish within the stop timeout.
    auto stop(std::string_view name) -> bool;

    /// @brief Stops every active server, one after another.
    void stopAll();

    [[nodiscard]] auto state(std::string_view name) const -> std::optional<ServerState>;
    [[nodiscard]] auto isReady(std::string_view name) const -> bool;
    [[nodiscard]] auto definition(std::string_view name) const -> std::optional<ServerDefinition>;
    [[nodiscard]] auto serverNames() const -> std::vector<std::string>;
    [[nodiscard]] auto activeCount() const -> size_t;
    [[nodiscard]] auto snapshot() const -> std::vector<ServerSnapshot>;

  private:
    struct ServerSlot
    {
        explicit ServerSlot(ServerDefinition def): definition(std::move(def)) {}

        const ServerDefinition definition;
        std::timed_mutex lifecycleMutex;

        // Guarded by ServerManager::_mutex.
        ServerState state = ServerState::Configured;
        std::shared_ptr<Connection> connection;
        bool removed = false;
    };

    [[nodiscard]] auto findSlot(std::string_view name) const -> std::shared_ptr<ServerSlot>;
    void setState(ServerSlot& slot, ServerState state);
    void stopLocked(const std::string& name, ServerSlot& slot);

    ToolRegistry& _registry;
    std::shared_ptr<ConnectionFactory> _factory;
    ServerManagerOptions _options;

    mutable std::shared_mutex _mutex;
    std::map<std::string, std::shared_ptr<ServerSlot>, std::less<>> _servers;
};

} // namespace mcphub
