// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <hub/ServerDefinition.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

class HttpClient;

/// @brief Runtime state of a started backend server.
///
/// One implementation exists per transport kind. A connection is created fully
/// started (process spawned or endpoint reachable, handshake and discovery done)
/// and is owned by the ServerManager; the registry only keeps weak references.
/// callTool() may be invoked from several threads at once.
class Connection
{
  public:
    virtual ~Connection() = default;

    [[nodiscard]] virtual auto kind() const -> TransportKind = 0;

    /// @brief Human readable dispatch handle (process id or base URL).
    [[nodiscard]] virtual auto endpoint() const -> std::string = 0;

    /// @brief Tool descriptors discovered while connecting.
    [[nodiscard]] virtual auto discoveredTools() const -> const std::vector<nlohmann::json>& = 0;

    /// @brief Invokes a tool on this backend.
    /// @param timeout Upper bound for the whole call.
    /// @return The tool's result payload or an error.
    [[nodiscard]] virtual auto callTool(std::string_view name,
                                        const nlohmann::json& arguments,
                                        std::chrono::milliseconds timeout) -> Result<nlohmann::json> = 0;

    /// @brief Shuts the backend down (process, launcher, containers).
    /// @param timeout Grace period before escalating to a forceful kill.
    /// @return Success, or the first error met while stopping.
    [[nodiscard]] virtual auto stop(std::chrono::milliseconds timeout) -> VoidResult = 0;
};

/// @brief Timing and environment knobs used while connecting to backends.
struct ConnectionOptions
{
    std::chrono::milliseconds startupGrace { 500 };
    std::chrono::milliseconds handshakeTimeout { 10000 };
    std::chrono::milliseconds healthPollInterval { 1000 };

    /// @brief Environment server-specific variables are merged onto; the hub's own when unset.
    std::optional<Environment> baseEnvironment;

    std::string containerRuntime = "docker";
};

/// @brief Creates started connections from server definitions.
class ConnectionFactory
{
  public:
    virtual ~ConnectionFactory() = default;

    /// @brief Starts the backend described by the definition.
    /// @return The ready connection, or the reason it could not be started.
    [[nodiscard]] virtual auto connect(const ServerDefinition& definition)
        -> Result<std::shared_ptr<Connection>> = 0;
};

/// @brief Factory that picks the connection implementation by transport kind.
class DefaultConnectionFactory: public ConnectionFactory
{
  public:
    DefaultConnectionFactory(ConnectionOptions options, std::shared_ptr<HttpClient> httpClient);

    [[nodiscard]] auto connect(const ServerDefinition& definition)
        -> Result<std::shared_ptr<Connection>> override;

  private:
    ConnectionOptions _options;
    std::shared_ptr<HttpClient> _httpClient;
};

} // namespace mcphub
