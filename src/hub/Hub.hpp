// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Deadline.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <hub/Availability.hpp>
#include <hub/Connection.hpp>
#include <hub/Dispatcher.hpp>
#include <hub/ServerManager.hpp>
#include <hub/ToolRegistry.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

class HttpClient;

/// @brief Settings of a Hub instance.
struct HubOptions
{
    ConnectionOptions connection;
    ServerManagerOptions lifecycle;
    std::chrono::milliseconds defaultCallTimeout { 30000 };
};

/// @brief One configured server as reported by listServers().
struct ServerStatus
{
    std::string name;
    bool ready = false;
    TransportKind transportKind = TransportKind::Stdio;
    size_t toolCount = 0;
};

/// @brief Renders a server status as {name, ready, transportKind, toolCount}.
[[nodiscard]] auto serverStatusToJson(const ServerStatus& status) -> nlohmann::json;

/// @brief Outcome of callTool() as reported to callers.
struct ToolCallResponse
{
    bool success = false;
    nlohmann::json result;
    std::string error;

    /// @brief Stable error kind (see errorCodeName()); empty on success.
    std::string errorKind;

    double executionTimeSeconds = 0.0;
};

/// @brief Summary returned by status().
struct HubStatus
{
    size_t serverCount = 0;
    size_t toolCount = 0;
    double uptimeSeconds = 0.0;
};

/// @brief The operations offered to front ends (CLI, HTTP gateway).
///
/// Owns the tool registry, the lifecycle manager and the dispatcher. Several
/// hubs can coexist in one process.
class Hub
{
  public:
    /// @brief Constructs a hub.
    /// @param options Timing knobs.
    /// @param httpClient Client for HTTP and SSE backends; a libcurl client when null.
    /// @param factory Connection factory; the default one when null.
    explicit Hub(HubOptions options = {},
                 std::shared_ptr<HttpClient> httpClient = nullptr,
                 std::shared_ptr<ConnectionFactory> factory = nullptr);
    ~Hub();

    Hub(const Hub&) = delete;
    Hub& operator=(const Hub&) = delete;

    [[nodiscard]] auto listServers() const -> std::vector<ServerStatus>;
    [[nodiscard]] auto listTools(std::optional<std::string_view> serverFilter = std::nullopt) const
        -> std::vector<ToolView>;
    [[nodiscard]] auto getToolInfo(std::string_view name) const -> Result<ToolMetadata>;

    /// @brief Calls a tool.
    /// @param timeout Bound of the call; HubOptions::defaultCallTimeout when unset.
    [[nodiscard]] auto callTool(std::string_view name,
                                const nlohmann::json& arguments,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt) const
        -> ToolCallResponse;

    auto startServer(std::string_view name) -> bool;
    void stopServer(std::string_view name);
    auto startAll() -> std::map<std::string, bool>;
    void stopAll();

    [[nodiscard]] auto addServer(ServerDefinition definition) -> VoidResult;
    auto removeServer(std::string_view name) -> bool;

    [[nodiscard]] auto listConfiguredServers() const -> std::vector<std::string>;
    [[nodiscard]] auto getServerDefinition(std::string_view name) const -> std::optional<ServerDefinition>;
    [[nodiscard]] auto status() const -> HubStatus;

  private:
    HubOptions _options;
    ToolRegistry _registry;
    std::unique_ptr<ServerManager> _servers;
    Dispatcher _dispatcher;
    Clock::time_point _startedAt;
};

} // namespace mcphub
