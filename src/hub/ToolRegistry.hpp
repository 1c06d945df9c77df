// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

class Connection;

/// @brief Everything known about one callable tool.
struct ToolMetadata
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema = nlohmann::json::object();
    std::string ownerServer;
    TransportKind transportKind = TransportKind::Stdio;

    /// @brief Process id or base URL of the owning connection.
    std::string endpoint;

    /// @brief The owning server's connection; expired once the server stopped.
    std::weak_ptr<Connection> connection;

    [[nodiscard]] auto view() const -> ToolView;
};

/// @brief Catalog of callable tools keyed by tool name.
///
/// Tool names are global: registering a name that is already present replaces
/// the previous entry, whichever server owned it (last writer wins).
/// registerMany() and removeByServer() are atomic with respect to concurrent
/// lookups; readers never observe half of a server's tools.
class ToolRegistry
{
  public:
    /// @brief Registers the tools a server reported.
    ///
    /// Descriptors that are not objects or lack a string "name" are skipped.
    /// @return The number of tools registered.
    auto registerMany(std::string_view serverName,
                      TransportKind kind,
                      const std::shared_ptr<Connection>& connection,
                      std::span<const nlohmann::json> descriptors) -> size_t;

    /// @brief Removes every tool owned by the server.
    /// @return The number of tools removed.
    auto removeByServer(std::string_view serverName) -> size_t;

    /// @brief Looks up a tool by name.
    /// @return The tool's metadata, or ErrorCode::NotFound.
    [[nodiscard]] auto lookup(std::string_view toolName) const -> Result<ToolMetadata>;

    /// @brief Returns the tool views of every server that owns at least one tool.
    [[nodiscard]] auto allGroupedByServer() const -> std::map<std::string, std::vector<ToolView>>;

    /// @brief Returns tool views sorted by name, optionally restricted to one server.
    [[nodiscard]] auto list(std::optional<std::string_view> serverFilter = std::nullopt) const
        -> std::vector<ToolView>;

    [[nodiscard]] auto countByServer(std::string_view serverName) const -> size_t;

    [[nodiscard]] auto size() const -> size_t;

  private:
    mutable std::shared_mutex _mutex;
    std::map<std::string, ToolMetadata, std::less<>> _tools;
};

} // namespace mcphub
