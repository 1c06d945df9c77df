// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <hub/Connection.hpp>
#include <mcp/McpClient.hpp>

#include <memory>
#include <string>
#include <vector>

namespace mcphub
{

class StdioTransport;

/// @brief Connection to an MCP server running as a child process.
///
/// All calls go through one McpClient, which keeps a single request in flight
/// on the pipe; concurrent callers queue behind each other.
class StdioConnection: public Connection
{
  public:
    /// @brief Spawns the server, waits the startup grace, then handshakes and lists tools.
    ///
    /// A process that exits during the grace interval has its stderr logged.
    /// A process whose handshake fails is terminated before the error is returned.
    [[nodiscard]] static auto open(const ServerDefinition& definition, const ConnectionOptions& options)
        -> Result<std::shared_ptr<Connection>>;

    StdioConnection(ServerDefinition definition,
                    ConnectionOptions options,
                    std::unique_ptr<McpClient> client,
                    StdioTransport& transport,
                    std::vector<nlohmann::json> tools);
    ~StdioConnection() override;

    [[nodiscard]] auto kind() const -> TransportKind override { return TransportKind::Stdio; }
    [[nodiscard]] auto endpoint() const -> std::string override;
    [[nodiscard]] auto discoveredTools() const -> const std::vector<nlohmann::json>& override { return _tools; }

    [[nodiscard]] auto callTool(std::string_view name,
                                const nlohmann::json& arguments,
                                std::chrono::milliseconds timeout) -> Result<nlohmann::json> override;

    [[nodiscard]] auto stop(std::chrono::milliseconds timeout) -> VoidResult override;

  private:
    ServerDefinition _definition;
    ConnectionOptions _options;
    std::unique_ptr<McpClient> _client;
    StdioTransport& _transport; // owned by _client
    std::vector<nlohmann::json> _tools;
    int _pid = -1;
};

} // namespace mcphub
