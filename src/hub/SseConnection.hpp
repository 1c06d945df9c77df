// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <hub/Connection.hpp>
#include <mcp/JsonRpc.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief Runs the MCP handshake over streamed POSTs to rpcUrl and lists the server's tools.
[[nodiscard]] auto openSseSession(const std::shared_ptr<HttpClient>& client,
                                  const std::string& rpcUrl,
                                  std::chrono::milliseconds timeout) -> Result<std::vector<nlohmann::json>>;

/// @brief Calls a tool with one streamed POST to rpcUrl.
/// @return The JSON-RPC result, or ErrorCode::ToolCallError for an error reply.
[[nodiscard]] auto callSseTool(const std::shared_ptr<HttpClient>& client,
                               const std::string& rpcUrl,
                               jsonrpc::IdGenerator& ids,
                               std::string_view toolName,
                               const nlohmann::json& arguments,
                               std::chrono::milliseconds timeout) -> Result<nlohmann::json>;

/// @brief Connection to an already running MCP server reached over SSE.
///
/// Each request is a POST whose reply arrives on the response's event stream,
/// so concurrent calls use independent requests.
class SseConnection: public Connection
{
  public:
    /// @brief Checks the health path (must answer 200), then handshakes and lists tools.
    [[nodiscard]] static auto open(const ServerDefinition& definition,
                                   const ConnectionOptions& options,
                                   std::shared_ptr<HttpClient> client) -> Result<std::shared_ptr<Connection>>;

    SseConnection(ServerDefinition definition, std::shared_ptr<HttpClient> client, std::vector<nlohmann::json> tools);
    ~SseConnection() override;

    [[nodiscard]] auto kind() const -> TransportKind override { return TransportKind::Sse; }
    [[nodiscard]] auto endpoint() const -> std::string override;
    [[nodiscard]] auto discoveredTools() const -> const std::vector<nlohmann::json>& override { return _tools; }

    [[nodiscard]] auto callTool(std::string_view name,
                                const nlohmann::json& arguments,
                                std::chrono::milliseconds timeout) -> Result<nlohmann::json> override;

    [[nodiscard]] auto stop(std::chrono::milliseconds timeout) -> VoidResult override;

  private:
    ServerDefinition _definition;
    std::shared_ptr<HttpClient> _client;
    std::vector<nlohmann::json> _tools;
    std::string _rpcUrl;
    jsonrpc::IdGenerator _ids;
};

} // namespace mcphub
