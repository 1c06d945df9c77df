// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <hub/Connection.hpp>
#include <mcp/HttpClient.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Process.hpp>

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief How a tool call is encoded for one candidate endpoint.
enum class HttpPayloadStyle
{
    /// JSON-RPC "tools/call" envelope; the reply's result (or the whole body) is the tool result.
    JsonRpc,

    /// The bare arguments object; the whole response body is the tool result.
    PlainArguments,
};

/// @brief One candidate endpoint shape for HTTP tool calls.
struct HttpCallStrategy
{
    HttpPayloadStyle style = HttpPayloadStyle::JsonRpc;

    /// @brief Path below the base URL; "{tool}" is replaced by the tool name.
    std::string pathTemplate;
};

/// @brief The ordered endpoint candidates tried for every HTTP tool call.
[[nodiscard]] auto defaultCallStrategies() -> std::vector<HttpCallStrategy>;

/// @brief Paths tried, in order, with a JSON-RPC "tools/list" POST during discovery.
[[nodiscard]] auto defaultDiscoveryPaths() -> std::vector<std::string>;

/// @brief Substitutes the tool name into a path template.
[[nodiscard]] auto expandToolPath(std::string_view pathTemplate, std::string_view toolName) -> std::string;

/// @brief Polls a URL until it answers 200 or 404.
/// @param budget Total time allowed; attempts = budget / interval, at least one.
/// @return Success, or ErrorCode::Timeout once the budget is spent.
[[nodiscard]] auto waitForHttpReady(HttpClient& client,
                                    const std::string& url,
                                    std::chrono::milliseconds budget,
                                    std::chrono::milliseconds interval) -> VoidResult;

/// @brief Returns true if GET {baseUrl}/mcp, asking for an event stream, answers 200.
///
/// Such servers speak MCP over SSE even when configured as plain HTTP.
[[nodiscard]] auto offersSseEndpoint(HttpClient& client, std::string_view baseUrl, std::chrono::milliseconds timeout)
    -> bool;

/// @brief Discovers the tools of an HTTP server.
///
/// Tries the JSON-RPC listing endpoints first, then a plain GET of /tools
/// returning a descriptor array. Finding nothing yields an empty list.
[[nodiscard]] auto discoverHttpTools(const std::shared_ptr<HttpClient>& client,
                                     std::string_view baseUrl,
                                     jsonrpc::IdGenerator& ids,
                                     std::chrono::milliseconds timeout) -> std::vector<nlohmann::json>;

/// @brief Calls a tool by trying each strategy in order until one answers HTTP 200 with a usable body.
/// @return The tool result; ErrorCode::ToolCallError if the server answered with a JSON-RPC error,
///         ErrorCode::Timeout if time ran out, ErrorCode::TransportUnavailable if no candidate worked.
[[nodiscard]] auto callHttpTool(const std::shared_ptr<HttpClient>& client,
                                std::string_view baseUrl,
                                std::span<const HttpCallStrategy> strategies,
                                jsonrpc::IdGenerator& ids,
                                std::string_view toolName,
                                const nlohmann::json& arguments,
                                std::chrono::milliseconds timeout) -> Result<nlohmann::json>;

/// @brief Connection to a tool server speaking JSON-RPC (or plain JSON) over HTTP POST.
///
/// A server found to offer an SSE endpoint at /mcp is handshaken and called
/// over SSE instead, and its tools are reported as SSE tools.
class HttpConnection: public Connection
{
  public:
    /// @brief Spawns the optional launcher, waits for readiness, then discovers tools.
    ///
    /// An empty discovery is logged as a warning; the connection is still returned.
    [[nodiscard]] static auto open(const ServerDefinition& definition,
                                   const ConnectionOptions& options,
                                   std::shared_ptr<HttpClient> client) -> Result<std::shared_ptr<Connection>>;

    HttpConnection(ServerDefinition definition,
                   ConnectionOptions options,
                   std::shared_ptr<HttpClient> client,
                   std::unique_ptr<Process> launcher,
                   std::vector<nlohmann::json> tools,
                   std::optional<std::string> sseRpcUrl = std::nullopt);
    ~HttpConnection() override;

    [[nodiscard]] auto kind() const -> TransportKind override
    {
        return _sseRpcUrl ? TransportKind::Sse : TransportKind::Http;
    }
    [[nodiscard]] auto endpoint() const -> std::string override;
    [[nodiscard]] auto discoveredTools() const -> const std::vector<nlohmann::json>& override { return _tools; }

    [[nodiscard]] auto callTool(std::string_view name,
                                const nlohmann::json& arguments,
                                std::chrono::milliseconds timeout) -> Result<nlohmann::json> override;

    [[nodiscard]] auto stop(std::chrono::milliseconds timeout) -> VoidResult override;

  private:
    ServerDefinition _definition;
    ConnectionOptions _options;
    std::shared_ptr<HttpClient> _client;
    std::unique_ptr<Process> _launcher;
    std::vector<nlohmann::json> _tools;
    std::optional<std::string> _sseRpcUrl;
    std::vector<HttpCallStrategy> _strategies;
    jsonrpc::IdGenerator _ids;
};

} // namespace mcphub
