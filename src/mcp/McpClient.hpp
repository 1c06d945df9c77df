// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief MCP server capabilities reported during initialization.
struct McpServerCapabilities
{
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
    std::string serverName;
    std::string serverVersion;
    std::string protocolVersion;
};

/// @brief Client for the Model Context Protocol (MCP).
///
/// Handles the MCP lifecycle over any Transport: initialize, list tools, call tools.
/// Requests are serialized; at most one exchange is in flight on the transport,
/// and a caller waiting for its turn gives up when its timeout elapses.
/// Replies carrying another request's id (left over from an exchange that timed
/// out) and server-initiated messages are discarded.
class McpClient
{
  public:
    /// @brief Constructs an McpClient with the given transport.
    /// @param transport The transport to use for communication.
    explicit McpClient(std::unique_ptr<Transport> transport);
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Performs the MCP initialize handshake followed by notifications/initialized.
    /// @param timeout Upper bound for the whole handshake.
    /// @return The server's capabilities or an error.
    [[nodiscard]] auto initialize(std::chrono::milliseconds timeout) -> Result<McpServerCapabilities>;

    /// @brief Lists available tools from the server.
    /// @return The raw tool descriptors as reported by the server.
    [[nodiscard]] auto listTools(std::chrono::milliseconds timeout) -> Result<std::vector<nlohmann::json>>;

    /// @brief Calls a tool on the server.
    /// @param name The tool name.
    /// @param arguments The tool arguments.
    /// @param timeout Upper bound for the call, including waiting for a preceding request.
    /// @return The "result" member of the reply or an error
    ///         (ErrorCode::ToolCallError when the server answered with a JSON-RPC error).
    [[nodiscard]] auto callTool(std::string_view name,
                                const nlohmann::json& arguments,
                                std::chrono::milliseconds timeout) -> Result<nlohmann::json>;

    /// @brief Closes the underlying transport once no request is in flight.
    void close();

    /// @brief Returns the server capabilities (valid after initialize).
    [[nodiscard]] auto capabilities() const -> const McpServerCapabilities&;

    /// @brief Returns true if the client has been initialized.
    [[nodiscard]] auto isInitialized() const -> bool;

  private:
    std::unique_ptr<Transport> _transport;
    McpServerCapabilities _capabilities;
    jsonrpc::IdGenerator _ids;
    std::atomic<bool> _initialized { false };
    std::timed_mutex _exchangeMutex;

    [[nodiscard]] auto sendRequest(std::string_view method,
                                   nlohmann::json params,
                                   std::chrono::milliseconds timeout) -> Result<nlohmann::json>;

    [[nodiscard]] auto sendNotification(std::string_view method, std::chrono::milliseconds timeout)
        -> VoidResult;
};

} // namespace mcphub
