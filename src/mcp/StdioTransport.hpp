// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <mcp/Process.hpp>
#include <mcp/Transport.hpp>

#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace mcphub
{

/// @brief Configuration for spawning an MCP server process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    Environment env;

    /// @brief Environment the overrides in env are merged onto; the hub's own when unset.
    std::optional<Environment> baseEnvironment;

    /// @brief Name used in log lines of the child's stderr.
    std::string label;
};

/// @brief Transport that communicates with an MCP server via stdio pipes.
///
/// Spawns a child process and exchanges one JSON document per line over its
/// stdin/stdout. The line protocol has no multiplexing, so callers must keep at
/// most one request in flight (McpClient serializes its requests).
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Starts the MCP server process.
    /// @param config The process configuration.
    /// @return Success or an error.
    [[nodiscard]] auto start(const StdioTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message, std::chrono::milliseconds timeout)
        -> VoidResult override;
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> Result<std::string> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Returns the child process (valid after start).
    [[nodiscard]] auto process() -> Process&;

  private:
    Process _process;
    std::atomic<bool> _connected { false };
};

} // namespace mcphub
