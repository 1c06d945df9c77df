// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief How to spawn a backend process (the server itself, or a launcher for it).
struct ProcessLaunch
{
    std::string command;
    std::vector<std::string> args;
    Environment env;
};

/// @brief Where a network backend is reached.
struct NetworkEndpoint
{
    std::string baseUrl;

    /// @brief Readiness path; the transport's default when empty.
    std::string healthPath;

    /// @brief JSON-RPC path of SSE servers.
    std::string rpcPath = "/mcp";
};

/// @brief Static configuration for one backend tool server.
///
/// STDIO servers carry a process launch. HTTP servers carry an endpoint and may
/// carry a launch that brings the service up (e.g. a container runtime call).
/// SSE servers carry an endpoint only.
struct ServerDefinition
{
    std::string name;
    TransportKind transportKind = TransportKind::Stdio;
    std::optional<ProcessLaunch> process;
    std::optional<NetworkEndpoint> endpoint;

    /// @brief Container image backing the server; containers of this image are stopped on stop.
    std::string containerImage;

    std::chrono::seconds healthCheckTimeout { 30 };
};

/// @brief Checks that a definition carries what its transport needs.
/// @return Success, or ErrorCode::ConfigError naming the missing piece.
[[nodiscard]] auto validateDefinition(const ServerDefinition& definition) -> VoidResult;

/// @brief Returns the health path used when none is configured.
[[nodiscard]] constexpr auto defaultHealthPath(TransportKind kind) -> std::string_view
{
    return kind == TransportKind::Sse ? "/health" : "/";
}

/// @brief Returns the definition's health path, or the transport default.
[[nodiscard]] auto healthPathOf(const ServerDefinition& definition) -> std::string;

} // namespace mcphub
