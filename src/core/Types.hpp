// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace mcphub
{

/// @brief The wire protocol used to reach a backend tool server.
enum class TransportKind
{
    Stdio,
    Http,
    Sse,
};

/// @brief Converts a TransportKind enum to its string representation.
/// @param kind The transport kind to convert.
/// @return The string representation.
[[nodiscard]] constexpr auto transportKindToString(TransportKind kind) -> std::string_view
{
    switch (kind)
    {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Http: return "http";
        case TransportKind::Sse: return "sse";
    }
    return "unknown";
}

/// @brief Parses a string to a TransportKind enum value.
/// @param str The string to parse.
/// @return The corresponding TransportKind, or std::nullopt if unknown.
[[nodiscard]] constexpr auto transportKindFromString(std::string_view str) -> std::optional<TransportKind>
{
    if (str == "stdio")
        return TransportKind::Stdio;
    if (str == "http")
        return TransportKind::Http;
    if (str == "sse")
        return TransportKind::Sse;
    return std::nullopt;
}

/// @brief Key/value environment variables.
using Environment = std::map<std::string, std::string>;

/// @brief A read-only view of a registered tool, as reported to callers.
struct ToolView
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
    std::string serverName;
    TransportKind transportKind = TransportKind::Stdio;
};

} // namespace mcphub
