// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <hub/ToolRegistry.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string_view>

namespace mcphub
{

/// @brief Normalized outcome of a tool call.
struct CallOutcome
{
    bool ok = false;
    nlohmann::json result;

    /// @brief Set when ok is false; the code tells "unknown tool", "backend failed" and "timed out" apart.
    std::optional<Error> error;

    std::chrono::duration<double> elapsed {};
};

/// @brief Routes tool calls to the connection that owns the tool.
class Dispatcher
{
  public:
    explicit Dispatcher(const ToolRegistry& registry);

    /// @brief Calls a tool.
    ///
    /// An unknown name fails with ErrorCode::NotFound without touching any backend.
    /// The timeout bounds the whole call and is handed down to the transport.
    [[nodiscard]] auto call(std::string_view toolName,
                            const nlohmann::json& arguments,
                            std::chrono::milliseconds timeout) const -> CallOutcome;

  private:
    const ToolRegistry& _registry;
};

} // namespace mcphub
