// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mcphub::jsonrpc
{

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Represents a parsed incoming JSON-RPC 2.0 message.
///
/// Exactly one of result, error or method is set for a well-formed message.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;
    std::string method;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }

    /// @brief Returns true if this is a reply (carries a result or an error).
    [[nodiscard]] auto isReply() const -> bool { return result.has_value() || error.has_value(); }

    /// @brief Returns true if this is a server-initiated request or notification.
    [[nodiscard]] auto isServerMessage() const -> bool { return !isReply(); }
};

/// @brief Hands out distinct request ids; safe to share between threads.
class IdGenerator
{
  public:
    [[nodiscard]] auto next() -> int64_t { return _next.fetch_add(1); }

  private:
    std::atomic<int64_t> _next { 1 };
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Returns true if the message is a notification (has a method and no id).
[[nodiscard]] auto isNotification(const nlohmann::json& message) -> bool;

/// @brief Parses a JSON-RPC 2.0 response.
/// @param message The JSON message to parse.
/// @return The parsed response or an Error.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Decodes one serialized JSON-RPC document.
///
/// Text that is not JSON, or JSON that is not a JSON-RPC 2.0 message, yields
/// ErrorCode::ProtocolError so callers can treat it as "no usable response".
/// @param text The serialized document.
/// @return The parsed response or an Error.
[[nodiscard]] auto decode(std::string_view text) -> Result<Response>;

} // namespace mcphub::jsonrpc
