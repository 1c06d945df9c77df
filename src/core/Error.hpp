// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace mcphub
{

/// @brief Error codes for categorizing failures across the hub.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    NotFound,
    ProcessTerminated,
    Timeout,
    ProtocolError,
    TransportError,
    TransportUnavailable,
    ToolCallError,
};

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

/// @brief Returns the stable, user-visible kind string of an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::IoError: return "io_error";
        case ErrorCode::ConfigError: return "configuration_error";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::ProcessTerminated: return "process_terminated";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::ProtocolError: return "protocol_error";
        case ErrorCode::TransportError: return "transport_error";
        case ErrorCode::TransportUnavailable: return "transport_unavailable";
        case ErrorCode::ToolCallError: return "tool_error";
    }
    return "unknown";
}

} // namespace mcphub

template <>
struct std::formatter<mcphub::Error>: std::formatter<std::string>
{
    auto format(const mcphub::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", mcphub::errorCodeName(error.code), error.message), ctx);
    }
};
