// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>

namespace mcphub
{

/// @brief Abstract channel that carries JSON-RPC documents to one backend.
///
/// A transport owns no protocol logic: it sends one document and hands back
/// the next document the backend produced. Implementations exist for child
/// process pipes, plain HTTP POST and Server-Sent-Events streams.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Sends a JSON message to the server.
    /// @param message The JSON message to send.
    /// @param timeout Upper bound for the send (network transports block on the response here).
    /// @return Success or an error.
    [[nodiscard]] virtual auto send(const nlohmann::json& message, std::chrono::milliseconds timeout)
        -> VoidResult = 0;

    /// @brief Receives the next raw document from the server.
    /// @param timeout Upper bound to wait; ErrorCode::Timeout on expiry.
    /// @return The received document text or an error
    ///         (ErrorCode::ProcessTerminated / TransportError once the channel is closed).
    [[nodiscard]] virtual auto receive(std::chrono::milliseconds timeout) -> Result<std::string> = 0;

    /// @brief Closes the transport connection.
    virtual void close() = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace mcphub
