// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/HttpClient.hpp>
#include <mcp/Transport.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcphub
{

/// @brief Returns the payload of an SSE "data:" line, or nullopt for any other line.
[[nodiscard]] auto sseDataPayload(std::string_view line) -> std::optional<std::string_view>;

/// @brief Transport that POSTs JSON-RPC requests and reads the reply from an SSE stream.
///
/// The response stream is read line by line; the first "data:" frame holding a
/// JSON-RPC result or error is kept for receive() and the stream is closed.
/// Other lines and frames are skipped.
class SseTransport: public Transport
{
  public:
    SseTransport(std::shared_ptr<HttpClient> client, std::string url);

    [[nodiscard]] auto send(const nlohmann::json& message, std::chrono::milliseconds timeout)
        -> VoidResult override;
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> Result<std::string> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

  private:
    std::shared_ptr<HttpClient> _client;
    std::string _url;
    std::optional<std::string> _pending;
    bool _closed = false;
};

} // namespace mcphub
