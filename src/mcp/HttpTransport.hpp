// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/HttpClient.hpp>
#include <mcp/Transport.hpp>

#include <memory>
#include <optional>
#include <string>

namespace mcphub
{

/// @brief Transport that POSTs each document to one URL and yields the response body.
///
/// send() performs the whole exchange; receive() hands back the buffered body.
/// Any status other than 200 fails the send, so callers can move on to another
/// candidate endpoint. Notifications accept any 2xx status and buffer nothing.
class HttpTransport: public Transport
{
  public:
    HttpTransport(std::shared_ptr<HttpClient> client, std::string url);

    [[nodiscard]] auto send(const nlohmann::json& message, std::chrono::milliseconds timeout)
        -> VoidResult override;
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> Result<std::string> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

    [[nodiscard]] auto url() const -> const std::string& { return _url; }

  private:
    std::shared_ptr<HttpClient> _client;
    std::string _url;
    std::optional<std::string> _pending;
    bool _closed = false;
};

} // namespace mcphub
