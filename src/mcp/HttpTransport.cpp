// SPDX-License-Identifier: Apache-2.0
#include "HttpTransport.hpp"

#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <format>
#include <utility>

namespace mcphub
{

namespace
{
    auto const JsonHeaders = HttpHeaders { "Content-Type: application/json", "Accept: application/json" };
} // namespace

HttpTransport::HttpTransport(std::shared_ptr<HttpClient> client, std::string url):
    _client(std::move(client)), _url(std::move(url))
{
}

auto HttpTransport::send(const nlohmann::json& message, std::chrono::milliseconds timeout) -> VoidResult
{
    if (_closed)
        return makeError(ErrorCode::TransportError, "Transport closed");

    _pending.reset();
    auto response = _client->post(_url, message.dump(), JsonHeaders, timeout);
    if (!response)
        return std::unexpected(response.error());

    if (jsonrpc::isNotification(message))
    {
        if (response->status < 200 || response->status >= 300)
            return makeError(ErrorCode::TransportError,
                             std::format("HTTP {} from {} for notification", response->status, _url));
        return {};
    }

    if (response->status != 200)
        return makeError(ErrorCode::TransportError, std::format("HTTP {} from {}", response->status, _url));

    _pending = std::move(response->body);
    return {};
}

auto HttpTransport::receive(std::chrono::milliseconds /*timeout*/) -> Result<std::string>
{
    if (!_pending)
        return makeError(ErrorCode::ProtocolError, std::format("No response pending from {}", _url));

    auto body = std::move(*_pending);
    _pending.reset();
    return body;
}

void HttpTransport::close()
{
    _closed = true;
    _pending.reset();
}

auto HttpTransport::isConnected() const -> bool
{
    return !_closed;
}

} // namespace mcphub
