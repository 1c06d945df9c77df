// SPDX-License-Identifier: Apache-2.0
#include "SseTransport.hpp"

#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <format>
#include <utility>

namespace mcphub
{

namespace
{
    constexpr auto DataPrefix = std::string_view { "data:" };

    auto const StreamHeaders = HttpHeaders {
        "Content-Type: application/json",
        "Accept: application/json, text/event-stream",
    };
} // namespace

auto sseDataPayload(std::string_view line) -> std::optional<std::string_view>
{
    if (!line.starts_with(DataPrefix))
        return std::nullopt;
    line.remove_prefix(DataPrefix.size());
    if (line.starts_with(' '))
        line.remove_prefix(1);
    return line;
}

SseTransport::SseTransport(std::shared_ptr<HttpClient> client, std::string url):
    _client(std::move(client)), _url(std::move(url))
{
}

auto SseTransport::send(const nlohmann::json& message, std::chrono::milliseconds timeout) -> VoidResult
{
    if (_closed)
        return makeError(ErrorCode::TransportError, "Transport closed");

    _pending.reset();

    if (jsonrpc::isNotification(message))
    {
        auto response = _client->post(_url, message.dump(), StreamHeaders, timeout);
        if (!response)
            return std::unexpected(response.error());
        if (response->status < 200 || response->status >= 300)
            return makeError(ErrorCode::TransportError,
                             std::format("HTTP {} from {} for notification", response->status, _url));
        return {};
    }

    auto status = _client->postStream(_url, message.dump(), StreamHeaders, timeout, [&](std::string_view line) {
        auto const payload = sseDataPayload(line);
        if (!payload)
            return true;

        auto const decoded = jsonrpc::decode(*payload);
        if (!decoded || !decoded->isReply())
        {
            log::trace("SSE: skipping frame without reply: {}", *payload);
            return true;
        }

        _pending = std::string(*payload);
        return false;
    });
    if (!status)
        return std::unexpected(status.error());

    if (*status != 200)
        return makeError(ErrorCode::TransportError, std::format("HTTP {} from SSE endpoint {}", *status, _url));

    if (!_pending)
        return makeError(ErrorCode::ProtocolError, std::format("SSE stream from {} ended without a reply", _url));

    return {};
}

auto SseTransport::receive(std::chrono::milliseconds /*timeout*/) -> Result<std::string>
{
    if (!_pending)
        return makeError(ErrorCode::ProtocolError, std::format("No response pending from {}", _url));

    auto payload = std::move(*_pending);
    _pending.reset();
    return payload;
}

void SseTransport::close()
{
    _closed = true;
    _pending.reset();
}

auto SseTransport::isConnected() const -> bool
{
    return !_closed;
}

} // namespace mcphub
