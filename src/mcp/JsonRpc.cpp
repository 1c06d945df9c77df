// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace mcphub::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto isNotification(const nlohmann::json& message) -> bool
{
    return message.is_object() && message.contains("method") && !message.contains("id");
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error"))
    {
        auto const& err = message["error"];
        if (err.is_object())
        {
            response.error = RpcError {
                .code = json::getIntOr(err, "code", 0),
                .message = json::getStringOr(err, "message", "Unknown error"),
                .data = err.value("data", nlohmann::json {}),
            };
        }
        else
        {
            response.error = RpcError { .code = 0, .message = err.dump(), .data = {} };
        }
    }
    else if (message.contains("method") && message["method"].is_string())
    {
        response.method = message["method"].get<std::string>();
    }
    else
    {
        // It's neither a valid response nor a notification
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");
    }

    return response;
}

auto decode(std::string_view text) -> Result<Response>
{
    auto parsed = json::parse(text);
    if (!parsed)
        return std::unexpected(parsed.error());
    return parseResponse(*parsed);
}

} // namespace mcphub::jsonrpc
