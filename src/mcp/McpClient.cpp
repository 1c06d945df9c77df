// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/Deadline.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>

namespace mcphub
{

namespace
{
    constexpr auto ProtocolVersion = std::string_view { "2024-11-05" };
    constexpr auto ClientName = std::string_view { "mcphub" };
    constexpr auto ClientVersion = std::string_view { "0.1.0" };
    constexpr auto CloseLockTimeout = std::chrono::milliseconds { 1000 };
} // namespace

McpClient::McpClient(std::unique_ptr<Transport> transport): _transport(std::move(transport))
{
}

McpClient::~McpClient() = default;

auto McpClient::initialize(std::chrono::milliseconds timeout) -> Result<McpServerCapabilities>
{
    auto const deadline = deadlineAfter(timeout);

    auto params = nlohmann::json {
        { "protocolVersion", ProtocolVersion },
        { "capabilities",
          nlohmann::json {
              { "roots", nlohmann::json { { "listChanged", true } } },
              { "sampling", nlohmann::json::object() },
          } },
        { "clientInfo",
          nlohmann::json {
              { "name", ClientName },
              { "version", ClientVersion },
          } },
    };

    return sendRequest("initialize", std::move(params), timeout)
        .and_then([this, deadline](const nlohmann::json& result) -> Result<McpServerCapabilities> {
            if (!result.is_object())
                return makeError(ErrorCode::ProtocolError, "initialize reply carries no result");

            auto const serverInfo = result.value("serverInfo", nlohmann::json::object());
            _capabilities.serverName = json::getStringOr(serverInfo, "name", "unknown");
            _capabilities.serverVersion = json::getStringOr(serverInfo, "version", "unknown");
            _capabilities.protocolVersion = json::getStringOr(result, "protocolVersion", "");

            if (result.contains("capabilities") && result["capabilities"].is_object())
            {
                auto const& caps = result["capabilities"];
                _capabilities.hasTools = caps.contains("tools");
                _capabilities.hasResources = caps.contains("resources");
                _capabilities.hasPrompts = caps.contains("prompts");
            }

            auto notified = sendNotification("notifications/initialized", remaining(deadline));
            if (!notified)
                return std::unexpected(notified.error());

            _initialized = true;
            log::info(
                "MCP server initialized: {} v{}", _capabilities.serverName, _capabilities.serverVersion);

            return _capabilities;
        });
}

auto McpClient::listTools(std::chrono::milliseconds timeout) -> Result<std::vector<nlohmann::json>>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    return sendRequest("tools/list", nullptr, timeout)
        .and_then([](const nlohmann::json& result) -> Result<std::vector<nlohmann::json>> {
            auto tools = std::vector<nlohmann::json> {};

            if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array())
                return tools;

            for (auto const& tool: result["tools"])
                tools.push_back(tool);

            return tools;
        });
}

auto McpClient::callTool(std::string_view name, const nlohmann::json& arguments, std::chrono::milliseconds timeout)
    -> Result<nlohmann::json>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    return sendRequest("tools/call", std::move(params), timeout);
}

void McpClient::close()
{
    auto lock = std::unique_lock(_exchangeMutex, std::defer_lock);
    if (!lock.try_lock_for(CloseLockTimeout))
    {
        // The transport is released together with this client once the request returns.
        log::debug("MCP client busy, leaving transport open");
        return;
    }
    _initialized = false;
    _transport->close();
}

auto McpClient::capabilities() const -> const McpServerCapabilities&
{
    return _capabilities;
}

auto McpClient::isInitialized() const -> bool
{
    return _initialized;
}

auto McpClient::sendRequest(std::string_view method, nlohmann::json params, std::chrono::milliseconds timeout)
    -> Result<nlohmann::json>
{
    auto const deadline = deadlineAfter(timeout);

    auto lock = std::unique_lock(_exchangeMutex, std::defer_lock);
    if (!lock.try_lock_until(deadline))
        return makeError(ErrorCode::Timeout,
                         std::format("'{}' timed out waiting for a preceding request to finish", method));

    auto const id = _ids.next();
    auto sent = _transport->send(jsonrpc::makeRequest(id, method, std::move(params)), remaining(deadline));
    if (!sent)
        return std::unexpected(sent.error());

    auto const expectedId = nlohmann::json(id);
    while (true)
    {
        auto raw = _transport->receive(remaining(deadline));
        if (!raw)
            return std::unexpected(raw.error());

        auto response = jsonrpc::decode(*raw);
        if (!response)
        {
            log::warning("Ignoring malformed message from MCP server: {}", response.error().message);
            continue;
        }

        if (response->isServerMessage())
        {
            log::debug("Ignoring server message '{}'", response->method);
            continue;
        }

        // Errors the server could not attribute to a request carry a null id.
        auto const unattributedError = response->id.is_null() && response->error.has_value();
        if (response->id != expectedId && !unattributedError)
        {
            log::debug("Discarding reply for stale request id {}", response->id.dump());
            continue;
        }

        if (response->error)
            return makeError(ErrorCode::ToolCallError,
                             std::format("RPC error {}: {}", response->error->code, response->error->message));

        return response->result.value_or(nlohmann::json::object());
    }
}

auto McpClient::sendNotification(std::string_view method, std::chrono::milliseconds timeout) -> VoidResult
{
    auto lock = std::unique_lock(_exchangeMutex, std::defer_lock);
    if (!lock.try_lock_for(timeout))
        return makeError(ErrorCode::Timeout, std::format("'{}' timed out waiting for the transport", method));

    return _transport->send(jsonrpc::makeNotification(method), timeout);
}

} // namespace mcphub
