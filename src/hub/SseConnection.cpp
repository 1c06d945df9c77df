// SPDX-License-Identifier: Apache-2.0
#include "SseConnection.hpp"

#include <core/Deadline.hpp>
#include <core/Log.hpp>
#include <mcp/HttpClient.hpp>
#include <mcp/McpClient.hpp>
#include <mcp/SseTransport.hpp>

#include <format>

namespace mcphub
{

namespace
{
    auto rpcUrlOf(const ServerDefinition& definition) -> std::string
    {
        auto const& endpoint = *definition.endpoint;
        return joinUrl(endpoint.baseUrl, endpoint.rpcPath.empty() ? "/mcp" : endpoint.rpcPath);
    }
} // namespace

auto openSseSession(const std::shared_ptr<HttpClient>& client,
                    const std::string& rpcUrl,
                    std::chrono::milliseconds timeout) -> Result<std::vector<nlohmann::json>>
{
    auto mcp = McpClient(std::make_unique<SseTransport>(client, rpcUrl));

    auto const deadline = deadlineAfter(timeout);
    return mcp.initialize(timeout).and_then(
        [&](const McpServerCapabilities&) { return mcp.listTools(remaining(deadline)); });
}

auto callSseTool(const std::shared_ptr<HttpClient>& client,
                 const std::string& rpcUrl,
                 jsonrpc::IdGenerator& ids,
                 std::string_view toolName,
                 const nlohmann::json& arguments,
                 std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    // The session was set up beforehand; every call is an independent streamed POST.
    auto const deadline = deadlineAfter(timeout);
    auto transport = SseTransport(client, rpcUrl);

    auto params = nlohmann::json {
        { "name", toolName },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };
    auto sent = transport.send(jsonrpc::makeRequest(ids.next(), "tools/call", std::move(params)), timeout);
    if (!sent)
        return std::unexpected(sent.error());

    auto raw = transport.receive(remaining(deadline));
    if (!raw)
        return std::unexpected(raw.error());

    auto response = jsonrpc::decode(*raw);
    if (!response)
        return std::unexpected(response.error());

    if (response->error)
        return makeError(ErrorCode::ToolCallError,
                         std::format("RPC error {}: {}", response->error->code, response->error->message));

    return response->result.value_or(nlohmann::json::object());
}

auto SseConnection::open(const ServerDefinition& definition,
                         const ConnectionOptions& options,
                         std::shared_ptr<HttpClient> client) -> Result<std::shared_ptr<Connection>>
{
    if (!client)
        return makeError(ErrorCode::InvalidArgument, "No HTTP client available");

    auto const healthUrl = joinUrl(definition.endpoint->baseUrl, healthPathOf(definition));
    auto const healthTimeout = std::chrono::duration_cast<std::chrono::milliseconds>(definition.healthCheckTimeout);
    auto health = client->get(healthUrl, {}, healthTimeout);
    if (!health)
        return std::unexpected(health.error());
    if (health->status != 200)
        return makeError(ErrorCode::TransportError,
                         std::format("Health check {} answered HTTP {}", healthUrl, health->status));

    auto tools = openSseSession(client, rpcUrlOf(definition), options.handshakeTimeout);
    if (!tools)
        return std::unexpected(tools.error());

    return std::make_shared<SseConnection>(definition, std::move(client), std::move(*tools));
}

SseConnection::SseConnection(ServerDefinition definition,
                             std::shared_ptr<HttpClient> client,
                             std::vector<nlohmann::json> tools):
    _definition(std::move(definition)),
    _client(std::move(client)),
    _tools(std::move(tools)),
    _rpcUrl(rpcUrlOf(_definition))
{
}

SseConnection::~SseConnection() = default;

auto SseConnection::endpoint() const -> std::string
{
    return _definition.endpoint->baseUrl;
}

auto SseConnection::callTool(std::string_view name,
                             const nlohmann::json& arguments,
                             std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    return callSseTool(_client, _rpcUrl, _ids, name, arguments, timeout);
}

auto SseConnection::stop(std::chrono::milliseconds /*timeout*/) -> VoidResult
{
    log::debug("SSE server '{}' keeps running; dropping the connection", _definition.name);
    return {};
}

} // namespace mcphub
