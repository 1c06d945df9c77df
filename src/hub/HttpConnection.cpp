// SPDX-License-Identifier: Apache-2.0
#include "HttpConnection.hpp"

#include <core/Deadline.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <hub/ContainerRuntime.hpp>
#include <hub/SseConnection.hpp>
#include <mcp/HttpTransport.hpp>

#include <algorithm>
#include <format>
#include <thread>

namespace mcphub
{

namespace
{
    constexpr auto MaxProbeTimeout = std::chrono::milliseconds { 5000 };
    constexpr auto MinProbeTimeout = std::chrono::milliseconds { 100 };
    constexpr auto ToolPlaceholder = std::string_view { "{tool}" };
    constexpr auto SsePath = std::string_view { "/mcp" };

    auto isResponding(long status) -> bool
    {
        return status == 200 || status == 404;
    }

    /// Posts one document through an HttpTransport and returns the 200 response body.
    auto exchange(const std::shared_ptr<HttpClient>& client,
                  const std::string& url,
                  const nlohmann::json& message,
                  std::chrono::milliseconds timeout) -> Result<std::string>
    {
        auto transport = HttpTransport(client, url);
        auto sent = transport.send(message, timeout);
        if (!sent)
            return std::unexpected(sent.error());
        return transport.receive(timeout);
    }

    auto toolsFromListing(const nlohmann::json& body) -> std::optional<std::vector<nlohmann::json>>
    {
        if (!body.is_object() || !body.contains("result") || !body["result"].is_object())
            return std::nullopt;
        auto const& result = body["result"];
        if (!result.contains("tools") || !result["tools"].is_array())
            return std::nullopt;
        return result["tools"].get<std::vector<nlohmann::json>>();
    }
} // namespace

auto defaultCallStrategies() -> std::vector<HttpCallStrategy>
{
    return {
        { .style = HttpPayloadStyle::JsonRpc, .pathTemplate = "/mcp" },
        { .style = HttpPayloadStyle::JsonRpc, .pathTemplate = "/tools/call" },
        { .style = HttpPayloadStyle::JsonRpc, .pathTemplate = "/api/tools/{tool}" },
        { .style = HttpPayloadStyle::JsonRpc, .pathTemplate = "/tools/{tool}" },
        { .style = HttpPayloadStyle::PlainArguments, .pathTemplate = "/api/tools/{tool}" },
        { .style = HttpPayloadStyle::PlainArguments, .pathTemplate = "/tools/{tool}" },
    };
}

auto defaultDiscoveryPaths() -> std::vector<std::string>
{
    return { "/tools/list", "/mcp/tools", "/api/tools", "/tools" };
}

auto expandToolPath(std::string_view pathTemplate, std::string_view toolName) -> std::string
{
    auto path = std::string(pathTemplate);
    auto const pos = path.find(ToolPlaceholder);
    if (pos != std::string::npos)
        path.replace(pos, ToolPlaceholder.size(), toolName);
    return path;
}

auto waitForHttpReady(HttpClient& client,
                      const std::string& url,
                      std::chrono::milliseconds budget,
                      std::chrono::milliseconds interval) -> VoidResult
{
    auto const deadline = deadlineAfter(budget);
    auto const pollInterval = std::max(interval, std::chrono::milliseconds { 1 });
    auto const attempts = std::max<long long>(1, budget / pollInterval);

    for (auto attempt = 1LL; attempt <= attempts; ++attempt)
    {
        auto const probeTimeout = std::clamp(remaining(deadline), MinProbeTimeout, MaxProbeTimeout);
        auto response = client.get(url, {}, probeTimeout);
        if (response && isResponding(response->status))
        {
            log::debug("{} is responding (HTTP {}) after {} attempt(s)", url, response->status, attempt);
            return {};
        }

        if (response)
            log::debug("Readiness probe {} of {} for {}: HTTP {}", attempt, attempts, url, response->status);
        else
            log::debug("Readiness probe {} of {} for {}: {}", attempt, attempts, url, response.error().message);

        if (attempt == attempts || expired(deadline))
            break;
        std::this_thread::sleep_for(std::min(pollInterval, remaining(deadline)));
    }

    return makeError(ErrorCode::Timeout,
                     std::format("{} did not become ready within {} ms", url, budget.count()));
}

auto offersSseEndpoint(HttpClient& client, std::string_view baseUrl, std::chrono::milliseconds timeout) -> bool
{
    auto const url = joinUrl(baseUrl, SsePath);
    auto status = client.probe(url, { "Accept: application/json, text/event-stream" }, timeout);
    if (!status)
    {
        log::debug("SSE probe of {} failed: {}", url, status.error().message);
        return false;
    }
    return *status == 200;
}

auto discoverHttpTools(const std::shared_ptr<HttpClient>& client,
                       std::string_view baseUrl,
                       jsonrpc::IdGenerator& ids,
                       std::chrono::milliseconds timeout) -> std::vector<nlohmann::json>
{
    auto const deadline = deadlineAfter(timeout);

    for (auto const& path: defaultDiscoveryPaths())
    {
        auto const url = joinUrl(baseUrl, path);
        auto body = exchange(client, url, jsonrpc::makeRequest(ids.next(), "tools/list"), remaining(deadline));
        if (!body)
        {
            log::debug("Tool discovery at {} failed: {}", url, body.error().message);
            continue;
        }

        auto parsed = json::parse(*body);
        if (!parsed)
        {
            log::debug("Tool discovery at {} returned no JSON", url);
            continue;
        }

        if (auto tools = toolsFromListing(*parsed); tools)
            return std::move(*tools);
        log::debug("Tool discovery at {} returned no tool list", url);
    }

    auto const listingUrl = joinUrl(baseUrl, "/tools");
    auto listing = client->get(listingUrl, { "Accept: application/json" }, remaining(deadline));
    if (listing && listing->status == 200)
    {
        auto parsed = json::parse(listing->body);
        if (parsed && parsed->is_array())
            return parsed->get<std::vector<nlohmann::json>>();
    }
    log::debug("Tool listing at {} unavailable", listingUrl);

    return {};
}

auto callHttpTool(const std::shared_ptr<HttpClient>& client,
                  std::string_view baseUrl,
                  std::span<const HttpCallStrategy> strategies,
                  jsonrpc::IdGenerator& ids,
                  std::string_view toolName,
                  const nlohmann::json& arguments,
                  std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    auto const deadline = deadlineAfter(timeout);
    auto const args = arguments.is_null() ? nlohmann::json::object() : arguments;
    auto lastFailure = std::string("no endpoint candidates");

    for (auto const& strategy: strategies)
    {
        if (expired(deadline))
            return makeError(ErrorCode::Timeout,
                             std::format("HTTP call of '{}' timed out after {} ms", toolName, timeout.count()));

        auto const url = joinUrl(baseUrl, expandToolPath(strategy.pathTemplate, toolName));
        auto const message =
            strategy.style == HttpPayloadStyle::JsonRpc
                ? jsonrpc::makeRequest(ids.next(), "tools/call", { { "name", toolName }, { "arguments", args } })
                : args;

        auto body = exchange(client, url, message, remaining(deadline));
        if (!body)
        {
            if (body.error().code == ErrorCode::Timeout && expired(deadline))
                return std::unexpected(body.error());
            log::debug("HTTP candidate {} failed: {}", url, body.error().message);
            lastFailure = std::format("{}: {}", url, body.error().message);
            continue;
        }

        auto parsed = json::parse(*body);
        if (strategy.style == HttpPayloadStyle::PlainArguments)
        {
            // Raw responses are wrapped as the result as they are, JSON or not.
            return parsed ? std::move(*parsed) : nlohmann::json(std::move(*body));
        }

        if (!parsed)
        {
            log::debug("HTTP candidate {} answered 200 without JSON", url);
            lastFailure = std::format("{}: response is not JSON", url);
            continue;
        }

        if (parsed->is_object() && parsed->contains("error") && !parsed->contains("result"))
        {
            auto const rpc = jsonrpc::parseResponse(*parsed);
            auto detail = rpc && rpc->error
                              ? std::format("RPC error {}: {}", rpc->error->code, rpc->error->message)
                              : (*parsed)["error"].dump();
            return makeError(ErrorCode::ToolCallError, std::move(detail));
        }

        if (parsed->is_object() && parsed->contains("result"))
            return (*parsed)["result"];
        return std::move(*parsed);
    }

    return makeError(ErrorCode::TransportUnavailable,
                     std::format("No HTTP endpoint accepted the call of '{}' (last: {})", toolName, lastFailure));
}

auto HttpConnection::open(const ServerDefinition& definition,
                          const ConnectionOptions& options,
                          std::shared_ptr<HttpClient> client) -> Result<std::shared_ptr<Connection>>
{
    if (!client)
        return makeError(ErrorCode::InvalidArgument, "No HTTP client available");

    auto const& baseUrl = definition.endpoint->baseUrl;

    auto launcher = std::unique_ptr<Process> {};
    if (definition.process)
    {
        launcher = std::make_unique<Process>();
        auto spawned = launcher->spawn(ProcessConfig {
            .command = definition.process->command,
            .args = definition.process->args,
            .env = definition.process->env,
            .baseEnvironment = options.baseEnvironment,
            .pipeStdin = false,
            .pipeStdout = false,
            .label = definition.name,
        });
        if (!spawned)
            return std::unexpected(spawned.error());
        log::info("Launched '{}' for server '{}' (pid {})",
                  definition.process->command,
                  definition.name,
                  launcher->pid());
    }

    auto const healthUrl = joinUrl(baseUrl, healthPathOf(definition));
    auto ready = waitForHttpReady(*client,
                                  healthUrl,
                                  std::chrono::duration_cast<std::chrono::milliseconds>(definition.healthCheckTimeout),
                                  options.healthPollInterval);
    if (!ready)
    {
        if (launcher)
            launcher->terminate(options.startupGrace);
        if (!definition.containerImage.empty())
        {
            auto stopped =
                stopContainersByImage(options.containerRuntime, definition.containerImage, options.startupGrace);
            if (!stopped)
                log::warning("Failed to stop containers of '{}': {}", definition.name, stopped.error().message);
        }
        return std::unexpected(ready.error());
    }

    auto const deadline = deadlineAfter(options.handshakeTimeout);
    if (offersSseEndpoint(*client, baseUrl, std::min(MaxProbeTimeout, remaining(deadline))))
    {
        auto const rpcUrl = joinUrl(baseUrl, SsePath);
        auto tools = openSseSession(client, rpcUrl, remaining(deadline));
        if (tools)
        {
            log::info("Server '{}' speaks MCP over SSE at {}", definition.name, rpcUrl);
            if (tools->empty())
                log::warning("No tools discovered on SSE endpoint {} of '{}'", rpcUrl, definition.name);
            return std::make_shared<HttpConnection>(
                definition, options, std::move(client), std::move(launcher), std::move(*tools), rpcUrl);
        }
        log::debug("SSE handshake with {} failed, falling back to HTTP discovery: {}",
                   rpcUrl,
                   tools.error().message);
    }

    auto ids = jsonrpc::IdGenerator();
    auto tools = discoverHttpTools(client, baseUrl, ids, remaining(deadline));
    if (tools.empty())
        log::warning("No tools discovered on HTTP server '{}' at {}", definition.name, baseUrl);

    return std::make_shared<HttpConnection>(
        definition, options, std::move(client), std::move(launcher), std::move(tools));
}

HttpConnection::HttpConnection(ServerDefinition definition,
                               ConnectionOptions options,
                               std::shared_ptr<HttpClient> client,
                               std::unique_ptr<Process> launcher,
                               std::vector<nlohmann::json> tools,
                               std::optional<std::string> sseRpcUrl):
    _definition(std::move(definition)),
    _options(std::move(options)),
    _client(std::move(client)),
    _launcher(std::move(launcher)),
    _tools(std::move(tools)),
    _sseRpcUrl(std::move(sseRpcUrl)),
    _strategies(defaultCallStrategies())
{
}

HttpConnection::~HttpConnection() = default;

auto HttpConnection::endpoint() const -> std::string
{
    return _definition.endpoint->baseUrl;
}

auto HttpConnection::callTool(std::string_view name,
                              const nlohmann::json& arguments,
                              std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    if (_sseRpcUrl)
        return callSseTool(_client, *_sseRpcUrl, _ids, name, arguments, timeout);
    return callHttpTool(_client, _definition.endpoint->baseUrl, _strategies, _ids, name, arguments, timeout);
}

auto HttpConnection::stop(std::chrono::milliseconds timeout) -> VoidResult
{
    if (_launcher)
        _launcher->terminate(timeout);

    if (_definition.containerImage.empty())
        return {};
    return stopContainersByImage(_options.containerRuntime, _definition.containerImage, timeout);
}

} // namespace mcphub
