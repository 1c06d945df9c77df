// SPDX-License-Identifier: Apache-2.0
#include "Hub.hpp"

#include <core/Log.hpp>
#include <mcp/CurlHttpClient.hpp>

namespace mcphub
{

auto serverStatusToJson(const ServerStatus& status) -> nlohmann::json
{
    return nlohmann::json {
        { "name", status.name },
        { "ready", status.ready },
        { "transportKind", transportKindToString(status.transportKind) },
        { "toolCount", status.toolCount },
    };
}

Hub::Hub(HubOptions options, std::shared_ptr<HttpClient> httpClient, std::shared_ptr<ConnectionFactory> factory):
    _options(std::move(options)), _dispatcher(_registry), _startedAt(Clock::now())
{
    if (!factory)
    {
        if (!httpClient)
            httpClient = std::make_shared<CurlHttpClient>();
        factory = std::make_shared<DefaultConnectionFactory>(_options.connection, std::move(httpClient));
    }
    _servers = std::make_unique<ServerManager>(_registry, std::move(factory), _options.lifecycle);
}

Hub::~Hub() = default;

auto Hub::listServers() const -> std::vector<ServerStatus>
{
    auto servers = std::vector<ServerStatus> {};
    for (auto const& server: _servers->snapshot())
    {
        servers.push_back(ServerStatus {
            .name = server.definition.name,
            .ready = server.state == ServerState::Ready,
            .transportKind = server.definition.transportKind,
            .toolCount = server.toolCount,
        });
    }
    return servers;
}

auto Hub::listTools(std::optional<std::string_view> serverFilter) const -> std::vector<ToolView>
{
    return _registry.list(serverFilter);
}

auto Hub::getToolInfo(std::string_view name) const -> Result<ToolMetadata>
{
    return _registry.lookup(name);
}

auto Hub::callTool(std::string_view name,
                   const nlohmann::json& arguments,
                   std::optional<std::chrono::milliseconds> timeout) const -> ToolCallResponse
{
    auto outcome = _dispatcher.call(name, arguments, timeout.value_or(_options.defaultCallTimeout));

    auto response = ToolCallResponse {
        .success = outcome.ok,
        .result = std::move(outcome.result),
        .error = {},
        .errorKind = {},
        .executionTimeSeconds = outcome.elapsed.count(),
    };
    if (outcome.error)
    {
        response.error = outcome.error->message;
        response.errorKind = std::string(errorCodeName(outcome.error->code));
    }
    return response;
}

auto Hub::startServer(std::string_view name) -> bool
{
    return _servers->start(name);
}

void Hub::stopServer(std::string_view name)
{
    _servers->stop(name);
}

auto Hub::startAll() -> std::map<std::string, bool>
{
    return _servers->startAll();
}

void Hub::stopAll()
{
    _servers->stopAll();
}

auto Hub::addServer(ServerDefinition definition) -> VoidResult
{
    return _servers->addServer(std::move(definition));
}

auto Hub::removeServer(std::string_view name) -> bool
{
    return _servers->removeServer(name);
}

auto Hub::listConfiguredServers() const -> std::vector<std::string>
{
    return _servers->serverNames();
}

auto Hub::getServerDefinition(std::string_view name) const -> std::optional<ServerDefinition>
{
    return _servers->definition(name);
}

auto Hub::status() const -> HubStatus
{
    return HubStatus {
        .serverCount = _servers->activeCount(),
        .toolCount = _registry.size(),
        .uptimeSeconds = std::chrono::duration<double>(Clock::now() - _startedAt).count(),
    };
}

} // namespace mcphub
