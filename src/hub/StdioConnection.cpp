// SPDX-License-Identifier: Apache-2.0
#include "StdioConnection.hpp"

#include <core/Deadline.hpp>
#include <core/Log.hpp>
#include <hub/ContainerRuntime.hpp>
#include <mcp/StdioTransport.hpp>

#include <format>
#include <thread>

namespace mcphub
{

namespace
{
    constexpr auto StderrSettleTime = std::chrono::milliseconds { 200 };
} // namespace

auto StdioConnection::open(const ServerDefinition& definition, const ConnectionOptions& options)
    -> Result<std::shared_ptr<Connection>>
{
    auto const& launch = *definition.process;

    auto transport = std::make_unique<StdioTransport>();
    auto started = transport->start(StdioTransportConfig {
        .command = launch.command,
        .args = launch.args,
        .env = launch.env,
        .baseEnvironment = options.baseEnvironment,
        .label = definition.name,
    });
    if (!started)
        return std::unexpected(started.error());

    auto& process = transport->process();
    if (process.waitForExit(options.startupGrace))
    {
        auto const exitCode = process.exitStatus().value_or(-1);
        auto const stderrText = process.stderrOutput(StderrSettleTime);
        log::error("Server '{}' exited during startup with code {}", definition.name, exitCode);
        if (!stderrText.empty())
            log::error("Server '{}' stderr:\n{}", definition.name, stderrText);
        return makeError(ErrorCode::ProcessTerminated,
                         std::format("Server '{}' exited during startup with code {}", definition.name, exitCode));
    }

    auto& transportRef = *transport;
    auto client = std::make_unique<McpClient>(std::move(transport));

    auto const deadline = deadlineAfter(options.handshakeTimeout);
    auto handshake = client->initialize(options.handshakeTimeout).and_then([&](const McpServerCapabilities&) {
        return client->listTools(remaining(deadline));
    });
    if (!handshake)
    {
        log::error("Handshake with server '{}' failed: {}", definition.name, handshake.error().message);
        transportRef.process().terminate(options.startupGrace);
        return std::unexpected(handshake.error());
    }

    return std::make_shared<StdioConnection>(
        definition, options, std::move(client), transportRef, std::move(*handshake));
}

StdioConnection::StdioConnection(ServerDefinition definition,
                                 ConnectionOptions options,
                                 std::unique_ptr<McpClient> client,
                                 StdioTransport& transport,
                                 std::vector<nlohmann::json> tools):
    _definition(std::move(definition)),
    _options(std::move(options)),
    _client(std::move(client)),
    _transport(transport),
    _tools(std::move(tools)),
    _pid(transport.process().pid())
{
}

StdioConnection::~StdioConnection() = default;

auto StdioConnection::endpoint() const -> std::string
{
    return std::format("pid:{}", _pid);
}

auto StdioConnection::callTool(std::string_view name,
                               const nlohmann::json& arguments,
                               std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    if (!_transport.process().isRunning())
        return makeError(ErrorCode::ProcessTerminated,
                         std::format("Server '{}' has terminated with code {}",
                                     _definition.name,
                                     _transport.process().exitStatus().value_or(-1)));

    return _client->callTool(name, arguments, timeout);
}

auto StdioConnection::stop(std::chrono::milliseconds timeout) -> VoidResult
{
    auto result = VoidResult {};

    if (_transport.process().terminate(timeout))
        log::debug("Server '{}' exited after SIGTERM", _definition.name);

    if (!_definition.containerImage.empty())
    {
        auto stopped = stopContainersByImage(_options.containerRuntime, _definition.containerImage, timeout);
        if (!stopped)
            result = std::unexpected(stopped.error());
    }

    _client->close();
    return result;
}

} // namespace mcphub
