// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/Deadline.hpp>
#include <core/Log.hpp>

#include <format>

namespace mcphub
{

namespace
{
    constexpr auto CloseGracePeriod = std::chrono::milliseconds { 2000 };
} // namespace

StdioTransport::StdioTransport() = default;

StdioTransport::~StdioTransport()
{
    close();
}

auto StdioTransport::start(const StdioTransportConfig& config) -> VoidResult
{
    if (_connected)
        return makeError(ErrorCode::TransportError, "Transport already connected");

    auto spawned = _process.spawn(ProcessConfig {
        .command = config.command,
        .args = config.args,
        .env = config.env,
        .baseEnvironment = config.baseEnvironment,
        .pipeStdin = true,
        .pipeStdout = true,
        .label = config.label,
    });
    if (!spawned)
        return spawned;

    _connected = true;
    log::info("MCP server process started: {} (pid {})", config.command, _process.pid());
    return {};
}

auto StdioTransport::send(const nlohmann::json& message, std::chrono::milliseconds timeout) -> VoidResult
{
    if (!_connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    if (!_process.isRunning())
        return makeError(ErrorCode::ProcessTerminated,
                         std::format("Process has terminated with code {}", _process.exitStatus().value_or(-1)));

    auto const data = message.dump() + "\n";
    log::trace("stdio -> {}", data.substr(0, data.size() - 1));
    return _process.write(data, timeout);
}

auto StdioTransport::receive(std::chrono::milliseconds timeout) -> Result<std::string>
{
    if (!_connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const deadline = deadlineAfter(timeout);
    while (true)
    {
        auto line = _process.readLine(remaining(deadline));
        if (!line)
        {
            if (line.error().code == ErrorCode::ProcessTerminated)
                _connected = false;
            return line;
        }

        if (line->empty())
            continue;

        log::trace("stdio <- {}", *line);
        return line;
    }
}

void StdioTransport::close()
{
    if (!_connected)
        return;

    _connected = false;
    _process.closeStdin();
    _process.terminate(CloseGracePeriod);

    log::debug("MCP stdio transport closed");
}

auto StdioTransport::isConnected() const -> bool
{
    return _connected;
}

auto StdioTransport::process() -> Process&
{
    return _process;
}

} // namespace mcphub
