// SPDX-License-Identifier: Apache-2.0
#include "Dispatcher.hpp"

#include <core/Deadline.hpp>
#include <core/Log.hpp>
#include <hub/Connection.hpp>

#include <format>

namespace mcphub
{

Dispatcher::Dispatcher(const ToolRegistry& registry): _registry(registry)
{
}

auto Dispatcher::call(std::string_view toolName,
                      const nlohmann::json& arguments,
                      std::chrono::milliseconds timeout) const -> CallOutcome
{
    auto const startTime = Clock::now();
    auto outcome = CallOutcome {};
    auto const finish = [&](CallOutcome& result) -> CallOutcome {
        result.elapsed = Clock::now() - startTime;
        return std::move(result);
    };

    auto tool = _registry.lookup(toolName);
    if (!tool)
    {
        outcome.error = tool.error();
        return finish(outcome);
    }

    auto connection = tool->connection.lock();
    if (!connection)
    {
        outcome.error = Error { ErrorCode::NotFound,
                                std::format("Server '{}' of tool '{}' is no longer running",
                                            tool->ownerServer,
                                            toolName) };
        return finish(outcome);
    }

    log::debug("Calling '{}' on server '{}' via {}",
               toolName,
               tool->ownerServer,
               transportKindToString(tool->transportKind));

    try
    {
        auto result = connection->callTool(toolName, arguments, timeout);
        if (result)
        {
            outcome.ok = true;
            outcome.result = std::move(*result);
        }
        else if (result.error().code == ErrorCode::Timeout)
        {
            outcome.error = Error { ErrorCode::Timeout,
                                    std::format("Tool '{}' timed out after {} ms: {}",
                                                toolName,
                                                timeout.count(),
                                                result.error().message) };
        }
        else
        {
            outcome.error = result.error();
        }
    }
    catch (const std::exception& e)
    {
        outcome.error = Error { ErrorCode::Unknown, std::format("Tool '{}' failed: {}", toolName, e.what()) };
    }

    if (outcome.error)
        log::warning("Tool '{}' failed: {}", toolName, *outcome.error);
    return finish(outcome);
}

} // namespace mcphub
