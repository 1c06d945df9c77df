// SPDX-License-Identifier: Apache-2.0
#include "ServerDefinition.hpp"

#include <format>

namespace mcphub
{

auto validateDefinition(const ServerDefinition& definition) -> VoidResult
{
    if (definition.name.empty())
        return makeError(ErrorCode::ConfigError, "Server definition has no name");

    switch (definition.transportKind)
    {
        case TransportKind::Stdio:
            if (!definition.process || definition.process->command.empty())
                return makeError(ErrorCode::ConfigError,
                                 std::format("stdio server '{}' has no command", definition.name));
            break;
        case TransportKind::Http:
        case TransportKind::Sse:
            if (!definition.endpoint || definition.endpoint->baseUrl.empty())
                return makeError(ErrorCode::ConfigError,
                                 std::format("{} server '{}' has no url",
                                             transportKindToString(definition.transportKind),
                                             definition.name));
            if (definition.process && definition.process->command.empty())
                return makeError(ErrorCode::ConfigError,
                                 std::format("Launcher of server '{}' has an empty command", definition.name));
            break;
    }

    if (definition.healthCheckTimeout < std::chrono::seconds { 0 })
        return makeError(ErrorCode::ConfigError,
                         std::format("Server '{}' has a negative health check timeout", definition.name));

    return {};
}

auto healthPathOf(const ServerDefinition& definition) -> std::string
{
    if (definition.endpoint && !definition.endpoint->healthPath.empty())
        return definition.endpoint->healthPath;
    return std::string(defaultHealthPath(definition.transportKind));
}

} // namespace mcphub
