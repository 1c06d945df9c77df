// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <hub/Availability.hpp>
#include <hub/Hub.hpp>
#include <mcp/Process.hpp>
#include <mcphub/Config.hpp>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include <print>

namespace
{

auto toolViewToJson(const mcphub::ToolView& tool) -> nlohmann::json
{
    return nlohmann::json {
        { "name", tool.name },
        { "description", tool.description },
        { "serverName", tool.serverName },
        { "transportKind", mcphub::transportKindToString(tool.transportKind) },
        { "inputSchema", tool.inputSchema },
    };
}

auto populate(mcphub::Hub& hub, const mcphub::HubConfig& config) -> bool
{
    auto ok = true;
    for (auto& definition: mcphub::availableDefinitions(config))
    {
        auto added = hub.addServer(std::move(definition));
        if (!added)
        {
            mcphub::log::error("{}", added.error());
            ok = false;
        }
    }
    return ok;
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcphub - one tool interface for many MCP servers" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto verbose = false;
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    auto startServers = false;
    auto* serversCommand = app.add_subcommand("servers", "List configured servers and their readiness");
    serversCommand->add_flag("--start", startServers, "Start all servers before listing them");

    auto serverFilter = std::string {};
    auto* toolsCommand = app.add_subcommand("tools", "Start all servers and list their tools");
    toolsCommand->add_option("--server", serverFilter, "Only list tools of this server");

    auto toolName = std::string {};
    auto argumentsText = std::string { "{}" };
    auto timeoutSeconds = 0.0;
    auto* callCommand = app.add_subcommand("call", "Start all servers and call a tool");
    callCommand->add_option("tool", toolName, "Tool name")->required();
    callCommand->add_option("arguments", argumentsText, "Tool arguments as a JSON object");
    callCommand->add_option("--timeout", timeoutSeconds, "Call timeout in seconds");

    auto* checkCommand = app.add_subcommand("check", "Report servers lacking environment values");

    CLI11_PARSE(app, argc, argv);

    auto const environment = mcphub::currentEnvironment();
    auto configResult = configPath.empty() ? mcphub::loadConfig(environment)
                                           : mcphub::loadConfigFromFile(configPath, environment);
    if (!configResult)
    {
        mcphub::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }
    auto const& config = *configResult;

    if (auto const level = mcphub::log::levelFromString(config.logLevel); level)
        mcphub::log::setLevel(*level);
    if (verbose)
        mcphub::log::setLevel(mcphub::log::Level::Debug);

    if (*checkCommand)
    {
        auto report = nlohmann::json::object();
        for (auto const& [name, availability]:
             mcphub::checkAvailability(mcphub::requiredKeysPerServer(config), environment))
        {
            report[name] = nlohmann::json {
                { "available", availability.available },
                { "missingKeys", availability.missingKeys },
            };
        }
        std::println("{}", report.dump(2));
        return 0;
    }

    auto hub = mcphub::Hub(mcphub::hubOptionsFrom(config));
    auto const populated = populate(hub, config);

    if (*serversCommand)
    {
        if (startServers)
            hub.startAll();

        auto servers = nlohmann::json::array();
        for (auto const& server: hub.listServers())
            servers.push_back(mcphub::serverStatusToJson(server));
        for (auto const& [name, missing]: config.unavailableServers)
            servers.push_back(nlohmann::json {
                { "name", name },
                { "ready", false },
                { "available", false },
                { "missingKeys", missing },
            });
        std::println("{}", servers.dump(2));
        return populated ? 0 : 1;
    }

    auto exitCode = 0;
    for (auto const& [name, started]: hub.startAll())
    {
        if (!started)
            mcphub::log::warning("Server '{}' failed to start", name);
    }

    if (*toolsCommand)
    {
        auto filter = serverFilter.empty() ? std::nullopt : std::optional<std::string_view>(serverFilter);
        auto tools = nlohmann::json::array();
        for (auto const& tool: hub.listTools(filter))
            tools.push_back(toolViewToJson(tool));
        std::println("{}", tools.dump(2));
    }
    else if (*callCommand)
    {
        auto arguments = nlohmann::json::parse(argumentsText, nullptr, false);
        if (arguments.is_discarded() || !arguments.is_object())
        {
            mcphub::log::error("Tool arguments must be a JSON object: {}", argumentsText);
            exitCode = 2;
        }
        else
        {
            auto timeout = std::optional<std::chrono::milliseconds> {};
            if (timeoutSeconds > 0.0)
                timeout = std::chrono::milliseconds { static_cast<long long>(timeoutSeconds * 1000.0) };

            auto const response = hub.callTool(toolName, arguments, timeout);
            auto output = nlohmann::json {
                { "success", response.success },
                { "executionTimeSeconds", response.executionTimeSeconds },
            };
            if (response.success)
                output["result"] = response.result;
            else
            {
                output["error"] = response.error;
                output["errorKind"] = response.errorKind;
                exitCode = 1;
            }
            std::println("{}", output.dump(2));
        }
    }

    hub.stopAll();
    return exitCode;
}
