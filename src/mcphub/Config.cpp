// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <hub/Availability.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace mcphub
{

namespace
{
    auto parseServer(const std::string& name, const nlohmann::json& serverJson, const Environment& environment)
        -> Result<ServerEntry>
    {
        if (!serverJson.is_object())
            return makeError(ErrorCode::ConfigError, std::format("Server '{}' must be an object", name));

        auto const transportName = json::getStringOr(serverJson, "transport", "stdio");
        auto const transport = transportKindFromString(transportName);
        if (!transport)
            return makeError(ErrorCode::ConfigError,
                             std::format("Server '{}' has unknown transport '{}'", name, transportName));

        auto entry = ServerEntry {
            .definition =
                ServerDefinition {
                    .name = name,
                    .transportKind = *transport,
                    .process = std::nullopt,
                    .endpoint = std::nullopt,
                    .containerImage = json::getStringOr(serverJson, "image", ""),
                    .healthCheckTimeout =
                        std::chrono::seconds { json::getIntOr(serverJson, "healthCheckTimeout", 30) },
                },
            .envTemplate = json::getStringMap(serverJson, "env"),
        };

        auto const command = json::getStringOr(serverJson, "command", "");
        if (!command.empty())
        {
            entry.definition.process = ProcessLaunch {
                .command = command,
                .args = json::getStringList(serverJson, "args"),
                .env = entry.envTemplate,
            };
        }

        auto const url = json::getStringOr(serverJson, "url", "");
        if (!url.empty())
        {
            entry.definition.endpoint = NetworkEndpoint {
                .baseUrl = url,
                .healthPath = json::getStringOr(serverJson, "healthPath", ""),
                .rpcPath = json::getStringOr(serverJson, "rpcPath", "/mcp"),
            };
        }

        auto valid = validateDefinition(entry.definition);
        if (!valid)
            return std::unexpected(valid.error());

        // Servers with unresolved keys keep the template and are reported unavailable by the caller.
        if (entry.definition.process)
        {
            auto expanded = expandTemplate(entry.envTemplate, environment);
            if (expanded)
                entry.definition.process->env = std::move(*expanded);
        }

        return entry;
    }

    auto serverToJson(const ServerEntry& entry) -> nlohmann::json
    {
        auto const& definition = entry.definition;
        auto server = nlohmann::json::object();
        server["transport"] = transportKindToString(definition.transportKind);

        if (definition.process)
        {
            server["command"] = definition.process->command;
            if (!definition.process->args.empty())
                server["args"] = definition.process->args;
        }
        if (!entry.envTemplate.empty())
            server["env"] = entry.envTemplate;

        if (definition.endpoint)
        {
            server["url"] = definition.endpoint->baseUrl;
            if (!definition.endpoint->healthPath.empty())
                server["healthPath"] = definition.endpoint->healthPath;
            if (definition.transportKind == TransportKind::Sse)
                server["rpcPath"] = definition.endpoint->rpcPath;
        }

        if (!definition.containerImage.empty())
            server["image"] = definition.containerImage;
        server["healthCheckTimeout"] = definition.healthCheckTimeout.count();
        return server;
    }
} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/mcphub";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcphub";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(const nlohmann::json& root, const Environment& environment) -> Result<HubConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Configuration must be a JSON object");

    auto config = HubConfig {};
    config.logLevel = json::getStringOr(root, "logLevel", "info");
    config.containerRuntime = json::getStringOr(root, "containerRuntime", "docker");

    if (root.contains("timeouts"))
    {
        auto const& timeouts = root["timeouts"];
        config.timeouts.callSeconds = json::getIntOr(timeouts, "callSeconds", 30);
        config.timeouts.handshakeSeconds = json::getIntOr(timeouts, "handshakeSeconds", 10);
        config.timeouts.stopSeconds = json::getIntOr(timeouts, "stopSeconds", 10);
        config.timeouts.startupGraceMs = json::getIntOr(timeouts, "startupGraceMs", 500);
        config.timeouts.healthPollIntervalMs = json::getIntOr(timeouts, "healthPollIntervalMs", 1000);
    }

    if (root.contains("servers") && root["servers"].is_object())
    {
        for (auto const& [name, serverJson]: root["servers"].items())
        {
            auto entry = parseServer(name, serverJson, environment);
            if (!entry)
                return std::unexpected(entry.error());

            auto const required = requiredKeysFromTemplate(entry->envTemplate);
            auto availability = checkAvailability({ { name, required } }, environment).at(name);
            if (!availability.available)
            {
                log::warning("Server '{}' is unavailable; missing environment values: {}",
                             name,
                             nlohmann::json(availability.missingKeys).dump());
                config.unavailableServers[name] = std::move(availability.missingKeys);
            }

            config.servers[name] = std::move(*entry);
        }
    }

    return config;
}

auto loadConfigFromFile(std::string_view path, const Environment& environment) -> Result<HubConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return makeError(ErrorCode::ConfigError,
                         std::format("Invalid config file {}: {}", path, parseResult.error().message));

    return parseConfig(*parseResult, environment);
}

auto loadConfig(const Environment& environment) -> Result<HubConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return HubConfig {};
    }

    return loadConfigFromFile(path, environment);
}

auto saveConfigToFile(std::string_view path, const HubConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();
    root["logLevel"] = config.logLevel;
    root["containerRuntime"] = config.containerRuntime;
    root["timeouts"] = nlohmann::json {
        { "callSeconds", config.timeouts.callSeconds },
        { "handshakeSeconds", config.timeouts.handshakeSeconds },
        { "stopSeconds", config.timeouts.stopSeconds },
        { "startupGraceMs", config.timeouts.startupGraceMs },
        { "healthPollIntervalMs", config.timeouts.healthPollIntervalMs },
    };

    auto servers = nlohmann::json::object();
    for (auto const& [name, entry]: config.servers)
        servers[name] = serverToJson(entry);
    root["servers"] = std::move(servers);

    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto availableDefinitions(const HubConfig& config) -> std::vector<ServerDefinition>
{
    auto definitions = std::vector<ServerDefinition> {};
    for (auto const& [name, entry]: config.servers)
    {
        if (!config.unavailableServers.contains(name))
            definitions.push_back(entry.definition);
    }
    return definitions;
}

auto requiredKeysPerServer(const HubConfig& config) -> std::map<std::string, std::vector<std::string>>
{
    auto keys = std::map<std::string, std::vector<std::string>> {};
    for (auto const& [name, entry]: config.servers)
        keys[name] = requiredKeysFromTemplate(entry.envTemplate);
    return keys;
}

auto hubOptionsFrom(const HubConfig& config) -> HubOptions
{
    using std::chrono::milliseconds;
    using std::chrono::seconds;

    return HubOptions {
        .connection =
            ConnectionOptions {
                .startupGrace = milliseconds { config.timeouts.startupGraceMs },
                .handshakeTimeout = seconds { config.timeouts.handshakeSeconds },
                .healthPollInterval = milliseconds { config.timeouts.healthPollIntervalMs },
                .baseEnvironment = std::nullopt,
                .containerRuntime = config.containerRuntime,
            },
        .lifecycle =
            ServerManagerOptions {
                .stopTimeout = seconds { config.timeouts.stopSeconds },
            },
        .defaultCallTimeout = seconds { config.timeouts.callSeconds },
    };
}

} // namespace mcphub
