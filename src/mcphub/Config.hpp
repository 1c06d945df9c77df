// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <hub/Hub.hpp>
#include <hub/ServerDefinition.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief Timeouts section.
struct TimeoutConfig
{
    int callSeconds = 30;
    int handshakeSeconds = 10;
    int stopSeconds = 10;
    int startupGraceMs = 500;
    int healthPollIntervalMs = 1000;
};

/// @brief A server as written in the config file.
struct ServerEntry
{
    /// @brief The definition, with ${VAR} placeholders expanded when the server is available.
    ServerDefinition definition;

    /// @brief The env map exactly as configured.
    Environment envTemplate;
};

/// @brief Top-level hub configuration.
struct HubConfig
{
    std::string logLevel = "info";
    std::string containerRuntime = "docker";
    TimeoutConfig timeouts;
    std::map<std::string, ServerEntry> servers;

    /// @brief Servers that were not loaded, with the environment keys they lack.
    std::map<std::string, std::vector<std::string>> unavailableServers;
};

/// @brief Builds a configuration from a parsed JSON document.
/// @param root The configuration document.
/// @param environment Values for ${VAR} placeholders.
/// @return The configuration, or ErrorCode::ConfigError for structurally invalid entries.
[[nodiscard]] auto parseConfig(const nlohmann::json& root, const Environment& environment) -> Result<HubConfig>;

/// @brief Loads the configuration from a file.
[[nodiscard]] auto loadConfigFromFile(std::string_view path, const Environment& environment) -> Result<HubConfig>;

/// @brief Loads the configuration from the default path; defaults if there is no file.
[[nodiscard]] auto loadConfig(const Environment& environment) -> Result<HubConfig>;

/// @brief Saves the configuration to a file, keeping env placeholders unexpanded.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const HubConfig& config) -> VoidResult;

/// @brief Returns the definitions of every available server.
[[nodiscard]] auto availableDefinitions(const HubConfig& config) -> std::vector<ServerDefinition>;

/// @brief Returns the ${VAR} keys each configured server needs.
[[nodiscard]] auto requiredKeysPerServer(const HubConfig& config) -> std::map<std::string, std::vector<std::string>>;

/// @brief Derives hub options from the configuration.
[[nodiscard]] auto hubOptionsFrom(const HubConfig& config) -> HubOptions;

/// @brief Returns the default config directory ($XDG_CONFIG_HOME/mcphub or ~/.config/mcphub).
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace mcphub
