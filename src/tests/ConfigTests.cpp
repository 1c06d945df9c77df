// SPDX-License-Identifier: Apache-2.0
#include <mcphub/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace mcphub;

namespace
{
    auto writeTempConfig(std::string_view name, std::string_view content) -> std::filesystem::path
    {
        auto const path = std::filesystem::temp_directory_path() / name;
        auto file = std::ofstream(path);
        file << content;
        return path;
    }
} // namespace

TEST_CASE("defaultConfigDir returns a non-empty path", "[config]")
{
    auto const dir = defaultConfigDir();
    REQUIRE(!dir.empty());
}

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("config.json"));
}

TEST_CASE("HubConfig has expected defaults", "[config]")
{
    auto const config = HubConfig {};
    CHECK(config.logLevel == "info");
    CHECK(config.containerRuntime == "docker");
    CHECK(config.timeouts.callSeconds == 30);
    CHECK(config.timeouts.handshakeSeconds == 10);
    CHECK(config.timeouts.stopSeconds == 10);
    CHECK(config.servers.empty());
}

TEST_CASE("loadConfigFromFile parses every transport", "[config]")
{
    auto const tempPath = writeTempConfig("mcphub_test_config.json", R"({
        "logLevel": "debug",
        "containerRuntime": "podman",
        "timeouts": { "callSeconds": 5, "stopSeconds": 3 },
        "servers": {
            "files": {
                "command": "npx",
                "args": ["-y", "@modelcontextprotocol/server-filesystem", "${PWD}"],
                "env": { "ROOT": "${HOME_DIR}/data" }
            },
            "web": {
                "transport": "http",
                "url": "http://127.0.0.1:8931",
                "command": "docker",
                "args": ["run", "--rm", "-p", "8931:8931", "acme/web-tools"],
                "image": "acme/web-tools",
                "healthCheckTimeout": 45
            },
            "remote": {
                "transport": "sse",
                "url": "https://tools.example.org",
                "healthPath": "/status"
            }
        }
    })");

    auto result = loadConfigFromFile(tempPath.string(), { { "HOME_DIR", "/home/alex" } });
    REQUIRE(result.has_value());
    auto const& config = *result;

    CHECK(config.logLevel == "debug");
    CHECK(config.containerRuntime == "podman");
    CHECK(config.timeouts.callSeconds == 5);
    CHECK(config.timeouts.stopSeconds == 3);
    CHECK(config.timeouts.handshakeSeconds == 10);
    CHECK(config.unavailableServers.empty());

    SECTION("stdio server")
    {
        auto const& files = config.servers.at("files").definition;
        CHECK(files.transportKind == TransportKind::Stdio);
        REQUIRE(files.process);
        CHECK(files.process->command == "npx");
        CHECK(files.process->args.size() == 3);
        CHECK(files.process->env.at("ROOT") == "/home/alex/data");
        CHECK(config.servers.at("files").envTemplate.at("ROOT") == "${HOME_DIR}/data");
    }

    SECTION("http server with launcher")
    {
        auto const& web = config.servers.at("web").definition;
        CHECK(web.transportKind == TransportKind::Http);
        REQUIRE(web.endpoint);
        CHECK(web.endpoint->baseUrl == "http://127.0.0.1:8931");
        CHECK(healthPathOf(web) == "/");
        REQUIRE(web.process);
        CHECK(web.process->command == "docker");
        CHECK(web.containerImage == "acme/web-tools");
        CHECK(web.healthCheckTimeout == std::chrono::seconds { 45 });
    }

    SECTION("sse server")
    {
        auto const& remote = config.servers.at("remote").definition;
        CHECK(remote.transportKind == TransportKind::Sse);
        CHECK(!remote.process);
        CHECK(healthPathOf(remote) == "/status");
        CHECK(remote.endpoint->rpcPath == "/mcp");
    }

    std::filesystem::remove(tempPath);
}

TEST_CASE("parseConfig marks servers with missing keys unavailable", "[config]")
{
    auto const root = nlohmann::json::parse(R"({
        "servers": {
            "github": { "command": "github-mcp", "env": { "TOKEN": "${GITHUB_TOKEN}" } },
            "local": { "command": "local-mcp" }
        }
    })");

    auto result = parseConfig(root, {});
    REQUIRE(result.has_value());
    CHECK(result->servers.size() == 2);
    REQUIRE(result->unavailableServers.contains("github"));
    CHECK(result->unavailableServers.at("github") == std::vector<std::string> { "GITHUB_TOKEN" });

    auto const definitions = availableDefinitions(*result);
    REQUIRE(definitions.size() == 1);
    CHECK(definitions[0].name == "local");

    auto const keys = requiredKeysPerServer(*result);
    CHECK(keys.at("github") == std::vector<std::string> { "GITHUB_TOKEN" });
    CHECK(keys.at("local").empty());
}

TEST_CASE("parseConfig rejects structurally invalid servers", "[config]")
{
    SECTION("unknown transport")
    {
        auto result = parseConfig(nlohmann::json::parse(R"({"servers": {"x": {"transport": "carrier-pigeon"}}})"), {});
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("stdio without command")
    {
        auto result = parseConfig(nlohmann::json::parse(R"({"servers": {"x": {"args": ["a"]}}})"), {});
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("http without url")
    {
        auto result = parseConfig(nlohmann::json::parse(R"({"servers": {"x": {"transport": "http"}}})"), {});
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("server that is not an object")
    {
        auto result = parseConfig(nlohmann::json::parse(R"({"servers": {"x": 42}})"), {});
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }
}

TEST_CASE("loadConfigFromFile returns error for non-existent file", "[config]")
{
    auto result = loadConfigFromFile("/nonexistent/path/config.json", {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("loadConfigFromFile returns error for invalid JSON", "[config]")
{
    auto const tempPath = writeTempConfig("mcphub_test_invalid.json", "{ invalid json }}}");

    auto result = loadConfigFromFile(tempPath.string(), {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("saveConfigToFile writes a config that can be loaded back", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "mcphub_test_save" / "config.json";
    std::filesystem::remove_all(tempPath.parent_path());

    auto config = HubConfig {};
    config.logLevel = "warning";
    config.timeouts.callSeconds = 12;
    config.servers["files"] = ServerEntry {
        .definition =
            ServerDefinition {
                .name = "files",
                .transportKind = TransportKind::Stdio,
                .process = ProcessLaunch { .command = "files-mcp", .args = { "--root", "/srv" }, .env = {} },
            },
        .envTemplate = { { "TOKEN", "${FILES_TOKEN}" } },
    };
    config.servers["remote"] = ServerEntry {
        .definition =
            ServerDefinition {
                .name = "remote",
                .transportKind = TransportKind::Sse,
                .endpoint = NetworkEndpoint { .baseUrl = "https://tools.example.org", .rpcPath = "/rpc" },
            },
        .envTemplate = {},
    };

    REQUIRE(saveConfigToFile(tempPath.string(), config).has_value());

    auto loaded = loadConfigFromFile(tempPath.string(), { { "FILES_TOKEN", "secret" } });
    REQUIRE(loaded.has_value());
    CHECK(loaded->logLevel == "warning");
    CHECK(loaded->timeouts.callSeconds == 12);

    auto const& files = loaded->servers.at("files");
    CHECK(files.definition.process->args == std::vector<std::string> { "--root", "/srv" });
    CHECK(files.envTemplate.at("TOKEN") == "${FILES_TOKEN}");
    CHECK(files.definition.process->env.at("TOKEN") == "secret");

    auto const& remote = loaded->servers.at("remote").definition;
    CHECK(remote.transportKind == TransportKind::Sse);
    CHECK(remote.endpoint->rpcPath == "/rpc");

    std::filesystem::remove_all(tempPath.parent_path());
}

TEST_CASE("hubOptionsFrom converts the timeouts", "[config]")
{
    auto config = HubConfig {};
    config.containerRuntime = "podman";
    config.timeouts.callSeconds = 7;
    config.timeouts.stopSeconds = 2;
    config.timeouts.startupGraceMs = 250;

    auto const options = hubOptionsFrom(config);
    CHECK(options.defaultCallTimeout == std::chrono::seconds { 7 });
    CHECK(options.lifecycle.stopTimeout == std::chrono::seconds { 2 });
    CHECK(options.connection.startupGrace == std::chrono::milliseconds { 250 });
    CHECK(options.connection.containerRuntime == "podman");
}
