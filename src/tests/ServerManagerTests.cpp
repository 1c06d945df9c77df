// SPDX-License-Identifier: Apache-2.0
#include "TestDoubles.hpp"

#include <hub/ServerManager.hpp>

#include <catch2/catch_test_macros.hpp>

#include <future>
#include <thread>

using namespace mcphub;
using namespace mcphub::test;
using namespace std::chrono_literals;

namespace
{
    auto stdioServer(std::string name) -> ServerDefinition
    {
        return ServerDefinition {
            .name = std::move(name),
            .transportKind = TransportKind::Stdio,
            .process = ProcessLaunch { .command = "unused" },
        };
    }
} // namespace

TEST_CASE("ServerManager starts a server and registers its tools", "[lifecycle]")
{
    auto registry = ToolRegistry();
    auto factory = std::make_shared<FakeConnectionFactory>();
    factory->toolsByServer["files"] = { toolDescriptor("read"), toolDescriptor("write") };

    auto manager = ServerManager(registry, factory);
    REQUIRE(manager.addServer(stdioServer("files")).has_value());
    CHECK(manager.state("files") == ServerState::Configured);

    CHECK(manager.start("files"));
    CHECK(manager.isReady("files"));
    CHECK(manager.activeCount() == 1);
    CHECK(registry.countByServer("files") == 2);

    SECTION("starting again is a no-op")
    {
        CHECK(manager.start("files"));
        CHECK(factory->connects == 1);
    }

    SECTION("stop purges the tools")
    {
        CHECK(manager.stop("files"));
        CHECK(manager.state("files") == ServerState::Configured);
        CHECK(manager.activeCount() == 0);
        CHECK(registry.size() == 0);
        CHECK(factory->connectionOf("files")->stops == 1);
    }
}

TEST_CASE("ServerManager rejects invalid definitions", "[lifecycle]")
{
    auto registry = ToolRegistry();
    auto manager = ServerManager(registry, std::make_shared<FakeConnectionFactory>());

    auto result = manager.addServer(ServerDefinition { .name = "broken", .transportKind = TransportKind::Http });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
    CHECK(manager.serverNames().empty());
}

TEST_CASE("ServerManager refuses to redefine a running server", "[lifecycle]")
{
    auto registry = ToolRegistry();
    auto manager = ServerManager(registry, std::make_shared<FakeConnectionFactory>());
    REQUIRE(manager.addServer(stdioServer("srv")).has_value());

    SECTION("while configured the definition is replaced")
    {
        auto replacement = stdioServer("srv");
        replacement.process->command = "other";
        REQUIRE(manager.addServer(replacement).has_value());
        CHECK(manager.definition("srv")->process->command == "other");
    }

    SECTION("while running the definition is kept")
    {
        REQUIRE(manager.start("srv"));
        auto result = manager.addServer(stdioServer("srv"));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("ServerManager leaves failed starts configured", "[lifecycle]")
{
    auto registry = ToolRegistry();
    auto factory = std::make_shared<FakeConnectionFactory>();
    factory->failing.insert("bad");
    factory->toolsByServer["good"] = { toolDescriptor("ok") };

    auto manager = ServerManager(registry, factory);
    REQUIRE(manager.addServer(stdioServer("bad")).has_value());
    REQUIRE(manager.addServer(stdioServer("good")).has_value());

    auto const results = manager.startAll();
    CHECK(!results.at("bad"));
    CHECK(results.at("good"));
    CHECK(manager.state("bad") == ServerState::Configured);
    CHECK(registry.countByServer("bad") == 0);
    CHECK(registry.countByServer("good") == 1);
}

TEST_CASE("ServerManager purges tools even when the backend fails to stop", "[lifecycle]")
{
    auto registry = ToolRegistry();
    auto factory = std::make_shared<FakeConnectionFactory>();
    factory->toolsByServer["stubborn"] = { toolDescriptor("t") };
    factory->stopFailing.insert("stubborn");

    auto manager = ServerManager(registry, factory);
    REQUIRE(manager.addServer(stdioServer("stubborn")).has_value());
    REQUIRE(manager.start("stubborn"));

    CHECK(manager.stop("stubborn"));
    CHECK(registry.size() == 0);
    CHECK(manager.activeCount() == 0);
    CHECK(manager.state("stubborn") == ServerState::Configured);
}

TEST_CASE("ServerManager handles unknown servers", "[lifecycle]")
{
    auto registry = ToolRegistry();
    auto manager = ServerManager(registry, std::make_shared<FakeConnectionFactory>());

    CHECK(!manager.start("ghost"));
    CHECK(!manager.stop("ghost"));
    CHECK(!manager.removeServer("ghost"));
    CHECK(!manager.state("ghost"));
    CHECK(!manager.definition("ghost"));
}

TEST_CASE("ServerManager removeServer stops and forgets", "[lifecycle]")
{
    auto registry = ToolRegistry();
    auto factory = std::make_shared<FakeConnectionFactory>();
    factory->toolsByServer["srv"] = { toolDescriptor("t") };

    auto manager = ServerManager(registry, factory);
    REQUIRE(manager.addServer(stdioServer("srv")).has_value());
    REQUIRE(manager.start("srv"));

    CHECK(manager.removeServer("srv"));
    CHECK(manager.serverNames().empty());
    CHECK(registry.size() == 0);
    CHECK(factory->connectionOf("srv")->stops == 1);
}

TEST_CASE("ServerManager serializes concurrent starts of one server", "[lifecycle]")
{
    auto registry = ToolRegistry();
    auto factory = std::make_shared<FakeConnectionFactory>();
    factory->toolsByServer["srv"] = { toolDescriptor("t") };
    factory->connectDelay = 100ms;

    auto manager = ServerManager(registry, factory);
    REQUIRE(manager.addServer(stdioServer("srv")).has_value());

    auto first = std::async(std::launch::async, [&] { return manager.start("srv"); });
    auto second = std::async(std::launch::async, [&] { return manager.start("srv"); });
    CHECK(first.get());
    CHECK(second.get());
    CHECK(factory->connects == 1);
    CHECK(registry.countByServer("srv") == 1);
}

TEST_CASE("ServerManager stopAll stops every active server", "[lifecycle]")
{
    auto registry = ToolRegistry();
    auto factory = std::make_shared<FakeConnectionFactory>();
    factory->toolsByServer["a"] = { toolDescriptor("a1") };
    factory->toolsByServer["b"] = { toolDescriptor("b1") };

    auto manager = ServerManager(registry, factory);
    REQUIRE(manager.addServer(stdioServer("a")).has_value());
    REQUIRE(manager.addServer(stdioServer("b")).has_value());
    REQUIRE(manager.addServer(stdioServer("idle")).has_value());
    REQUIRE(manager.start("a"));
    REQUIRE(manager.start("b"));

    manager.stopAll();
    CHECK(manager.activeCount() == 0);
    CHECK(registry.size() == 0);
    CHECK(factory->connectionOf("a")->stops == 1);
    CHECK(factory->connectionOf("b")->stops == 1);
    CHECK(!factory->connectionOf("idle"));

    auto const snapshot = manager.snapshot();
    REQUIRE(snapshot.size() == 3);
    for (auto const& server: snapshot)
    {
        CHECK(server.state == ServerState::Configured);
        CHECK(server.toolCount == 0);
    }
}

TEST_CASE("ServerManager stopAll skips a server whose start outlasts the stop timeout", "[lifecycle]")
{
    auto registry = ToolRegistry();
    auto factory = std::make_shared<FakeConnectionFactory>();
    factory->toolsByServer["a"] = { toolDescriptor("a1") };
    factory->toolsByServer["b"] = { toolDescriptor("b1") };
    factory->toolsByServer["slow"] = { toolDescriptor("s1") };

    auto manager = ServerManager(registry, factory, ServerManagerOptions { .stopTimeout = 100ms });
    REQUIRE(manager.addServer(stdioServer("a")).has_value());
    REQUIRE(manager.addServer(stdioServer("b")).has_value());
    REQUIRE(manager.addServer(stdioServer("slow")).has_value());
    REQUIRE(manager.start("a"));
    REQUIRE(manager.start("b"));

    factory->connectDelay = 800ms;
    auto slowStart = std::async(std::launch::async, [&] { return manager.start("slow"); });
    while (manager.state("slow") != ServerState::Starting)
        std::this_thread::sleep_for(5ms);

    auto const started = std::chrono::steady_clock::now();
    manager.stopAll();
    CHECK(std::chrono::steady_clock::now() - started < 500ms);

    CHECK(factory->connectionOf("a")->stops == 1);
    CHECK(factory->connectionOf("b")->stops == 1);
    CHECK(registry.countByServer("a") == 0);
    CHECK(registry.countByServer("b") == 0);
    CHECK(manager.state("a") == ServerState::Configured);
    CHECK(manager.state("b") == ServerState::Configured);

    // The skipped stop is not retried once the start completes.
    CHECK(slowStart.get());
    CHECK(manager.isReady("slow"));
    CHECK(factory->connectionOf("slow")->stops == 0);
    CHECK(registry.countByServer("slow") == 1);
}
