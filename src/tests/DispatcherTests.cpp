// SPDX-License-Identifier: Apache-2.0
#include "TestDoubles.hpp"

#include <hub/Dispatcher.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcphub;
using namespace mcphub::test;
using namespace std::chrono_literals;

TEST_CASE("Dispatcher routes a call to the owning connection", "[dispatcher]")
{
    auto registry = ToolRegistry();
    auto connection = std::make_shared<FakeConnection>(std::vector { toolDescriptor("echo") });
    registry.registerMany("srv", TransportKind::Stdio, connection, connection->discoveredTools());

    auto const dispatcher = Dispatcher(registry);
    auto const outcome = dispatcher.call("echo", nlohmann::json { { "text", "hi" } }, 1s);

    REQUIRE(outcome.ok);
    CHECK(!outcome.error);
    CHECK(outcome.result["tool"] == "echo");
    CHECK(outcome.result["arguments"]["text"] == "hi");
    CHECK(outcome.elapsed.count() >= 0.0);
    CHECK(connection->calls == 1);
}

TEST_CASE("Dispatcher fails unknown tools without touching a backend", "[dispatcher]")
{
    auto registry = ToolRegistry();
    auto connection = std::make_shared<FakeConnection>(std::vector { toolDescriptor("echo") });
    registry.registerMany("srv", TransportKind::Stdio, connection, connection->discoveredTools());

    auto const outcome = Dispatcher(registry).call("missing", nlohmann::json::object(), 1s);
    CHECK(!outcome.ok);
    REQUIRE(outcome.error);
    CHECK(outcome.error->code == ErrorCode::NotFound);
    CHECK(connection->calls == 0);
}

TEST_CASE("Dispatcher reports a stopped owner as not found", "[dispatcher]")
{
    auto registry = ToolRegistry();
    {
        auto connection = std::make_shared<FakeConnection>(std::vector { toolDescriptor("echo") });
        registry.registerMany("srv", TransportKind::Stdio, connection, connection->discoveredTools());
    }

    auto const outcome = Dispatcher(registry).call("echo", nlohmann::json::object(), 1s);
    CHECK(!outcome.ok);
    REQUIRE(outcome.error);
    CHECK(outcome.error->code == ErrorCode::NotFound);
}

TEST_CASE("Dispatcher passes backend errors through", "[dispatcher]")
{
    auto registry = ToolRegistry();
    auto connection = std::make_shared<FakeConnection>(std::vector { toolDescriptor("echo") });
    connection->failWith = Error { ErrorCode::ToolCallError, "RPC error -32602: bad arguments" };
    registry.registerMany("srv", TransportKind::Stdio, connection, connection->discoveredTools());

    auto const outcome = Dispatcher(registry).call("echo", nlohmann::json::object(), 1s);
    CHECK(!outcome.ok);
    REQUIRE(outcome.error);
    CHECK(outcome.error->code == ErrorCode::ToolCallError);
    CHECK(outcome.error->message == "RPC error -32602: bad arguments");
}

TEST_CASE("Dispatcher names the tool and budget on timeout", "[dispatcher]")
{
    auto registry = ToolRegistry();
    auto connection = std::make_shared<FakeConnection>(std::vector { toolDescriptor("slow") });
    connection->callDelay = 2s;
    registry.registerMany("srv", TransportKind::Stdio, connection, connection->discoveredTools());

    auto const outcome = Dispatcher(registry).call("slow", nlohmann::json::object(), 100ms);
    CHECK(!outcome.ok);
    REQUIRE(outcome.error);
    CHECK(outcome.error->code == ErrorCode::Timeout);
    CHECK(outcome.error->message.find("'slow'") != std::string::npos);
    CHECK(outcome.error->message.find("100 ms") != std::string::npos);
    CHECK(outcome.elapsed < 1s);
}
