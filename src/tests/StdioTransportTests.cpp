// SPDX-License-Identifier: Apache-2.0
#include <mcp/StdioTransport.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace mcphub;
using namespace std::chrono_literals;

TEST_CASE("StdioTransport starts disconnected", "[transport]")
{
    auto transport = StdioTransport();
    CHECK(!transport.isConnected());
}

TEST_CASE("StdioTransport send fails when not connected", "[transport]")
{
    auto transport = StdioTransport();
    auto result = transport.send(nlohmann::json { { "test", true } }, 100ms);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
}

TEST_CASE("StdioTransport receive fails when not connected", "[transport]")
{
    auto transport = StdioTransport();
    auto result = transport.receive(100ms);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
}

TEST_CASE("StdioTransport can spawn and communicate with a simple process", "[transport]")
{
    auto transport = StdioTransport();

    auto config = StdioTransportConfig {
        .command = "cat",
        .args = {},
        .env = {},
        .baseEnvironment = std::nullopt,
        .label = "cat",
    };

    auto startResult = transport.start(config);
    REQUIRE(startResult.has_value());
    CHECK(transport.isConnected());

    auto msg = nlohmann::json { { "test", "hello" } };
    auto sendResult = transport.send(msg, 1s);
    REQUIRE(sendResult.has_value());

    // cat echoes stdin to stdout
    auto recvResult = transport.receive(2s);
    REQUIRE(recvResult.has_value());
    CHECK(nlohmann::json::parse(*recvResult)["test"] == "hello");

    transport.close();
    CHECK(!transport.isConnected());
}

TEST_CASE("StdioTransport receive times out when the process stays silent", "[transport]")
{
    auto transport = StdioTransport();
    REQUIRE(transport.start(StdioTransportConfig { .command = "sleep", .args = { "5" } }).has_value());

    auto const started = std::chrono::steady_clock::now();
    auto result = transport.receive(200ms);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::Timeout);
    CHECK(std::chrono::steady_clock::now() - started < 2s);
}

TEST_CASE("StdioTransport send times out when the process stops reading", "[transport]")
{
    auto transport = StdioTransport();
    REQUIRE(transport.start(StdioTransportConfig { .command = "sleep", .args = { "5" } }).has_value());

    // Larger than any pipe buffer, so the write cannot complete without a reader.
    auto const message = nlohmann::json { { "payload", std::string(1024 * 1024, 'x') } };

    auto const started = std::chrono::steady_clock::now();
    auto result = transport.send(message, 200ms);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::Timeout);
    CHECK(std::chrono::steady_clock::now() - started < 1s);
}

TEST_CASE("StdioTransport reports a terminated process", "[transport]")
{
    auto transport = StdioTransport();
    REQUIRE(transport.start(StdioTransportConfig { .command = "true" }).has_value());
    REQUIRE(transport.process().waitForExit(2s));

    SECTION("send fails immediately")
    {
        auto result = transport.send(nlohmann::json { { "ping", 1 } }, 1s);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ProcessTerminated);
    }

    SECTION("receive sees end of stream")
    {
        auto result = transport.receive(1s);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ProcessTerminated);
        CHECK(!transport.isConnected());
    }
}

TEST_CASE("StdioTransport fails to start invalid command", "[transport]")
{
    auto transport = StdioTransport();

    auto config = StdioTransportConfig {
        .command = "/nonexistent/command/that/does/not/exist",
    };

    auto result = transport.start(config);
    // posix_spawnp may succeed for a missing binary; the child then exits at once.
    if (result.has_value())
    {
        auto recvResult = transport.receive(1s);
        CHECK(!recvResult.has_value());
    }
    else
    {
        CHECK(result.error().code == ErrorCode::TransportError);
    }
}
