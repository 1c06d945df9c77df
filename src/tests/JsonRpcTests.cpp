// SPDX-License-Identifier: Apache-2.0
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

#include <set>

using namespace mcphub;

TEST_CASE("makeRequest creates valid JSON-RPC 2.0 request", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest(1, "tools/list");

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 1);
    CHECK(request["method"] == "tools/list");
    CHECK(!request.contains("params"));
}

TEST_CASE("makeRequest includes params when provided", "[jsonrpc]")
{
    auto params = nlohmann::json { { "name", "ping" }, { "arguments", nlohmann::json::object() } };
    auto request = jsonrpc::makeRequest(42, "tools/call", params);

    CHECK(request["id"] == 42);
    REQUIRE(request.contains("params"));
    CHECK(request["params"]["name"] == "ping");
}

TEST_CASE("makeNotification creates a message without id", "[jsonrpc]")
{
    auto notification = jsonrpc::makeNotification("notifications/initialized");

    CHECK(notification["jsonrpc"] == "2.0");
    CHECK(!notification.contains("id"));
    CHECK(notification["method"] == "notifications/initialized");
    CHECK(jsonrpc::isNotification(notification));
    CHECK(!jsonrpc::isNotification(jsonrpc::makeRequest(1, "initialize")));
}

TEST_CASE("parseResponse handles success response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result", { { "status", "ok" } } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(result->isSuccess());
    CHECK(result->isReply());
    CHECK(result->result->at("status") == "ok");
    CHECK(!result->error.has_value());
}

TEST_CASE("parseResponse handles error response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 7 },
        { "error", { { "code", -32601 }, { "message", "Method not found" } } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(!result->isSuccess());
    CHECK(result->isReply());
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == -32601);
    CHECK(result->error->message == "Method not found");
}

TEST_CASE("parseResponse keeps non-object error payloads", "[jsonrpc]")
{
    auto msg = nlohmann::json { { "jsonrpc", "2.0" }, { "id", 1 }, { "error", "boom" } };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    REQUIRE(result->error.has_value());
    CHECK(result->error->message == "\"boom\"");
}

TEST_CASE("parseResponse recognizes server messages", "[jsonrpc]")
{
    auto msg = nlohmann::json { { "jsonrpc", "2.0" }, { "method", "notifications/message" } };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(result->isServerMessage());
    CHECK(result->method == "notifications/message");
}

TEST_CASE("parseResponse rejects messages that are not JSON-RPC 2.0", "[jsonrpc]")
{
    SECTION("missing version")
    {
        auto result = jsonrpc::parseResponse(nlohmann::json { { "id", 1 }, { "result", 1 } });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ProtocolError);
    }

    SECTION("neither result, error nor method")
    {
        auto result = jsonrpc::parseResponse(nlohmann::json { { "jsonrpc", "2.0" }, { "id", 1 } });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ProtocolError);
    }

    SECTION("not an object")
    {
        auto result = jsonrpc::parseResponse(nlohmann::json::array());
        REQUIRE(!result.has_value());
    }
}

TEST_CASE("decode reports malformed text as a protocol error", "[jsonrpc]")
{
    auto result = jsonrpc::decode("{not json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("decode parses a serialized reply", "[jsonrpc]")
{
    auto result = jsonrpc::decode(R"({"jsonrpc":"2.0","id":3,"result":{"tools":[]}})");
    REQUIRE(result.has_value());
    CHECK(result->id == 3);
    CHECK(result->result->at("tools").empty());
}

TEST_CASE("IdGenerator hands out distinct increasing ids", "[jsonrpc]")
{
    auto ids = jsonrpc::IdGenerator();
    auto seen = std::set<int64_t> {};
    auto previous = int64_t { 0 };
    for (auto i = 0; i < 100; ++i)
    {
        auto const id = ids.next();
        CHECK(id > previous);
        previous = id;
        seen.insert(id);
    }
    CHECK(seen.size() == 100);
}
