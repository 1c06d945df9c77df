// SPDX-License-Identifier: Apache-2.0
#include <core/Deadline.hpp>
#include <core/Error.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Types.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace mcphub;
using namespace std::chrono_literals;

TEST_CASE("Error formats with its kind", "[core]")
{
    auto const error = Error { ErrorCode::NotFound, "Tool 'x' not found" };
    CHECK(std::format("{}", error) == "[not_found] Tool 'x' not found");
    CHECK(errorCodeName(ErrorCode::Timeout) == "timeout");
    CHECK(errorCodeName(ErrorCode::TransportUnavailable) == "transport_unavailable");
}

TEST_CASE("TransportKind round-trips through its name", "[core]")
{
    CHECK(transportKindToString(TransportKind::Sse) == "sse");
    CHECK(transportKindFromString("http") == TransportKind::Http);
    CHECK(transportKindFromString("stdio") == TransportKind::Stdio);
    CHECK(!transportKindFromString("websocket"));
}

TEST_CASE("Deadline reports the remaining time", "[core]")
{
    auto const deadline = deadlineAfter(50ms);
    CHECK(!expired(deadline));
    CHECK(remaining(deadline) <= 50ms);

    std::this_thread::sleep_for(60ms);
    CHECK(expired(deadline));
    CHECK(remaining(deadline) == 0ms);
}

TEST_CASE("json accessors tolerate missing and mistyped members", "[core]")
{
    auto const document = nlohmann::json::parse(R"({
        "name": "srv",
        "port": "not a number",
        "args": ["a", 1, "b"],
        "env": { "A": "1", "B": 2 }
    })");

    CHECK(json::getStringOr(document, "name", "x") == "srv");
    CHECK(json::getStringOr(document, "missing", "x") == "x");
    CHECK(json::getIntOr(document, "port", 80) == 80);
    CHECK(json::getStringList(document, "args") == std::vector<std::string> { "a", "b" });
    CHECK(json::getStringMap(document, "env").size() == 1);
    CHECK(!json::getString(document, "port").has_value());
    CHECK(json::getStringOr(nlohmann::json::array(), "name", "x") == "x");

    auto const broken = json::parse("{ nope");
    REQUIRE(!broken.has_value());
    CHECK(broken.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("log filters by level and routes to the sink", "[core]")
{
    auto records = std::vector<std::string> {};
    log::setSink([&](log::Level level, std::string_view message) {
        records.push_back(std::format("{}:{}", log::levelName(level), message));
    });
    auto const previous = log::getLevel();
    log::setLevel(log::Level::Info);

    log::info("server '{}' ready", "files");
    log::debug("hidden");
    log::warning("slow");

    log::setSink({});
    log::setLevel(previous);

    CHECK(records == std::vector<std::string> { "info:server 'files' ready", "warning:slow" });
}

TEST_CASE("levelFromString accepts level names", "[core]")
{
    CHECK(log::levelFromString("debug") == log::Level::Debug);
    CHECK(log::levelFromString("warn") == log::Level::Warning);
    CHECK(log::levelFromString("warning") == log::Level::Warning);
    CHECK(!log::levelFromString("loud"));
}
