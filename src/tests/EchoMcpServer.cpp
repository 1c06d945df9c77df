// SPDX-License-Identifier: Apache-2.0
// Minimal stdio MCP server used by the tests.
//
//   echo-mcp                      answers initialize, tools/list and tools/call
//   echo-mcp --exit-on-start      writes to stderr and exits with code 7
//   echo-mcp --silent             reads requests but never answers
//   echo-mcp --noisy              precedes every reply with garbage and a notification
//
// Tool "ping" answers "pong". Its arguments may carry "sleepMs" (delay the reply)
// and "exit" (terminate without replying).

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>

namespace
{

void reply(const nlohmann::json& message)
{
    std::cout << message.dump() << '\n' << std::flush;
}

auto handle(const nlohmann::json& request) -> nlohmann::json
{
    auto const method = request.value("method", std::string {});
    auto const id = request.value("id", nlohmann::json {});

    if (method == "initialize")
    {
        return {
            { "jsonrpc", "2.0" },
            { "id", id },
            { "result",
              {
                  { "protocolVersion", "2024-11-05" },
                  { "capabilities", { { "tools", nlohmann::json::object() } } },
                  { "serverInfo", { { "name", "echo-mcp" }, { "version", "1.0" } } },
              } },
        };
    }

    if (method == "tools/list")
    {
        return {
            { "jsonrpc", "2.0" },
            { "id", id },
            { "result",
              { { "tools",
                  nlohmann::json::array({
                      { { "name", "ping" },
                        { "description", "Replies with pong" },
                        { "inputSchema", nlohmann::json::object() } },
                  }) } } },
        };
    }

    if (method == "tools/call")
    {
        auto const params = request.value("params", nlohmann::json::object());
        auto const name = params.value("name", std::string {});
        auto const arguments = params.value("arguments", nlohmann::json::object());

        if (name != "ping")
        {
            return {
                { "jsonrpc", "2.0" },
                { "id", id },
                { "error", { { "code", -32602 }, { "message", "Unknown tool: " + name } } },
            };
        }

        if (arguments.value("exit", false))
            std::exit(3);

        if (auto const sleepMs = arguments.value("sleepMs", 0); sleepMs > 0)
            std::this_thread::sleep_for(std::chrono::milliseconds { sleepMs });

        return {
            { "jsonrpc", "2.0" },
            { "id", id },
            { "result",
              {
                  { "content", nlohmann::json::array({ { { "type", "text" }, { "text", "pong" } } }) },
                  { "isError", false },
              } },
        };
    }

    return {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", { { "code", -32601 }, { "message", "Method not found: " + method } } },
    };
}

} // namespace

int main(int argc, char** argv)
{
    auto silent = false;
    auto noisy = false;
    for (auto i = 1; i < argc; ++i)
    {
        auto const arg = std::string_view(argv[i]);
        if (arg == "--exit-on-start")
        {
            std::fputs("echo-mcp: refusing to start\n", stderr);
            return 7;
        }
        silent = silent || arg == "--silent";
        noisy = noisy || arg == "--noisy";
    }

    auto line = std::string {};
    while (std::getline(std::cin, line))
    {
        auto const request = nlohmann::json::parse(line, nullptr, false);
        if (request.is_discarded() || !request.is_object())
            continue;

        // Notifications get no reply.
        if (!request.contains("id") || silent)
            continue;

        if (noisy)
        {
            std::cout << "this is not json\n";
            reply({
                { "jsonrpc", "2.0" },
                { "method", "notifications/message" },
                { "params", { { "level", "info" } } },
            });
            reply({ { "jsonrpc", "2.0" }, { "id", -1 }, { "result", nlohmann::json::object() } });
        }

        reply(handle(request));
    }
    return 0;
}
