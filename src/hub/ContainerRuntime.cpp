// SPDX-License-Identifier: Apache-2.0
#include "ContainerRuntime.hpp"

#include <core/Deadline.hpp>
#include <core/Log.hpp>
#include <mcp/Process.hpp>

#include <algorithm>
#include <format>

namespace mcphub
{

namespace
{
    /// Share of the stop budget kept back for "kill" after a failed "stop".
    constexpr auto KillReserveDivisor = 4;

    auto run(std::string_view runtime, std::vector<std::string> args, std::chrono::milliseconds timeout)
        -> Result<CommandOutput>
    {
        return runCommand(
            ProcessConfig {
                .command = std::string(runtime),
                .args = std::move(args),
                .env = {},
                .baseEnvironment = std::nullopt,
                .pipeStdin = false,
                .pipeStdout = true,
                .label = std::string(runtime),
            },
            timeout);
    }

    auto killContainer(std::string_view runtime, const std::string& id, std::chrono::milliseconds timeout)
        -> VoidResult
    {
        auto killed = run(runtime, { "kill", id }, timeout);
        if (!killed)
            return std::unexpected(killed.error());
        if (killed->exitCode != 0)
            return makeError(ErrorCode::IoError,
                             std::format("{} kill {} exited with code {}", runtime, id, killed->exitCode));
        return {};
    }
} // namespace

auto parseContainerIds(std::string_view output) -> std::vector<std::string>
{
    auto ids = std::vector<std::string> {};
    while (!output.empty())
    {
        auto const newline = output.find('\n');
        auto line = output.substr(0, newline);
        output = newline == std::string_view::npos ? std::string_view {} : output.substr(newline + 1);

        while (!line.empty() && (line.back() == '\r' || line.back() == ' '))
            line.remove_suffix(1);
        while (!line.empty() && line.front() == ' ')
            line.remove_prefix(1);
        if (!line.empty())
            ids.emplace_back(line);
    }
    return ids;
}

auto stopContainersByImage(std::string_view runtime, std::string_view image, std::chrono::milliseconds timeout)
    -> VoidResult
{
    auto const deadline = deadlineAfter(timeout);
    auto const killReserve = timeout / KillReserveDivisor;

    auto listed = run(runtime, { "ps", "-q", "--filter", std::format("ancestor={}", image) }, remaining(deadline));
    if (!listed)
        return std::unexpected(listed.error());
    if (listed->exitCode != 0)
        return makeError(ErrorCode::IoError,
                         std::format("{} ps exited with code {}", runtime, listed->exitCode));

    auto result = VoidResult {};
    for (auto const& id: parseContainerIds(listed->output))
    {
        log::info("Stopping container {} (image {})", id, image);

        // The runtime escalates to SIGKILL itself after -t seconds, within our share of the budget.
        auto const stopBudget = std::max(remaining(deadline) - killReserve, std::chrono::milliseconds { 0 });
        auto const seconds = std::chrono::duration_cast<std::chrono::seconds>(stopBudget).count();
        auto stopped = run(runtime, { "stop", "-t", std::to_string(seconds), id }, stopBudget);
        if (stopped && stopped->exitCode == 0)
            continue;

        log::warning("Container {} did not stop in time, killing it", id);
        auto killed = killContainer(runtime, id, remaining(deadline));
        if (!killed)
        {
            log::warning("Failed to kill container {}: {}", id, killed.error().message);
            result = std::unexpected(killed.error());
        }
    }
    return result;
}

} // namespace mcphub
