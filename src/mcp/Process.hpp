// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief Describes how to launch a child process.
struct ProcessConfig
{
    std::string command;
    std::vector<std::string> args;

    /// @brief Variables set on top of the base environment.
    Environment env;

    /// @brief Base environment; the hub's own environment when unset.
    std::optional<Environment> baseEnvironment;

    /// @brief Connect the child's stdin to a pipe (otherwise /dev/null).
    bool pipeStdin = true;

    /// @brief Connect the child's stdout to a pipe (otherwise /dev/null).
    bool pipeStdout = true;

    /// @brief Name used to prefix log lines of this process.
    std::string label;
};

/// @brief Output of a command run to completion.
struct CommandOutput
{
    int exitCode = -1;
    std::string output;
};

/// @brief A spawned child process with piped standard streams.
///
/// stderr is always captured: a background reader drains it (so a chatty
/// child never blocks on a full pipe), logs each line at debug level and
/// keeps the most recent output for diagnostics.
///
/// The child is placed in its own process group so that signals reach any
/// helper processes it spawns (npx, container runtimes, ...).
class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /// @brief Spawns the process.
    /// @param config The launch configuration.
    /// @return Success or ErrorCode::TransportError if spawning failed.
    [[nodiscard]] auto spawn(const ProcessConfig& config) -> VoidResult;

    /// @brief Returns the process id, or -1 if not spawned.
    [[nodiscard]] auto pid() const -> int;

    /// @brief Returns true while the child has not exited (reaps it if it has).
    [[nodiscard]] auto isRunning() -> bool;

    /// @brief Returns the exit status once the child has exited.
    [[nodiscard]] auto exitStatus() -> std::optional<int>;

    /// @brief Waits up to the given time for the child to exit.
    /// @return True if the child has exited.
    auto waitForExit(std::chrono::milliseconds timeout) -> bool;

    /// @brief Sends SIGTERM, waits up to the grace period, then escalates to SIGKILL.
    /// @param gracePeriod Time the child gets to exit after SIGTERM.
    /// @return True if the child exited gracefully, false if it had to be killed.
    auto terminate(std::chrono::milliseconds gracePeriod) -> bool;

    /// @brief Writes all bytes to the child's stdin.
    /// @param timeout Upper bound to wait for the child to drain the pipe.
    /// @return Success, ErrorCode::Timeout, or ErrorCode::ProcessTerminated if the pipe is closed.
    [[nodiscard]] auto write(std::string_view data, std::chrono::milliseconds timeout) -> VoidResult;

    /// @brief Reads one newline-terminated line from the child's stdout.
    /// @param timeout Upper bound to wait for a complete line.
    /// @return The line without its terminator, ErrorCode::Timeout,
    ///         or ErrorCode::ProcessTerminated on end of stream.
    [[nodiscard]] auto readLine(std::chrono::milliseconds timeout) -> Result<std::string>;

    /// @brief Reads stdout until end of stream.
    [[nodiscard]] auto readToEnd(std::chrono::milliseconds timeout) -> Result<std::string>;

    /// @brief Returns captured stderr, waiting up to settle for the stream to end.
    [[nodiscard]] auto stderrOutput(std::chrono::milliseconds settle = std::chrono::milliseconds { 0 })
        -> std::string;

    /// @brief Closes the child's stdin, signalling end of input.
    void closeStdin();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/// @brief Returns the environment of the running hub process.
[[nodiscard]] auto currentEnvironment() -> Environment;

/// @brief Returns base with every entry of overrides applied on top.
[[nodiscard]] auto mergeEnvironment(Environment base, const Environment& overrides) -> Environment;

/// @brief Runs a command to completion and captures its stdout.
/// @param config The launch configuration (stdin is never piped).
/// @param timeout Upper bound for the whole run; the child is killed on expiry.
/// @return The exit code and output, or an error.
[[nodiscard]] auto runCommand(ProcessConfig config, std::chrono::milliseconds timeout) -> Result<CommandOutput>;

} // namespace mcphub
