// SPDX-License-Identifier: Apache-2.0
#include "Process.hpp"

#include <core/Deadline.hpp>
#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>
#include <utility>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mcphub
{

namespace
{

    constexpr auto StderrTailLimit = size_t { 16 * 1024 };
    constexpr auto ExitPollInterval = std::chrono::milliseconds { 10 };
    constexpr auto KillReapTimeout = std::chrono::milliseconds { 2000 };
    constexpr auto StderrPollMs = 100;

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    /// @brief Writing to a pipe whose reader died must fail with EPIPE instead of killing the hub.
    void ignoreSigpipe()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
    }

    auto exitCodeFromStatus(int status) -> int
    {
        if (WIFEXITED(status))
            return WEXITSTATUS(status);
        if (WIFSIGNALED(status))
            return 128 + WTERMSIG(status);
        return -1;
    }

} // namespace

struct Process::Impl
{
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;
    std::string label;
    std::string readBuffer;
    bool stdoutClosed = false;

    std::mutex stateMutex;
    std::optional<int> exitCode;

    std::mutex stderrMutex;
    std::condition_variable stderrChanged;
    std::string stderrTail;
    bool stderrEof = false;
    std::jthread stderrReader;

    /// @brief Reaps the child if it exited. Caller holds stateMutex.
    /// @return True if the child is gone.
    auto reapLocked() -> bool
    {
        if (childPid <= 0 || exitCode)
            return true;

        int status = 0;
        auto const rc = ::waitpid(childPid, &status, WNOHANG);
        if (rc == childPid)
        {
            exitCode = exitCodeFromStatus(status);
            return true;
        }
        if (rc < 0 && errno == ECHILD)
        {
            exitCode = -1;
            return true;
        }
        return false;
    }

    /// @brief Signals the child's process group while it is known to be alive.
    void signal(int sig)
    {
        auto const lock = std::lock_guard(stateMutex);
        if (reapLocked())
            return;
        if (::kill(-childPid, sig) != 0)
            ::kill(childPid, sig);
    }

    void drainStderr(const std::stop_token& stopToken)
    {
        auto buf = std::array<char, 4096> {};
        auto pending = std::string {};

        while (!stopToken.stop_requested())
        {
            auto pfd = pollfd { .fd = stderrRead, .events = POLLIN, .revents = 0 };
            auto const rc = ::poll(&pfd, 1, StderrPollMs);
            if (rc < 0 && errno == EINTR)
                continue;
            if (rc < 0)
                break;
            if (rc == 0)
                continue;

            auto const bytesRead = ::read(stderrRead, buf.data(), buf.size());
            if (bytesRead < 0 && (errno == EINTR || errno == EAGAIN))
                continue;
            if (bytesRead <= 0)
                break;

            pending.append(buf.data(), static_cast<size_t>(bytesRead));
            for (auto pos = pending.find('\n'); pos != std::string::npos; pos = pending.find('\n'))
            {
                log::debug("[{}] {}", label, std::string_view(pending).substr(0, pos));
                pending.erase(0, pos + 1);
            }

            auto const lock = std::lock_guard(stderrMutex);
            stderrTail.append(buf.data(), static_cast<size_t>(bytesRead));
            if (stderrTail.size() > StderrTailLimit)
                stderrTail.erase(0, stderrTail.size() - StderrTailLimit);
        }

        if (!pending.empty())
            log::debug("[{}] {}", label, pending);

        auto const lock = std::lock_guard(stderrMutex);
        stderrEof = true;
        stderrChanged.notify_all();
    }
};

Process::Process(): _impl(std::make_unique<Impl>())
{
}

Process::~Process()
{
    if (_impl->childPid > 0)
    {
        _impl->signal(SIGKILL);
        auto const lock = std::lock_guard(_impl->stateMutex);
        if (!_impl->exitCode)
        {
            int status = 0;
            if (::waitpid(_impl->childPid, &status, 0) == _impl->childPid)
                _impl->exitCode = exitCodeFromStatus(status);
        }
    }

    if (_impl->stderrReader.joinable())
    {
        _impl->stderrReader.request_stop();
        _impl->stderrReader.join();
    }

    closeFd(_impl->stdinWrite);
    closeFd(_impl->stdoutRead);
    closeFd(_impl->stderrRead);
}

auto Process::spawn(const ProcessConfig& config) -> VoidResult
{
    if (_impl->childPid > 0)
        return makeError(ErrorCode::TransportError, "Process already spawned");

    ignoreSigpipe();

    auto stdinPipe = std::array<int, 2> { -1, -1 };
    auto stdoutPipe = std::array<int, 2> { -1, -1 };
    auto stderrPipe = std::array<int, 2> { -1, -1 };

    auto const closePipes = [&] {
        for (auto* fds: { &stdinPipe, &stdoutPipe, &stderrPipe })
        {
            closeFd((*fds)[0]);
            closeFd((*fds)[1]);
        }
    };

    if ((config.pipeStdin && ::pipe2(stdinPipe.data(), O_CLOEXEC) != 0)
        || (config.pipeStdout && ::pipe2(stdoutPipe.data(), O_CLOEXEC) != 0)
        || ::pipe2(stderrPipe.data(), O_CLOEXEC) != 0)
    {
        auto const err = errno;
        closePipes();
        return makeError(ErrorCode::TransportError, std::format("Failed to create pipes: {}", strerror(err)));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    if (config.pipeStdin)
        posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    else
        posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    if (config.pipeStdout)
        posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    else
        posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);

    // Own process group, and undo the hub's SIGPIPE disposition in the child.
    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF);
    posix_spawnattr_setpgroup(&attributes, 0);
    sigset_t defaultSignals;
    sigemptyset(&defaultSignals);
    sigaddset(&defaultSignals, SIGPIPE);
    posix_spawnattr_setsigdefault(&attributes, &defaultSignals);

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment (base + config overrides)
    auto const environment =
        mergeEnvironment(config.baseEnvironment.value_or(currentEnvironment()), config.env);
    auto envStrings = std::vector<std::string> {};
    for (const auto& [key, value]: environment)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    auto const status =
        posix_spawnp(&pid, config.command.c_str(), &actions, &attributes, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attributes);

    closeFd(stdinPipe[0]);
    closeFd(stdoutPipe[1]);
    closeFd(stderrPipe[1]);

    if (status != 0)
    {
        closePipes();
        return makeError(ErrorCode::TransportError,
                         std::format("Failed to spawn process '{}': {}", config.command, strerror(status)));
    }

    _impl->childPid = pid;
    _impl->stdinWrite = std::exchange(stdinPipe[1], -1);
    // Writes poll for room so a child that stops reading cannot stall the caller past its deadline.
    if (_impl->stdinWrite >= 0)
        ::fcntl(_impl->stdinWrite, F_SETFL, ::fcntl(_impl->stdinWrite, F_GETFL) | O_NONBLOCK);
    _impl->stdoutRead = std::exchange(stdoutPipe[0], -1);
    _impl->stderrRead = std::exchange(stderrPipe[0], -1);
    _impl->label = config.label.empty() ? config.command : config.label;
    _impl->stderrReader =
        std::jthread([impl = _impl.get()](const std::stop_token& stopToken) { impl->drainStderr(stopToken); });

    log::debug("Spawned '{}' as pid {}", config.command, pid);
    return {};
}

auto Process::pid() const -> int
{
    return _impl->childPid;
}

auto Process::isRunning() -> bool
{
    auto const lock = std::lock_guard(_impl->stateMutex);
    return !_impl->reapLocked();
}

auto Process::exitStatus() -> std::optional<int>
{
    auto const lock = std::lock_guard(_impl->stateMutex);
    _impl->reapLocked();
    return _impl->exitCode;
}

auto Process::waitForExit(std::chrono::milliseconds timeout) -> bool
{
    auto const deadline = deadlineAfter(timeout);
    while (isRunning())
    {
        if (expired(deadline))
            return false;
        std::this_thread::sleep_for(std::min(ExitPollInterval, remaining(deadline)));
    }
    return true;
}

auto Process::terminate(std::chrono::milliseconds gracePeriod) -> bool
{
    if (!isRunning())
        return true;

    _impl->signal(SIGTERM);
    if (waitForExit(gracePeriod))
        return true;

    log::warning("[{}] did not exit within {} ms of SIGTERM, sending SIGKILL", _impl->label, gracePeriod.count());
    _impl->signal(SIGKILL);
    if (!waitForExit(KillReapTimeout))
        log::error("[{}] pid {} survived SIGKILL", _impl->label, _impl->childPid);
    return false;
}

auto Process::write(std::string_view data, std::chrono::milliseconds timeout) -> VoidResult
{
    if (_impl->stdinWrite < 0)
        return makeError(ErrorCode::ProcessTerminated, "Process stdin is closed");

    auto const deadline = deadlineAfter(timeout);
    while (!data.empty())
    {
        auto const written = ::write(_impl->stdinWrite, data.data(), data.size());
        if (written >= 0)
        {
            data.remove_prefix(static_cast<size_t>(written));
            continue;
        }

        if (errno == EINTR)
            continue;
        if (errno == EPIPE)
            return makeError(ErrorCode::ProcessTerminated, "Process closed its input");
        if (errno != EAGAIN && errno != EWOULDBLOCK)
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to process stdin: {}", strerror(errno)));

        if (expired(deadline))
            return makeError(ErrorCode::Timeout,
                             std::format("Process did not accept input within {} ms ({} bytes pending)",
                                         timeout.count(),
                                         data.size()));

        auto pfd = pollfd { .fd = _impl->stdinWrite, .events = POLLOUT, .revents = 0 };
        auto const rc = ::poll(&pfd, 1, static_cast<int>(remaining(deadline).count()));
        if (rc < 0 && errno != EINTR)
            return makeError(ErrorCode::TransportError, std::format("poll failed: {}", strerror(errno)));
    }

    return {};
}

auto Process::readLine(std::chrono::milliseconds timeout) -> Result<std::string>
{
    if (_impl->stdoutRead < 0)
        return makeError(ErrorCode::TransportError, "Process stdout is not readable");

    auto const deadline = deadlineAfter(timeout);

    // Read until we get a complete line
    while (true)
    {
        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return line;
        }

        if (_impl->stdoutClosed)
            return makeError(ErrorCode::ProcessTerminated, "Process closed its output");

        auto pfd = pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 };
        auto const rc = ::poll(&pfd, 1, static_cast<int>(remaining(deadline).count()));
        if (rc < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError, std::format("poll failed: {}", strerror(errno)));
        }
        if (rc == 0)
            return makeError(ErrorCode::Timeout, std::format("No response within {} ms", timeout.count()));

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to read process stdout: {}", strerror(errno)));
        }
        if (bytesRead == 0)
        {
            _impl->stdoutClosed = true;
            continue;
        }
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }
}

auto Process::readToEnd(std::chrono::milliseconds timeout) -> Result<std::string>
{
    if (_impl->stdoutRead < 0)
        return makeError(ErrorCode::TransportError, "Process stdout is not readable");

    auto const deadline = deadlineAfter(timeout);
    while (!_impl->stdoutClosed)
    {
        auto pfd = pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 };
        auto const rc = ::poll(&pfd, 1, static_cast<int>(remaining(deadline).count()));
        if (rc < 0 && errno == EINTR)
            continue;
        if (rc < 0)
            return makeError(ErrorCode::TransportError, std::format("poll failed: {}", strerror(errno)));
        if (rc == 0)
            return makeError(ErrorCode::Timeout, std::format("Output not complete within {} ms", timeout.count()));

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0 && (errno == EINTR || errno == EAGAIN))
            continue;
        if (bytesRead < 0)
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to read process stdout: {}", strerror(errno)));
        if (bytesRead == 0)
            _impl->stdoutClosed = true;
        else
            _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }

    return std::exchange(_impl->readBuffer, std::string {});
}

auto Process::stderrOutput(std::chrono::milliseconds settle) -> std::string
{
    auto lock = std::unique_lock(_impl->stderrMutex);
    _impl->stderrChanged.wait_for(lock, settle, [this] { return _impl->stderrEof; });
    return _impl->stderrTail;
}

void Process::closeStdin()
{
    closeFd(_impl->stdinWrite);
}

auto currentEnvironment() -> Environment
{
    auto environment = Environment {};
    if (!environ)
        return environment;

    for (auto** e = environ; *e; ++e)
    {
        auto const entry = std::string_view(*e);
        auto const eq = entry.find('=');
        if (eq == std::string_view::npos || eq == 0)
            continue;
        environment.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
    }
    return environment;
}

auto mergeEnvironment(Environment base, const Environment& overrides) -> Environment
{
    for (const auto& [key, value]: overrides)
        base[key] = value;
    return base;
}

auto runCommand(ProcessConfig config, std::chrono::milliseconds timeout) -> Result<CommandOutput>
{
    config.pipeStdin = false;
    config.pipeStdout = true;

    auto const deadline = deadlineAfter(timeout);
    auto process = Process();
    auto spawned = process.spawn(config);
    if (!spawned)
        return std::unexpected(spawned.error());

    auto output = process.readToEnd(timeout);
    if (!output)
    {
        process.terminate(std::chrono::milliseconds { 0 });
        return std::unexpected(output.error());
    }

    if (!process.waitForExit(remaining(deadline)))
    {
        process.terminate(std::chrono::milliseconds { 0 });
        return makeError(ErrorCode::Timeout,
                         std::format("'{}' did not finish within {} ms", config.command, timeout.count()));
    }

    return CommandOutput {
        .exitCode = process.exitStatus().value_or(-1),
        .output = std::move(*output),
    };
}

} // namespace mcphub
