// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace mcphub::log
{

/// @brief Severity of a log record, most severe first.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Returns the lower-case name of a level, as accepted by levelFromString().
[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Parses a level name ("error", "warning"/"warn", "info", "debug", "trace").
[[nodiscard]] auto levelFromString(std::string_view name) -> std::optional<Level>;

/// @brief Receives every record that passes the level filter.
using Sink = std::function<void(Level level, std::string_view message)>;

/// @brief Routes records to the sink instead of stderr; an empty sink restores stderr.
///
/// The sink runs under the logger's lock and must not log itself.
void setSink(Sink sink);

/// @brief Sets the most verbose level that is still written.
void setLevel(Level level);

[[nodiscard]] auto getLevel() -> Level;

/// @brief Returns true if records of the level are written.
[[nodiscard]] inline auto enabled(Level level) -> bool
{
    return level <= getLevel();
}

/// @brief Writes one record.
///
/// Without a sink the record goes to stderr as "HH:MM:SS.mmm LEVEL message".
/// Records from concurrent threads are never interleaved.
void write(Level level, std::string_view message);

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Warning))
        write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Info))
        write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a debug record; arguments are not formatted unless debug output is enabled.
template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Debug))
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a trace record (wire traffic).
template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Trace))
        write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace mcphub::log
