// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <mutex>
#include <print>

namespace mcphub::log
{

namespace
{
    constexpr auto LevelNames = std::array<std::string_view, 5> { "error", "warning", "info", "debug", "trace" };
    constexpr auto LevelTags = std::array<std::string_view, 5> { "ERROR", "WARN ", "INFO ", "DEBUG", "TRACE" };

    auto currentLevel = std::atomic<Level> { Level::Info };
    auto currentSink = Sink {};
    auto outputMutex = std::mutex {};

    auto indexOf(Level level) -> size_t
    {
        return static_cast<size_t>(level);
    }
} // namespace

auto levelName(Level level) -> std::string_view
{
    return LevelNames.at(indexOf(level));
}

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    if (name == "warn")
        return Level::Warning;
    for (auto i = size_t { 0 }; i < LevelNames.size(); ++i)
    {
        if (LevelNames[i] == name)
            return static_cast<Level>(i);
    }
    return std::nullopt;
}

void setSink(Sink sink)
{
    auto const lock = std::lock_guard(outputMutex);
    currentSink = std::move(sink);
}

void setLevel(Level level)
{
    currentLevel = level;
}

auto getLevel() -> Level
{
    return currentLevel;
}

void write(Level level, std::string_view message)
{
    if (!enabled(level))
        return;

    auto const lock = std::lock_guard(outputMutex);
    if (currentSink)
    {
        currentSink(level, message);
        return;
    }

    auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    auto const timeOfDay = std::chrono::hh_mm_ss(now - std::chrono::floor<std::chrono::days>(now));
    std::println(stderr, "{:%T} {} {}", timeOfDay, LevelTags.at(indexOf(level)), message);
}

} // namespace mcphub::log
