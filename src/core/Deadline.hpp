// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <algorithm>
#include <chrono>

namespace mcphub
{

using Clock = std::chrono::steady_clock;

/// @brief Absolute point in time after which an operation must give up.
using Deadline = Clock::time_point;

/// @brief Returns a deadline the given duration from now.
[[nodiscard]] inline auto deadlineAfter(std::chrono::milliseconds timeout) -> Deadline
{
    return Clock::now() + timeout;
}

/// @brief Returns the time left until the deadline, clamped at zero.
[[nodiscard]] inline auto remaining(Deadline deadline) -> std::chrono::milliseconds
{
    auto const left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return std::max(left, std::chrono::milliseconds { 0 });
}

/// @brief Returns true once the deadline has passed.
[[nodiscard]] inline auto expired(Deadline deadline) -> bool
{
    return Clock::now() >= deadline;
}

} // namespace mcphub
