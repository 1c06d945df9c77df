// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief Parses the output of "<runtime> ps -q": one container id per line.
[[nodiscard]] auto parseContainerIds(std::string_view output) -> std::vector<std::string>;

/// @brief Stops every running container created from the given image.
///
/// Each container gets "<runtime> stop" and is killed with "<runtime> kill"
/// when that does not succeed in time. The whole operation, listing included,
/// finishes within the timeout; a quarter of it is kept for killing.
/// @param runtime The container runtime executable (docker, podman, ...).
/// @param image The image whose containers are stopped.
/// @param timeout Upper bound of the whole operation.
/// @return Success, or the last error met.
[[nodiscard]] auto stopContainersByImage(std::string_view runtime,
                                         std::string_view image,
                                         std::chrono::milliseconds timeout) -> VoidResult;

} // namespace mcphub
