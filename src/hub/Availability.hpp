// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <map>
#include <string>
#include <vector>

namespace mcphub
{

/// @brief Whether a server has every environment value it needs.
struct Availability
{
    bool available = false;
    std::vector<std::string> missingKeys;
};

/// @brief Returns the ${VAR} names referenced by an environment template, without duplicates.
[[nodiscard]] auto requiredKeysFromTemplate(const Environment& envTemplate) -> std::vector<std::string>;

/// @brief Reports, per server, which required keys are missing from the environment.
///
/// A key counts as present when it is set to a non-empty value. PWD is always present.
[[nodiscard]] auto checkAvailability(const std::map<std::string, std::vector<std::string>>& requiredKeysPerServer,
                                     const Environment& environment) -> std::map<std::string, Availability>;

/// @brief Substitutes every ${VAR} in the template's values from the environment.
/// @return The expanded environment, or ErrorCode::ConfigError listing the unresolved keys.
[[nodiscard]] auto expandTemplate(const Environment& envTemplate, const Environment& environment)
    -> Result<Environment>;

} // namespace mcphub
