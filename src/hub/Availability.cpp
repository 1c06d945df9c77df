// SPDX-License-Identifier: Apache-2.0
#include "Availability.hpp"

#include <algorithm>
#include <format>
#include <filesystem>
#include <string_view>

namespace mcphub
{

namespace
{
    constexpr auto AlwaysPresent = std::string_view { "PWD" };

    /// Calls onVariable for every ${NAME} in text and onLiteral for the text between them.
    template <typename OnLiteral, typename OnVariable>
    void scanTemplate(std::string_view text, OnLiteral onLiteral, OnVariable onVariable)
    {
        while (!text.empty())
        {
            auto const open = text.find("${");
            if (open == std::string_view::npos)
                break;
            auto const close = text.find('}', open + 2);
            if (close == std::string_view::npos)
                break;

            onLiteral(text.substr(0, open));
            onVariable(text.substr(open + 2, close - open - 2));
            text.remove_prefix(close + 1);
        }
        onLiteral(text);
    }

    auto isPresent(const Environment& environment, const std::string& key) -> bool
    {
        if (key == AlwaysPresent)
            return true;
        auto const it = environment.find(key);
        return it != environment.end() && !it->second.empty();
    }
} // namespace

auto requiredKeysFromTemplate(const Environment& envTemplate) -> std::vector<std::string>
{
    auto keys = std::vector<std::string> {};
    for (auto const& [name, value]: envTemplate)
    {
        scanTemplate(
            value, [](std::string_view) {}, [&](std::string_view variable) {
                if (!variable.empty() && std::ranges::find(keys, variable) == keys.end())
                    keys.emplace_back(variable);
            });
    }
    return keys;
}

auto checkAvailability(const std::map<std::string, std::vector<std::string>>& requiredKeysPerServer,
                       const Environment& environment) -> std::map<std::string, Availability>
{
    auto report = std::map<std::string, Availability> {};
    for (auto const& [server, keys]: requiredKeysPerServer)
    {
        auto availability = Availability {};
        for (auto const& key: keys)
        {
            if (!isPresent(environment, key))
                availability.missingKeys.push_back(key);
        }
        availability.available = availability.missingKeys.empty();
        report.emplace(server, std::move(availability));
    }
    return report;
}

auto expandTemplate(const Environment& envTemplate, const Environment& environment) -> Result<Environment>
{
    auto expanded = Environment {};
    auto missing = std::vector<std::string> {};

    for (auto const& [name, value]: envTemplate)
    {
        auto text = std::string {};
        scanTemplate(
            value,
            [&](std::string_view literal) { text += literal; },
            [&](std::string_view variable) {
                auto const key = std::string(variable);
                auto const it = environment.find(key);
                if (it != environment.end() && !it->second.empty())
                    text += it->second;
                else if (key == AlwaysPresent)
                {
                    auto ec = std::error_code {};
                    text += std::filesystem::current_path(ec).string();
                }
                else if (std::ranges::find(missing, key) == missing.end())
                    missing.push_back(key);
            });
        expanded.emplace(name, std::move(text));
    }

    if (!missing.empty())
    {
        auto list = std::string {};
        for (auto const& key: missing)
            list += (list.empty() ? "" : ", ") + key;
        return makeError(ErrorCode::ConfigError, std::format("Missing environment values: {}", list));
    }
    return expanded;
}

} // namespace mcphub
