// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

/// Accessors for loosely typed JSON documents (config files, tool descriptors,
/// backend replies). A missing member and a member of the wrong type are treated alike.
namespace mcphub::json
{

/// @brief Parses a JSON document.
/// @return The document, or ErrorCode::ProtocolError describing the syntax error.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    auto document = nlohmann::json::parse(input, nullptr, false);
    if (document.is_discarded())
        return makeError(ErrorCode::ProtocolError,
                         std::format("Malformed JSON ({} bytes): {}", input.size(), input.substr(0, 80)));
    return document;
}

/// @brief Returns the member of an object, or nullptr if obj is no object or lacks it.
[[nodiscard]] inline auto member(const nlohmann::json& obj, std::string_view key) -> const nlohmann::json*
{
    if (!obj.is_object())
        return nullptr;
    auto const it = obj.find(std::string(key));
    return it == obj.end() ? nullptr : &*it;
}

/// @brief Extracts a required string member.
/// @return The value, or ErrorCode::ProtocolError.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto const* value = member(obj, key);
    if (!value || !value->is_string())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid string field: {}", key));
    return value->get<std::string>();
}

[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj, std::string_view key, std::string_view fallback)
    -> std::string
{
    auto const* value = member(obj, key);
    return value && value->is_string() ? value->get<std::string>() : std::string(fallback);
}

[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int fallback) -> int
{
    auto const* value = member(obj, key);
    return value && value->is_number_integer() ? value->get<int>() : fallback;
}

/// @brief Extracts an array of strings; non-string elements are skipped.
[[nodiscard]] inline auto getStringList(const nlohmann::json& obj, std::string_view key)
    -> std::vector<std::string>
{
    auto values = std::vector<std::string> {};
    auto const* array = member(obj, key);
    if (!array || !array->is_array())
        return values;

    for (auto const& item: *array)
    {
        if (item.is_string())
            values.push_back(item.get<std::string>());
    }
    return values;
}

/// @brief Extracts an object of string values; non-string members are skipped.
[[nodiscard]] inline auto getStringMap(const nlohmann::json& obj, std::string_view key)
    -> std::map<std::string, std::string>
{
    auto values = std::map<std::string, std::string> {};
    auto const* object = member(obj, key);
    if (!object || !object->is_object())
        return values;

    for (auto const& [name, value]: object->items())
    {
        if (value.is_string())
            values.emplace(name, value.get<std::string>());
    }
    return values;
}

} // namespace mcphub::json
