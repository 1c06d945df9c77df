// SPDX-License-Identifier: Apache-2.0
#include "ToolRegistry.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <hub/Connection.hpp>

#include <algorithm>
#include <format>
#include <mutex>

namespace mcphub
{

auto ToolMetadata::view() const -> ToolView
{
    return ToolView {
        .name = name,
        .description = description,
        .inputSchema = inputSchema,
        .serverName = ownerServer,
        .transportKind = transportKind,
    };
}

auto ToolRegistry::registerMany(std::string_view serverName,
                                TransportKind kind,
                                const std::shared_ptr<Connection>& connection,
                                std::span<const nlohmann::json> descriptors) -> size_t
{
    auto const endpoint = connection ? connection->endpoint() : std::string {};

    auto entries = std::vector<ToolMetadata> {};
    entries.reserve(descriptors.size());
    for (auto const& descriptor: descriptors)
    {
        auto name = json::getString(descriptor, "name");
        if (!name || name->empty())
        {
            log::debug("Skipping tool descriptor without a name from server '{}'", serverName);
            continue;
        }

        auto schema = descriptor.contains("inputSchema") && descriptor["inputSchema"].is_object()
                          ? descriptor["inputSchema"]
                          : nlohmann::json::object();

        entries.push_back(ToolMetadata {
            .name = std::move(*name),
            .description = json::getStringOr(descriptor, "description", ""),
            .inputSchema = std::move(schema),
            .ownerServer = std::string(serverName),
            .transportKind = kind,
            .endpoint = endpoint,
            .connection = connection,
        });
    }

    auto const lock = std::unique_lock(_mutex);
    for (auto& entry: entries)
    {
        if (auto const existing = _tools.find(entry.name);
            existing != _tools.end() && existing->second.ownerServer != entry.ownerServer)
        {
            log::warning("Tool '{}' of server '{}' replaces the one of server '{}'",
                         entry.name,
                         entry.ownerServer,
                         existing->second.ownerServer);
        }

        log::debug("Registered tool '{}' ({} via {})", entry.name, serverName, transportKindToString(kind));
        auto key = entry.name;
        _tools.insert_or_assign(std::move(key), std::move(entry));
    }
    return entries.size();
}

auto ToolRegistry::removeByServer(std::string_view serverName) -> size_t
{
    auto const lock = std::unique_lock(_mutex);
    return std::erase_if(_tools, [&](auto const& item) { return item.second.ownerServer == serverName; });
}

auto ToolRegistry::lookup(std::string_view toolName) const -> Result<ToolMetadata>
{
    auto const lock = std::shared_lock(_mutex);
    auto const it = _tools.find(toolName);
    if (it == _tools.end())
        return makeError(ErrorCode::NotFound, std::format("Tool '{}' not found", toolName));
    return it->second;
}

auto ToolRegistry::allGroupedByServer() const -> std::map<std::string, std::vector<ToolView>>
{
    auto groups = std::map<std::string, std::vector<ToolView>> {};
    auto const lock = std::shared_lock(_mutex);
    for (auto const& [name, tool]: _tools)
        groups[tool.ownerServer].push_back(tool.view());
    return groups;
}

auto ToolRegistry::list(std::optional<std::string_view> serverFilter) const -> std::vector<ToolView>
{
    auto views = std::vector<ToolView> {};
    auto const lock = std::shared_lock(_mutex);
    for (auto const& [name, tool]: _tools)
    {
        if (!serverFilter || tool.ownerServer == *serverFilter)
            views.push_back(tool.view());
    }
    return views;
}

auto ToolRegistry::countByServer(std::string_view serverName) const -> size_t
{
    auto const lock = std::shared_lock(_mutex);
    return static_cast<size_t>(std::count_if(
        _tools.begin(), _tools.end(), [&](auto const& item) { return item.second.ownerServer == serverName; }));
}

auto ToolRegistry::size() const -> size_t
{
    auto const lock = std::shared_lock(_mutex);
    return _tools.size();
}

} // namespace mcphub
