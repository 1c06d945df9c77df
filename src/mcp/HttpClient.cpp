// SPDX-License-Identifier: Apache-2.0
#include "HttpClient.hpp"

#include <format>

namespace mcphub
{

auto joinUrl(std::string_view baseUrl, std::string_view path) -> std::string
{
    while (!baseUrl.empty() && baseUrl.back() == '/')
        baseUrl.remove_suffix(1);
    if (path.empty())
        return std::string(baseUrl);
    if (path.front() == '/')
        return std::format("{}{}", baseUrl, path);
    return std::format("{}/{}", baseUrl, path);
}

} // namespace mcphub
