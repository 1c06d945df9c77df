// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief Request headers, each formatted as "Name: value".
using HttpHeaders = std::vector<std::string>;

/// @brief A complete HTTP response.
struct HttpResponse
{
    long status = 0;
    std::string body;
};

/// @brief Receives one line of a streamed response body (without line terminator).
/// @return False to stop reading the stream.
using LineHandler = std::function<bool(std::string_view line)>;

/// @brief Minimal blocking HTTP client used by the HTTP and SSE transports.
///
/// Every call opens its own request, so one client may be shared by
/// concurrent callers. Network failures are reported as ErrorCode::TransportError,
/// exceeded timeouts as ErrorCode::Timeout; any HTTP status is a successful result.
class HttpClient
{
  public:
    virtual ~HttpClient() = default;

    /// @brief Issues a GET request.
    [[nodiscard]] virtual auto get(const std::string& url,
                                   const HttpHeaders& headers,
                                   std::chrono::milliseconds timeout) -> Result<HttpResponse> = 0;

    /// @brief Issues a GET request and returns its status as soon as the response headers arrived.
    ///
    /// The body is not read, so endpoints answering with an endless event stream can be probed.
    [[nodiscard]] virtual auto probe(const std::string& url,
                                     const HttpHeaders& headers,
                                     std::chrono::milliseconds timeout) -> Result<long> = 0;

    /// @brief Issues a POST request and buffers the whole response body.
    [[nodiscard]] virtual auto post(const std::string& url,
                                    const std::string& body,
                                    const HttpHeaders& headers,
                                    std::chrono::milliseconds timeout) -> Result<HttpResponse> = 0;

    /// @brief Issues a POST request and delivers the response body line by line.
    /// @param onLine Called for every line as it arrives; returning false ends the request early.
    /// @return The HTTP status code.
    [[nodiscard]] virtual auto postStream(const std::string& url,
                                          const std::string& body,
                                          const HttpHeaders& headers,
                                          std::chrono::milliseconds timeout,
                                          const LineHandler& onLine) -> Result<long> = 0;
};

/// @brief Joins a base URL and a path with exactly one slash between them.
[[nodiscard]] auto joinUrl(std::string_view baseUrl, std::string_view path) -> std::string;

} // namespace mcphub
