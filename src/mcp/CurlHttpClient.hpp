// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/HttpClient.hpp>

namespace mcphub
{

/// @brief HttpClient backed by libcurl easy handles (one handle per request).
class CurlHttpClient: public HttpClient
{
  public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    [[nodiscard]] auto get(const std::string& url, const HttpHeaders& headers, std::chrono::milliseconds timeout)
        -> Result<HttpResponse> override;

    [[nodiscard]] auto probe(const std::string& url, const HttpHeaders& headers, std::chrono::milliseconds timeout)
        -> Result<long> override;

    [[nodiscard]] auto post(const std::string& url,
                            const std::string& body,
                            const HttpHeaders& headers,
                            std::chrono::milliseconds timeout) -> Result<HttpResponse> override;

    [[nodiscard]] auto postStream(const std::string& url,
                                  const std::string& body,
                                  const HttpHeaders& headers,
                                  std::chrono::milliseconds timeout,
                                  const LineHandler& onLine) -> Result<long> override;
};

} // namespace mcphub
