// SPDX-License-Identifier: Apache-2.0
#include "CurlHttpClient.hpp"

#include <core/Log.hpp>

#include <curl/curl.h>

#include <array>
#include <cstring>
#include <format>
#include <memory>
#include <mutex>

namespace mcphub
{

namespace
{
    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
    using CurlHeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

    std::once_flag curlInitFlag;

    /// Accumulates a response body for buffered requests.
    auto bufferCallback(char* data, size_t size, size_t count, void* userData) -> size_t
    {
        auto* body = static_cast<std::string*>(userData);
        body->append(data, size * count);
        return size * count;
    }

    struct StreamState
    {
        const LineHandler* onLine = nullptr;
        std::string pending;
        bool stopped = false;
    };

    /// Splits the streamed body into lines. Returning 0 makes curl abort the transfer.
    auto streamCallback(char* data, size_t size, size_t count, void* userData) -> size_t
    {
        auto* state = static_cast<StreamState*>(userData);
        auto const length = size * count;
        if (state->stopped)
            return 0;

        state->pending.append(data, length);

        size_t start = 0;
        while (true)
        {
            auto const newline = state->pending.find('\n', start);
            if (newline == std::string::npos)
                break;

            auto line = std::string_view(state->pending).substr(start, newline - start);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);
            start = newline + 1;

            if (!(*state->onLine)(line))
            {
                state->stopped = true;
                return 0;
            }
        }
        state->pending.erase(0, start);
        return length;
    }

    struct HeaderState
    {
        bool informational = false;
        bool complete = false;
    };

    /// Aborts the transfer once the final header block has been received.
    auto headerCallback(char* data, size_t size, size_t count, void* userData) -> size_t
    {
        auto* state = static_cast<HeaderState*>(userData);
        auto const line = std::string_view(data, size * count);

        if (line.starts_with("HTTP/"))
        {
            auto const code = line.find(' ');
            state->informational = code != std::string_view::npos && line.substr(code + 1).starts_with('1');
        }
        else if ((line == "\r\n" || line == "\n") && !state->informational)
        {
            state->complete = true;
            return 0;
        }
        return size * count;
    }

    struct Request
    {
        const std::string& url;
        const std::string* body = nullptr;
        const HttpHeaders& headers;
        std::chrono::milliseconds timeout;
        curl_write_callback writer = nullptr;
        void* writerData = nullptr;
        HeaderState* headerState = nullptr;
    };

    auto perform(const Request& request, const StreamState* stream = nullptr) -> Result<long>
    {
        if (request.timeout <= std::chrono::milliseconds::zero())
            return makeError(ErrorCode::Timeout, std::format("No time left to request {}", request.url));

        auto handle = CurlHandle(curl_easy_init(), &curl_easy_cleanup);
        if (!handle)
            return makeError(ErrorCode::TransportError, "Failed to create curl handle");

        auto headerList = CurlHeaderList(nullptr, &curl_slist_free_all);
        for (auto const& header: request.headers)
        {
            auto* appended = curl_slist_append(headerList.get(), header.c_str());
            if (!appended)
                return makeError(ErrorCode::TransportError, "Failed to build request headers");
            if (!headerList)
                headerList.reset(appended);
        }

        auto errorBuffer = std::array<char, CURL_ERROR_SIZE> {};
        auto* curl = handle.get();
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer.data());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, request.writer);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, request.writerData);
        if (headerList)
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList.get());
        if (request.headerState)
        {
            curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &headerCallback);
            curl_easy_setopt(curl, CURLOPT_HEADERDATA, request.headerState);
        }

        if (request.body)
        {
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body->c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body->size()));
        }

        auto const code = curl_easy_perform(curl);
        auto const stoppedByHandler = code == CURLE_WRITE_ERROR
                                      && ((stream && stream->stopped)
                                          || (request.headerState && request.headerState->complete));
        if (code != CURLE_OK && !stoppedByHandler)
        {
            auto const detail = std::strlen(errorBuffer.data()) > 0 ? std::string(errorBuffer.data())
                                                                     : std::string(curl_easy_strerror(code));
            if (code == CURLE_OPERATION_TIMEDOUT)
                return makeError(ErrorCode::Timeout, std::format("Request to {} timed out: {}", request.url, detail));
            return makeError(ErrorCode::TransportError, std::format("Request to {} failed: {}", request.url, detail));
        }

        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        log::trace("HTTP {} {} -> {}", request.body ? "POST" : "GET", request.url, status);
        return status;
    }

} // namespace

CurlHttpClient::CurlHttpClient()
{
    std::call_once(curlInitFlag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlHttpClient::~CurlHttpClient() = default;

auto CurlHttpClient::get(const std::string& url, const HttpHeaders& headers, std::chrono::milliseconds timeout)
    -> Result<HttpResponse>
{
    auto response = HttpResponse {};
    auto status = perform(Request {
        .url = url,
        .body = nullptr,
        .headers = headers,
        .timeout = timeout,
        .writer = &bufferCallback,
        .writerData = &response.body,
    });
    if (!status)
        return std::unexpected(status.error());
    response.status = *status;
    return response;
}

auto CurlHttpClient::probe(const std::string& url, const HttpHeaders& headers, std::chrono::milliseconds timeout)
    -> Result<long>
{
    auto ignored = std::string {};
    auto headerState = HeaderState {};
    return perform(Request {
        .url = url,
        .body = nullptr,
        .headers = headers,
        .timeout = timeout,
        .writer = &bufferCallback,
        .writerData = &ignored,
        .headerState = &headerState,
    });
}

auto CurlHttpClient::post(const std::string& url,
                          const std::string& body,
                          const HttpHeaders& headers,
                          std::chrono::milliseconds timeout) -> Result<HttpResponse>
{
    auto response = HttpResponse {};
    auto status = perform(Request {
        .url = url,
        .body = &body,
        .headers = headers,
        .timeout = timeout,
        .writer = &bufferCallback,
        .writerData = &response.body,
    });
    if (!status)
        return std::unexpected(status.error());
    response.status = *status;
    return response;
}

auto CurlHttpClient::postStream(const std::string& url,
                                const std::string& body,
                                const HttpHeaders& headers,
                                std::chrono::milliseconds timeout,
                                const LineHandler& onLine) -> Result<long>
{
    auto state = StreamState { .onLine = &onLine };
    auto status = perform(
        Request {
            .url = url,
            .body = &body,
            .headers = headers,
            .timeout = timeout,
            .writer = &streamCallback,
            .writerData = &state,
        },
        &state);
    if (!status)
        return status;

    // A final line without terminator.
    if (!state.stopped && !state.pending.empty())
    {
        auto line = std::string_view(state.pending);
        if (line.back() == '\r')
            line.remove_suffix(1);
        onLine(line);
    }
    return status;
}

} // namespace mcphub
