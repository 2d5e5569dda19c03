// SPDX-License-Identifier: Apache-2.0
#include "CurlHttpClient.hpp"

#include <core/Log.hpp>

#include <curl/curl.h>

#include <cstdlib>
#include <format>
#include <memory>
#include <mutex>

namespace toolchat
{

namespace
{

    struct TransferState
    {
        CURL* handle = nullptr;
        const ByteSink* sink = nullptr;
        long status = 0;
        std::string errorBody;
        bool stoppedBySink = false;
    };

    auto writeCallback(char* data, size_t size, size_t count, void* userData) -> size_t
    {
        auto& state = *static_cast<TransferState*>(userData);
        auto const total = size * count;

        if (state.status == 0)
            curl_easy_getinfo(state.handle, CURLINFO_RESPONSE_CODE, &state.status);

        if (state.status < 200 || state.status >= 300)
        {
            state.errorBody.append(data, total);
            return total;
        }

        if (!(*state.sink)(std::string_view(data, total)))
        {
            state.stoppedBySink = true;
            return 0; // makes curl abort with CURLE_WRITE_ERROR
        }
        return total;
    }

    struct CurlHandleDeleter
    {
        void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
    };

    struct HeaderListDeleter
    {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };

    std::once_flag globalInitFlag;

} // namespace

CurlHttpClient::CurlHttpClient()
{
    std::call_once(globalInitFlag, [] {
        curl_global_init(CURL_GLOBAL_ALL);
        std::atexit(curl_global_cleanup);
    });
}

auto CurlHttpClient::postStream(const HttpRequest& request, const ByteSink& sink) -> VoidResult
{
    auto handle = std::unique_ptr<CURL, CurlHandleDeleter>(curl_easy_init());
    if (!handle)
        return makeError(ErrorCode::TransportError, "Failed to initialize HTTP client");

    curl_slist* headerList = nullptr;
    for (const auto& [name, value]: request.headers)
    {
        auto const line = std::format("{}: {}", name, value);
        auto* appended = curl_slist_append(headerList, line.c_str());
        if (!appended)
        {
            curl_slist_free_all(headerList);
            return makeError(ErrorCode::TransportError, "Failed to build request headers");
        }
        headerList = appended;
    }
    auto const headers = std::unique_ptr<curl_slist, HeaderListDeleter>(headerList);

    auto state = TransferState { .handle = handle.get(), .sink = &sink };

    curl_easy_setopt(handle.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);

    log::debug("POST {} ({} bytes)", request.url, request.body.size());
    auto const code = curl_easy_perform(handle.get());

    if (state.stoppedBySink)
        return {};

    if (code == CURLE_OPERATION_TIMEDOUT)
        return makeError(ErrorCode::TimeoutError,
                         std::format("Request timed out after {}ms", request.timeout.count()));

    if (code != CURLE_OK)
        return makeError(ErrorCode::TransportError,
                         std::format("HTTP request failed: {}", curl_easy_strerror(code)));

    if (state.status == 0)
        curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &state.status);

    if (state.status < 200 || state.status >= 300)
        return makeError(ErrorCode::TransportError,
                         std::format("API request failed ({}): {}", state.status, state.errorBody));

    return {};
}

} // namespace toolchat
