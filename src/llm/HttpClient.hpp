// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace toolchat
{

/// @brief A streaming POST request.
struct HttpRequest
{
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::chrono::milliseconds timeout { 60000 };
};

/// @brief Receives response body bytes in arrival order.
/// @return false to stop the transfer; no further bytes are delivered afterwards.
using ByteSink = std::function<bool(std::string_view bytes)>;

/// @brief Abstract HTTP transport used by the chat providers.
class HttpClient
{
  public:
    virtual ~HttpClient() = default;

    /// @brief Performs a POST and streams the 2xx response body into @p sink.
    ///
    /// A non-2xx status is reported as TransportError carrying the response body;
    /// exceeding the request timeout is reported as TimeoutError. A transfer stopped
    /// by the sink is a success.
    [[nodiscard]] virtual auto postStream(const HttpRequest& request, const ByteSink& sink) -> VoidResult = 0;
};

} // namespace toolchat
