// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <llm/HttpClient.hpp>

namespace toolchat
{

/// @brief HttpClient backed by libcurl's easy interface.
///
/// Each call uses its own easy handle, so one instance may serve several turns.
class CurlHttpClient: public HttpClient
{
  public:
    CurlHttpClient();

    [[nodiscard]] auto postStream(const HttpRequest& request, const ByteSink& sink) -> VoidResult override;
};

} // namespace toolchat
