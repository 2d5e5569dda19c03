// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <llm/ChatProvider.hpp>
#include <llm/HttpClient.hpp>
#include <llm/ProviderConfig.hpp>

#include <memory>
#include <string>

namespace toolchat
{

/// @brief Returns the endpoint used when a provider config leaves baseUrl empty.
[[nodiscard]] auto defaultBaseUrl(ProviderType type) -> std::string;

/// @brief Creates the provider implementation for a wire-format family.
/// @param http Transport shared by the provider; must outlive it.
[[nodiscard]] auto makeProvider(ProviderType type, HttpClient& http) -> std::unique_ptr<ChatProvider>;

} // namespace toolchat
