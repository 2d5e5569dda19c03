// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <llm/HttpChatProvider.hpp>

#include <nlohmann/json.hpp>

namespace toolchat
{

constexpr auto AnthropicApiVersion = "2023-06-01";
constexpr auto AnthropicDefaultMaxTokens = 4096;

/// @brief Provider for the Anthropic messages API.
class AnthropicProvider: public HttpChatProvider
{
  public:
    using HttpChatProvider::HttpChatProvider;

    /// @brief Builds the request body: system messages are lifted into "system",
    /// tool results are sent as user turns.
    [[nodiscard]] static auto buildBody(std::span<const ConversationMessage> messages, const ModelConfig& model)
        -> nlohmann::json;

  protected:
    [[nodiscard]] auto buildRequest(std::span<const ConversationMessage> messages,
                                    const StreamRequest& request) const -> Result<HttpRequest> override;

    void handleEvent(const SseEvent& event, StreamState& state) override;
};

} // namespace toolchat
