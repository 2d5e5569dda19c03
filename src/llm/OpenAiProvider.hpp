// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <llm/HttpChatProvider.hpp>

#include <nlohmann/json.hpp>

namespace toolchat
{

/// @brief Provider for the OpenAI chat-completions wire format (also Azure and custom endpoints).
class OpenAiProvider: public HttpChatProvider
{
  public:
    using HttpChatProvider::HttpChatProvider;

    /// @brief Maps the conversation to chat-completions messages.
    ///
    /// A tool-role message is sent as role "tool" only when it answers a structured
    /// call of the preceding assistant message; otherwise it is sent as a user message.
    [[nodiscard]] static auto mapMessages(std::span<const ConversationMessage> messages) -> nlohmann::json;

  protected:
    [[nodiscard]] auto buildRequest(std::span<const ConversationMessage> messages,
                                    const StreamRequest& request) const -> Result<HttpRequest> override;

    void handleEvent(const SseEvent& event, StreamState& state) override;

    /// @brief Hook for subclasses adding fields to the request body.
    virtual void decorateBody(nlohmann::json& body, const StreamRequest& request) const;
};

/// @brief GLM backend: OpenAI wire format with tools advertised as functions.
class GlmProvider: public OpenAiProvider
{
  public:
    using OpenAiProvider::OpenAiProvider;

  protected:
    void decorateBody(nlohmann::json& body, const StreamRequest& request) const override;
};

} // namespace toolchat
