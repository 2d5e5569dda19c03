// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <llm/ChatProvider.hpp>
#include <llm/HttpClient.hpp>
#include <llm/SseDecoder.hpp>

#include <map>
#include <optional>
#include <string>

namespace toolchat
{

/// @brief Common driver for providers speaking JSON over an SSE response.
///
/// Subclasses build the request and interpret decoded events; the base owns the
/// deadline, the single terminal event, and the aggregation into a StreamReply.
class HttpChatProvider: public ChatProvider
{
  public:
    explicit HttpChatProvider(HttpClient& http);

    [[nodiscard]] auto stream(std::span<const ConversationMessage> messages,
                              const StreamRequest& request,
                              const StreamEventCallback& onEvent) -> Result<StreamReply> override;

  protected:
    /// @brief A structured tool call whose argument text is still arriving.
    struct PartialToolCall
    {
        std::string id;
        std::string name;
        std::string arguments;
    };

    /// @brief Per-request state handed to handleEvent().
    class StreamState
    {
      public:
        explicit StreamState(const StreamEventCallback& onEvent);

        void text(std::string_view fragment);
        void reasoning(std::string_view fragment);
        void done(std::string finishReason = {});
        void setFinishReason(std::string finishReason) { _reply.finishReason = std::move(finishReason); }
        void fail(Error error);

        /// @brief Returns the tool call accumulating at @p index, creating it on first use.
        [[nodiscard]] auto toolCall(int index) -> PartialToolCall&;

        [[nodiscard]] auto finished() const noexcept -> bool { return _finished; }
        [[nodiscard]] auto error() const -> const std::optional<Error>& { return _error; }

        /// @brief Moves the aggregate out, parsing the accumulated tool-call arguments.
        [[nodiscard]] auto takeReply() -> StreamReply;

      private:
        const StreamEventCallback& _onEvent;
        StreamReply _reply;
        std::map<int, PartialToolCall> _toolCalls;
        std::optional<Error> _error;
        bool _finished = false;
    };

    [[nodiscard]] virtual auto buildRequest(std::span<const ConversationMessage> messages,
                                            const StreamRequest& request) const -> Result<HttpRequest> = 0;

    /// @brief Interprets one SSE event; signals the end through state.done() or state.fail().
    virtual void handleEvent(const SseEvent& event, StreamState& state) = 0;

    /// @brief Joins a base URL and a path without doubling the slash.
    [[nodiscard]] static auto joinUrl(std::string_view baseUrl, std::string_view path) -> std::string;

  private:
    HttpClient& _http;
};

} // namespace toolchat
