// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace toolchat
{

/// @brief Message history and stream bookkeeping of one turn.
///
/// Owned by the orchestrator for the duration of the turn; the message list is
/// append-only and is resent to the provider on every iteration.
class StreamSession
{
  public:
    /// @brief Starts a session on top of prior context (system prompt, history, attachments).
    explicit StreamSession(std::vector<ConversationMessage> context = {});

    void addUserMessage(std::string content);
    void addAssistantMessage(std::string content, std::vector<ToolCallDirective> toolCalls = {});
    void addToolResult(std::string callId, std::string content);

    [[nodiscard]] auto messages() const noexcept -> const std::vector<ConversationMessage>& { return _messages; }
    [[nodiscard]] auto takeMessages() -> std::vector<ConversationMessage> { return std::move(_messages); }

    /// @brief Counts a new stream call and clears the previous stream's text.
    void beginIteration();

    /// @brief Records the outcome of the current stream call.
    void recordStream(std::string rawText, std::optional<std::size_t> suppressedSinceIndex);

    [[nodiscard]] auto iterationCount() const noexcept -> int { return _iterationCount; }
    [[nodiscard]] auto accumulatedText() const noexcept -> const std::string& { return _accumulatedText; }
    [[nodiscard]] auto suppressedSinceIndex() const noexcept -> std::optional<std::size_t>
    {
        return _suppressedSinceIndex;
    }

  private:
    std::vector<ConversationMessage> _messages;
    int _iterationCount = 0;
    std::string _accumulatedText;
    std::optional<std::size_t> _suppressedSinceIndex;
};

} // namespace toolchat
