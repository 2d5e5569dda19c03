// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <llm/ProviderConfig.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace toolchat
{

enum class StreamEventKind : std::uint8_t
{
    Text,
    Reasoning,
    Done,
    Error,
};

/// @brief A decoded unit of a provider stream.
struct StreamEvent
{
    StreamEventKind kind = StreamEventKind::Text;
    std::string payload; ///< Fragment text, or the error message for Error.
};

using StreamEventCallback = std::function<void(const StreamEvent& event)>;

/// @brief Everything a provider needs besides the message list.
struct StreamRequest
{
    ModelConfig model;
    ProviderConfig provider;
    std::span<const ToolDefinition> tools; ///< Advertised to providers with structured tool calls.
    std::chrono::milliseconds timeout { 60000 };
};

/// @brief Aggregate of a completed stream.
struct StreamReply
{
    std::string text;      ///< Concatenated text fragments.
    std::string reasoning; ///< Concatenated reasoning fragments.
    std::vector<ToolCallDirective> toolCalls; ///< Structured-field directives, in index order.
    std::string finishReason;
};

/// @brief Incremental completion API of one backend family.
///
/// Events are delivered on the calling thread in send order. Exactly one terminal
/// event (Done or Error) is delivered, and nothing after it.
class ChatProvider
{
  public:
    virtual ~ChatProvider() = default;

    [[nodiscard]] virtual auto stream(std::span<const ConversationMessage> messages,
                                      const StreamRequest& request,
                                      const StreamEventCallback& onEvent) -> Result<StreamReply> = 0;
};

} // namespace toolchat
