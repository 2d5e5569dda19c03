// SPDX-License-Identifier: Apache-2.0
#include "StreamSession.hpp"

#include <utility>

namespace toolchat
{

StreamSession::StreamSession(std::vector<ConversationMessage> context): _messages(std::move(context))
{
}

void StreamSession::addUserMessage(std::string content)
{
    _messages.push_back(ConversationMessage {
        .role = Role::User,
        .content = std::move(content),
        .toolCallId = {},
        .toolCalls = {},
    });
}

void StreamSession::addAssistantMessage(std::string content, std::vector<ToolCallDirective> toolCalls)
{
    _messages.push_back(ConversationMessage {
        .role = Role::Assistant,
        .content = std::move(content),
        .toolCallId = {},
        .toolCalls = std::move(toolCalls),
    });
}

void StreamSession::addToolResult(std::string callId, std::string content)
{
    _messages.push_back(ConversationMessage {
        .role = Role::Tool,
        .content = std::move(content),
        .toolCallId = std::move(callId),
        .toolCalls = {},
    });
}

void StreamSession::beginIteration()
{
    ++_iterationCount;
    _accumulatedText.clear();
    _suppressedSinceIndex.reset();
}

void StreamSession::recordStream(std::string rawText, std::optional<std::size_t> suppressedSinceIndex)
{
    _accumulatedText = std::move(rawText);
    _suppressedSinceIndex = suppressedSinceIndex;
}

} // namespace toolchat
