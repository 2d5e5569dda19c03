// SPDX-License-Identifier: Apache-2.0
#include "MessageReconstructor.hpp"

#include <core/Log.hpp>

#include <cstddef>

namespace toolchat
{

MessageReconstructor::MessageReconstructor(Notifier notifier): _notifier(std::move(notifier))
{
}

void MessageReconstructor::load(std::vector<DisplayMessage> messages)
{
    clear();
    _messages = std::move(messages);
}

void MessageReconstructor::clear()
{
    _messages.clear();
    _toolCards.clear();
    _streaming = false;
}

void MessageReconstructor::userMessage(std::string_view text)
{
    _streaming = false;
    _messages.push_back(DisplayMessage { .role = Role::User, .content = std::string(text), .reasoning = {}, .toolCall = {} });
}

auto MessageReconstructor::streamingSlot() -> DisplayMessage&
{
    auto const lastIsProse =
        !_messages.empty() && _messages.back().role == Role::Assistant && !_messages.back().isToolCard();

    // Prose continues in the last assistant message unless a tool card or user message ended it.
    if (!lastIsProse)
        _messages.push_back(DisplayMessage { .role = Role::Assistant, .content = {}, .reasoning = {}, .toolCall = {} });

    _streaming = true;
    return _messages.back();
}

void MessageReconstructor::chunk(std::string_view text)
{
    streamingSlot().content.append(text);
}

void MessageReconstructor::reasoning(std::string_view text)
{
    auto& slot = streamingSlot();
    if (!slot.reasoning)
        slot.reasoning.emplace();
    slot.reasoning->append(text);
}

void MessageReconstructor::complete()
{
    _streaming = false;
}

void MessageReconstructor::error(std::string_view message)
{
    _streaming = false;

    for (auto i = _messages.size(); i > 0; --i)
    {
        if (_messages[i - 1].role != Role::User)
            continue;

        auto const removed = i - 1;
        _messages.erase(_messages.begin() + static_cast<std::ptrdiff_t>(removed));
        for (auto& [identity, index]: _toolCards)
        {
            if (index > removed)
                --index;
        }
        break;
    }

    log::debug("Turn failed: {}", message);
    if (_notifier)
        _notifier(message);
}

void MessageReconstructor::toolStarted(std::string_view toolName, const nlohmann::json& parameters)
{
    _messages.push_back(DisplayMessage {
        .role = Role::Assistant,
        .content = {},
        .reasoning = {},
        .toolCall = ToolCallResult {
            .toolName = std::string(toolName),
            .parameters = parameters,
            .status = ToolStatus::Executing,
            .result = std::nullopt,
            .error = std::nullopt,
            .executionTimeMs = std::nullopt,
        },
    });
    _toolCards[callIdentity(toolName, parameters)] = _messages.size() - 1;
}

auto MessageReconstructor::trackedCard(std::string_view toolName, const nlohmann::json& parameters)
    -> ToolCallResult*
{
    auto const it = _toolCards.find(callIdentity(toolName, parameters));
    if (it == _toolCards.end() || it->second >= _messages.size())
        return nullptr;

    auto& card = _messages[it->second].toolCall;
    if (!card || card->isTerminal())
        return nullptr;
    return &*card;
}

void MessageReconstructor::toolCompleted(std::string_view toolName,
                                         const nlohmann::json& parameters,
                                         const nlohmann::json& result,
                                         int64_t executionTimeMs)
{
    if (auto* card = trackedCard(toolName, parameters))
    {
        card->status = ToolStatus::Completed;
        card->result = result;
        card->executionTimeMs = executionTimeMs;
    }
}

void MessageReconstructor::toolFailed(std::string_view toolName,
                                      const nlohmann::json& parameters,
                                      std::string_view error)
{
    if (auto* card = trackedCard(toolName, parameters))
    {
        card->status = ToolStatus::Failed;
        card->error = std::string(error);
    }
}

} // namespace toolchat
