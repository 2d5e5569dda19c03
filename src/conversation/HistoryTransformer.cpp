// SPDX-License-Identifier: Apache-2.0
#include "HistoryTransformer.hpp"

#include <agent/DirectiveParser.hpp>
#include <agent/MarkerSniffer.hpp>
#include <agent/ToolResultText.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <iterator>

namespace toolchat
{

namespace
{

    struct PendingCall
    {
        std::string id;
        ToolCallResult card;
    };

    auto assistantMessage(std::string content, std::optional<ToolCallResult> toolCall = std::nullopt) -> DisplayMessage
    {
        return DisplayMessage {
            .role = Role::Assistant,
            .content = std::move(content),
            .reasoning = std::nullopt,
            .toolCall = std::move(toolCall),
        };
    }

} // namespace

HistoryTransformer::HistoryTransformer(std::vector<std::string> sentinels): _sentinels(std::move(sentinels))
{
}

auto HistoryTransformer::transform(std::span<const ConversationMessage> messages) const -> std::vector<DisplayMessage>
{
    auto result = std::vector<DisplayMessage> {};
    auto pending = std::vector<PendingCall> {};

    for (const auto& message: messages)
    {
        switch (message.role)
        {
            case Role::System: break;

            case Role::User:
                result.push_back(DisplayMessage {
                    .role = Role::User,
                    .content = message.content,
                    .reasoning = std::nullopt,
                    .toolCall = std::nullopt,
                });
                break;

            case Role::Assistant: {
                auto const directives = collectDirectives(message.toolCalls, message.content);
                if (directives.empty())
                {
                    result.push_back(assistantMessage(message.content));
                    break;
                }

                // Show what the display saw while streaming: the prose before the first directive.
                auto sniffer = MarkerSniffer(_sentinels);
                auto prose = sniffer.feed(message.content);
                prose += sniffer.finish();
                if (!prose.empty())
                    result.push_back(assistantMessage(std::move(prose)));

                for (const auto& directive: directives)
                {
                    pending.push_back(PendingCall {
                        .id = directive.id,
                        .card = ToolCallResult {
                            .toolName = directive.toolName,
                            .parameters = directive.parameters,
                            .status = ToolStatus::Executing,
                            .result = std::nullopt,
                            .error = std::nullopt,
                            .executionTimeMs = std::nullopt,
                        },
                    });
                }
                break;
            }

            case Role::Tool: {
                // Inline ids restart at call_0 every reply, so the latest match wins.
                auto const match = std::find_if(pending.rbegin(), pending.rend(), [&](const PendingCall& p) {
                    return p.id == message.toolCallId;
                });
                if (message.toolCallId.empty() || match == pending.rend())
                {
                    log::debug("No pending tool call for result id '{}'", message.toolCallId);
                    break;
                }

                auto const it = std::next(match).base();
                auto parsed = parseToolResultMessage(message.content);
                auto card = std::move(it->card);
                card.status = parsed.status;
                card.result = std::move(parsed.result);
                card.error = std::move(parsed.error);
                card.executionTimeMs = parsed.executionTimeMs;
                pending.erase(it);

                result.push_back(assistantMessage({}, std::move(card)));
                break;
            }
        }
    }

    for (auto& call: pending)
        result.push_back(assistantMessage({}, std::move(call.card)));

    return result;
}

} // namespace toolchat
