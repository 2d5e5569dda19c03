// SPDX-License-Identifier: Apache-2.0
#include "Types.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace toolchat
{

auto callIdentity(std::string_view toolName, const nlohmann::json& parameters) -> std::string
{
    return std::format("{}|{}", toolName, json::canonical(parameters));
}

auto toJson(const ConversationMessage& message) -> nlohmann::json
{
    auto value = nlohmann::json {
        { "role", roleToString(message.role) },
        { "content", message.content },
    };

    if (!message.toolCallId.empty())
        value["toolCallId"] = message.toolCallId;

    if (!message.toolCalls.empty())
    {
        auto calls = nlohmann::json::array();
        for (const auto& call: message.toolCalls)
        {
            calls.push_back(nlohmann::json {
                { "id", call.id },
                { "toolName", call.toolName },
                { "parameters", call.parameters },
            });
        }
        value["toolCalls"] = std::move(calls);
    }

    return value;
}

auto messageFromJson(const nlohmann::json& value) -> ConversationMessage
{
    auto message = ConversationMessage {
        .role = roleFromString(json::getStringOr(value, "role", "user")),
        .content = json::getStringOr(value, "content", ""),
        .toolCallId = json::getStringOr(value, "toolCallId", ""),
        .toolCalls = {},
    };

    if (value.contains("toolCalls") && value["toolCalls"].is_array())
    {
        for (const auto& call: value["toolCalls"])
        {
            if (!call.is_object())
                continue;
            auto parameters = call.value("parameters", nlohmann::json::object());
            message.toolCalls.push_back(ToolCallDirective {
                .id = json::getStringOr(call, "id", ""),
                .toolName = json::getStringOr(call, "toolName", ""),
                .parameters = parameters.is_object() ? std::move(parameters) : nlohmann::json::object(),
            });
        }
    }

    return message;
}

} // namespace toolchat
