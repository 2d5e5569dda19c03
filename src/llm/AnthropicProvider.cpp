// SPDX-License-Identifier: Apache-2.0
#include "AnthropicProvider.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <llm/ProviderFactory.hpp>

#include <format>

namespace toolchat
{

auto AnthropicProvider::buildBody(std::span<const ConversationMessage> messages, const ModelConfig& model)
    -> nlohmann::json
{
    auto system = std::string {};
    auto turns = nlohmann::json::array();

    for (const auto& message: messages)
    {
        if (message.role == Role::System)
        {
            if (!system.empty())
                system += "\n\n";
            system += message.content;
            continue;
        }

        auto const role = message.role == Role::Assistant ? "assistant" : "user";
        auto content = message.content;
        if (content.empty() && !message.toolCalls.empty())
        {
            // Replay structured calls as text; tool_use blocks would require tool_result answers.
            for (const auto& call: message.toolCalls)
            {
                auto const directive = nlohmann::json { { "toolname", call.toolName }, { "parameters", call.parameters } };
                content += std::format("<tool_call>{}</tool_call>", json::canonical(directive));
            }
        }
        turns.push_back({ { "role", role }, { "content", std::move(content) } });
    }

    auto body = nlohmann::json {
        { "model", model.model },
        { "messages", std::move(turns) },
        { "max_tokens", model.maxTokens.value_or(AnthropicDefaultMaxTokens) },
        { "stream", true },
    };
    if (!system.empty())
        body["system"] = system;
    if (model.temperature)
        body["temperature"] = *model.temperature;
    if (model.topP)
        body["top_p"] = *model.topP;
    if (model.extra.is_object())
        body.update(model.extra);
    return body;
}

auto AnthropicProvider::buildRequest(std::span<const ConversationMessage> messages,
                                     const StreamRequest& request) const -> Result<HttpRequest>
{
    if (request.model.model.empty())
        return makeError(ErrorCode::ConfigError, std::format("Model config \"{}\" has no model name", request.model.id));

    auto const baseUrl =
        request.provider.baseUrl.empty() ? defaultBaseUrl(request.provider.type) : request.provider.baseUrl;

    return HttpRequest {
        .url = joinUrl(baseUrl, "/v1/messages"),
        .headers = {
            { "Content-Type", "application/json" },
            { "Accept", "text/event-stream" },
            { "x-api-key", request.provider.apiKey },
            { "anthropic-version", AnthropicApiVersion },
        },
        .body = json::canonical(buildBody(messages, request.model)),
    };
}

void AnthropicProvider::handleEvent(const SseEvent& event, StreamState& state)
{
    auto parsed = json::parse(event.data);
    if (!parsed || !parsed->is_object())
    {
        log::debug("Skipping undecodable stream payload: {}", event.data);
        return;
    }
    auto const& payload = *parsed;
    auto const type = json::getStringOr(payload, "type", event.event);
    auto const index = json::getIntOr(payload, "index", 0);

    if (type == "content_block_start")
    {
        auto const& block = payload.value("content_block", nlohmann::json::object());
        if (json::getStringOr(block, "type", "") == "tool_use")
        {
            auto& call = state.toolCall(index);
            call.id = json::getStringOr(block, "id", "");
            call.name = json::getStringOr(block, "name", "");
        }
    }
    else if (type == "content_block_delta")
    {
        auto const& delta = payload.value("delta", nlohmann::json::object());
        auto const deltaType = json::getStringOr(delta, "type", "");
        if (deltaType == "text_delta")
            state.text(json::getStringOr(delta, "text", ""));
        else if (deltaType == "thinking_delta")
            state.reasoning(json::getStringOr(delta, "thinking", ""));
        else if (deltaType == "input_json_delta")
            state.toolCall(index).arguments += json::getStringOr(delta, "partial_json", "");
    }
    else if (type == "message_delta")
    {
        auto const& delta = payload.value("delta", nlohmann::json::object());
        if (delta.contains("stop_reason") && delta["stop_reason"].is_string())
            state.setFinishReason(delta["stop_reason"].get<std::string>());
    }
    else if (type == "message_stop")
    {
        state.done();
    }
    else if (type == "error")
    {
        auto const& error = payload.value("error", nlohmann::json::object());
        state.fail(Error { ErrorCode::TransportError,
                           std::format("API error: {}", json::getStringOr(error, "message", "unknown error")) });
    }
}

} // namespace toolchat
