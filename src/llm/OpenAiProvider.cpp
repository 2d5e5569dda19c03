// SPDX-License-Identifier: Apache-2.0
#include "OpenAiProvider.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <llm/ProviderFactory.hpp>

#include <algorithm>
#include <format>

namespace toolchat
{

auto OpenAiProvider::mapMessages(std::span<const ConversationMessage> messages) -> nlohmann::json
{
    auto result = nlohmann::json::array();
    const std::vector<ToolCallDirective>* openCalls = nullptr;

    for (const auto& message: messages)
    {
        switch (message.role)
        {
            case Role::Assistant: {
                auto entry = nlohmann::json { { "role", "assistant" }, { "content", message.content } };
                if (!message.toolCalls.empty())
                {
                    auto calls = nlohmann::json::array();
                    for (const auto& call: message.toolCalls)
                    {
                        calls.push_back({
                            { "id", call.id },
                            { "type", "function" },
                            { "function", { { "name", call.toolName }, { "arguments", json::canonical(call.parameters) } } },
                        });
                    }
                    entry["tool_calls"] = std::move(calls);
                    openCalls = &message.toolCalls;
                }
                else
                    openCalls = nullptr;
                result.push_back(std::move(entry));
                break;
            }
            case Role::Tool: {
                auto const answersCall = openCalls && !message.toolCallId.empty()
                                         && std::ranges::any_of(*openCalls, [&](const ToolCallDirective& call) {
                                                return call.id == message.toolCallId;
                                            });
                if (answersCall)
                    result.push_back(
                        { { "role", "tool" }, { "tool_call_id", message.toolCallId }, { "content", message.content } });
                else
                    result.push_back({ { "role", "user" }, { "content", message.content } });
                break;
            }
            case Role::System:
            case Role::User:
                result.push_back({ { "role", roleToString(message.role) }, { "content", message.content } });
                openCalls = nullptr;
                break;
        }
    }

    return result;
}

void OpenAiProvider::decorateBody(nlohmann::json& /*body*/, const StreamRequest& /*request*/) const
{
}

auto OpenAiProvider::buildRequest(std::span<const ConversationMessage> messages,
                                  const StreamRequest& request) const -> Result<HttpRequest>
{
    if (request.model.model.empty())
        return makeError(ErrorCode::ConfigError, std::format("Model config \"{}\" has no model name", request.model.id));

    auto body = nlohmann::json {
        { "model", request.model.model },
        { "messages", mapMessages(messages) },
        { "stream", true },
    };
    if (request.model.temperature)
        body["temperature"] = *request.model.temperature;
    if (request.model.maxTokens)
        body["max_tokens"] = *request.model.maxTokens;
    if (request.model.topP)
        body["top_p"] = *request.model.topP;
    if (request.model.extra.is_object())
        body.update(request.model.extra);

    decorateBody(body, request);

    auto const baseUrl =
        request.provider.baseUrl.empty() ? defaultBaseUrl(request.provider.type) : request.provider.baseUrl;

    auto httpRequest = HttpRequest {
        .url = joinUrl(baseUrl, "/chat/completions"),
        .headers = { { "Content-Type", "application/json" }, { "Accept", "text/event-stream" } },
        .body = json::canonical(body),
    };
    if (!request.provider.apiKey.empty())
    {
        httpRequest.headers.emplace_back("Authorization", std::format("Bearer {}", request.provider.apiKey));
        if (request.provider.type == ProviderType::Azure)
            httpRequest.headers.emplace_back("api-key", request.provider.apiKey);
    }
    return httpRequest;
}

void OpenAiProvider::handleEvent(const SseEvent& event, StreamState& state)
{
    if (event.data == "[DONE]")
    {
        state.done();
        return;
    }

    auto parsed = json::parse(event.data);
    if (!parsed || !parsed->is_object())
    {
        log::debug("Skipping undecodable stream payload: {}", event.data);
        return;
    }
    auto const& payload = *parsed;

    if (payload.contains("error"))
    {
        auto const& error = payload["error"];
        auto const message = error.is_object() ? json::getStringOr(error, "message", error.dump()) : error.dump();
        state.fail(Error { ErrorCode::TransportError, std::format("API error: {}", message) });
        return;
    }

    if (!payload.contains("choices") || !payload["choices"].is_array() || payload["choices"].empty())
        return;

    auto const& choice = payload["choices"][0];
    if (choice.contains("delta") && choice["delta"].is_object())
    {
        auto const& delta = choice["delta"];
        if (delta.contains("reasoning_content") && delta["reasoning_content"].is_string())
            state.reasoning(delta["reasoning_content"].get<std::string>());
        if (delta.contains("content") && delta["content"].is_string())
            state.text(delta["content"].get<std::string>());

        if (delta.contains("tool_calls") && delta["tool_calls"].is_array())
        {
            for (const auto& fragment: delta["tool_calls"])
            {
                auto& call = state.toolCall(json::getIntOr(fragment, "index", 0));
                if (fragment.contains("id") && fragment["id"].is_string())
                    call.id = fragment["id"].get<std::string>();
                if (fragment.contains("function") && fragment["function"].is_object())
                {
                    auto const& function = fragment["function"];
                    if (function.contains("name") && function["name"].is_string())
                        call.name += function["name"].get<std::string>();
                    if (function.contains("arguments") && function["arguments"].is_string())
                        call.arguments += function["arguments"].get<std::string>();
                }
            }
        }
    }

    if (choice.contains("finish_reason") && choice["finish_reason"].is_string())
        state.done(choice["finish_reason"].get<std::string>());
}

void GlmProvider::decorateBody(nlohmann::json& body, const StreamRequest& request) const
{
    auto tools = nlohmann::json::array();
    for (const auto& tool: request.tools)
    {
        if (!tool.enabled)
            continue;
        auto parameters = tool.parameterSchema.is_object() && !tool.parameterSchema.empty()
                              ? tool.parameterSchema
                              : nlohmann::json { { "type", "object" }, { "properties", nlohmann::json::object() } };
        tools.push_back({
            { "type", "function" },
            { "function",
              { { "name", tool.name }, { "description", tool.description }, { "parameters", std::move(parameters) } } },
        });
    }

    if (tools.empty())
        return;
    body["tools"] = std::move(tools);
    body["tool_choice"] = "auto";
}

} // namespace toolchat
