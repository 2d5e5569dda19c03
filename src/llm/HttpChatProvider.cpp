// SPDX-License-Identifier: Apache-2.0
#include "HttpChatProvider.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <chrono>
#include <format>

namespace toolchat
{

HttpChatProvider::StreamState::StreamState(const StreamEventCallback& onEvent): _onEvent(onEvent)
{
}

void HttpChatProvider::StreamState::text(std::string_view fragment)
{
    if (_finished || fragment.empty())
        return;
    _reply.text.append(fragment);
    if (_onEvent)
        _onEvent(StreamEvent { .kind = StreamEventKind::Text, .payload = std::string(fragment) });
}

void HttpChatProvider::StreamState::reasoning(std::string_view fragment)
{
    if (_finished || fragment.empty())
        return;
    _reply.reasoning.append(fragment);
    if (_onEvent)
        _onEvent(StreamEvent { .kind = StreamEventKind::Reasoning, .payload = std::string(fragment) });
}

void HttpChatProvider::StreamState::done(std::string finishReason)
{
    if (_finished)
        return;
    _finished = true;
    if (!finishReason.empty())
        _reply.finishReason = std::move(finishReason);
    if (_onEvent)
        _onEvent(StreamEvent { .kind = StreamEventKind::Done, .payload = {} });
}

void HttpChatProvider::StreamState::fail(Error error)
{
    if (_finished)
        return;
    _finished = true;
    if (_onEvent)
        _onEvent(StreamEvent { .kind = StreamEventKind::Error, .payload = error.message });
    _error = std::move(error);
}

auto HttpChatProvider::StreamState::toolCall(int index) -> PartialToolCall&
{
    return _toolCalls[index];
}

auto HttpChatProvider::StreamState::takeReply() -> StreamReply
{
    for (auto& [index, partial]: _toolCalls)
    {
        if (partial.name.empty())
            continue;

        auto parameters = nlohmann::json::object();
        if (!partial.arguments.empty())
        {
            auto parsed = json::parse(partial.arguments);
            if (!parsed || !parsed->is_object())
            {
                log::debug("Ignoring tool call {} with malformed arguments: {}", partial.name, partial.arguments);
                continue;
            }
            parameters = std::move(*parsed);
        }

        _reply.toolCalls.push_back(ToolCallDirective {
            .id = partial.id.empty() ? std::format("call_{}", index) : std::move(partial.id),
            .toolName = std::move(partial.name),
            .parameters = std::move(parameters),
        });
    }
    _toolCalls.clear();
    return std::move(_reply);
}

HttpChatProvider::HttpChatProvider(HttpClient& http): _http(http)
{
}

auto HttpChatProvider::joinUrl(std::string_view baseUrl, std::string_view path) -> std::string
{
    while (!baseUrl.empty() && baseUrl.back() == '/')
        baseUrl.remove_suffix(1);
    return std::format("{}{}", baseUrl, path);
}

auto HttpChatProvider::stream(std::span<const ConversationMessage> messages,
                              const StreamRequest& request,
                              const StreamEventCallback& onEvent) -> Result<StreamReply>
{
    auto httpRequest = buildRequest(messages, request);
    if (!httpRequest)
        return std::unexpected(httpRequest.error());
    httpRequest->timeout = request.timeout;

    auto state = StreamState(onEvent);
    auto decoder = SseDecoder {};
    auto const deadline = std::chrono::steady_clock::now() + request.timeout;
    auto const timeoutError = [&] {
        return Error { ErrorCode::TimeoutError,
                       std::format("Stream timed out after {}ms", request.timeout.count()) };
    };

    auto const sink = [&](std::string_view bytes) -> bool {
        if (std::chrono::steady_clock::now() > deadline)
        {
            state.fail(timeoutError());
            return false;
        }
        for (auto const& event: decoder.feed(bytes))
        {
            handleEvent(event, state);
            if (state.finished())
                return false;
        }
        return true;
    };

    log::debug("Streaming {} message(s) to {} ({})",
               messages.size(),
               request.model.model,
               providerTypeToString(request.provider.type));

    auto const transfer = _http.postStream(*httpRequest, sink);
    if (!transfer)
    {
        auto error = transfer.error();
        if (error.code == ErrorCode::TimeoutError)
            error = timeoutError();
        state.fail(error);
        return std::unexpected(std::move(error));
    }

    if (!state.finished())
    {
        for (auto const& event: decoder.finish())
        {
            handleEvent(event, state);
            if (state.finished())
                break;
        }
    }

    if (state.error())
        return std::unexpected(*state.error());

    // Some compatible servers close the connection without a terminator.
    state.done();
    return state.takeReply();
}

} // namespace toolchat
