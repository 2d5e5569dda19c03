// SPDX-License-Identifier: Apache-2.0
#include "Orchestrator.hpp"

#include <agent/DirectiveParser.hpp>
#include <agent/StreamSession.hpp>
#include <agent/ToolResultText.hpp>
#include <core/Log.hpp>
#include <tools/ToolCallTable.hpp>

#include <algorithm>
#include <future>
#include <system_error>

namespace toolchat
{

namespace
{

    constexpr auto IterationLimitNote =
        std::string_view("\n\n[Note: Maximum tool call rounds reached. Some tool calls may not have been executed.]");

    auto findTool(const std::vector<ToolDefinition>& tools, std::string_view name) -> const ToolDefinition*
    {
        auto const it = std::ranges::find_if(tools, [&](const ToolDefinition& t) { return t.name == name; });
        return it == tools.end() ? nullptr : &*it;
    }

} // namespace

Orchestrator::Orchestrator(ChatProvider& provider, const ToolRouter& router, OrchestratorConfig config):
    _provider(provider), _router(router), _config(std::move(config))
{
    _config.maxIterations = std::max(1, _config.maxIterations);
}

auto Orchestrator::config() const -> const OrchestratorConfig&
{
    return _config;
}

auto Orchestrator::runTurn(std::vector<ConversationMessage> context,
                           std::string userMessage,
                           const TurnContext& turn,
                           const TurnCallbacks& callbacks) -> Result<TurnResult>
{
    auto session = StreamSession(std::move(context));
    session.addUserMessage(std::move(userMessage));

    auto calls = ToolCallTable {};
    auto sniffer = MarkerSniffer(_config.sentinels);
    auto visibleText = std::string {};

    auto const request = StreamRequest {
        .model = turn.model,
        .provider = turn.provider,
        .tools = _config.enableTools ? std::span<const ToolDefinition>(turn.tools) : std::span<const ToolDefinition> {},
        .timeout = _config.streamTimeout,
    };

    auto const forward = [&](std::string_view safe) {
        if (safe.empty())
            return;
        visibleText.append(safe);
        if (callbacks.onChunk)
            callbacks.onChunk(safe);
    };

    auto const onEvent = [&](const StreamEvent& event) {
        switch (event.kind)
        {
            case StreamEventKind::Text: forward(sniffer.feed(event.payload)); break;
            case StreamEventKind::Reasoning:
                if (callbacks.onReasoning)
                    callbacks.onReasoning(event.payload);
                break;
            case StreamEventKind::Done:
            case StreamEventKind::Error: break;
        }
    };

    while (session.iterationCount() < _config.maxIterations)
    {
        session.beginIteration();
        sniffer.reset();
        visibleText.clear();
        log::debug("Turn iteration {}/{}", session.iterationCount(), _config.maxIterations);

        auto reply = _provider.stream(session.messages(), request, onEvent);
        if (!reply)
        {
            log::error("Stream failed: {}", reply.error());
            if (callbacks.onError)
                callbacks.onError(reply.error().message);
            return std::unexpected(reply.error());
        }

        forward(sniffer.finish());
        session.recordStream(sniffer.rawText(), sniffer.suppressedSinceIndex());

        auto const directives = _config.enableTools
                                    ? collectDirectives(reply->toolCalls, session.accumulatedText())
                                    : std::vector<ToolCallDirective> {};

        if (directives.empty())
        {
            session.addAssistantMessage(reply->text);
            if (callbacks.onComplete)
                callbacks.onComplete(visibleText);
            return TurnResult {
                .finalText = std::move(visibleText),
                .messages = session.takeMessages(),
                .toolCalls = calls.entries(),
                .iterations = session.iterationCount(),
            };
        }

        log::info("Model requested {} tool call(s)", directives.size());
        session.addAssistantMessage(reply->text, std::move(reply->toolCalls));

        for (const auto& directive: directives)
        {
            if (callbacks.onToolStarted)
                callbacks.onToolStarted(directive.toolName, directive.parameters);
        }

        auto pending = std::vector<std::future<ToolCallResult>> {};
        pending.reserve(directives.size());
        for (const auto& directive: directives)
        {
            auto const* tool = findTool(turn.tools, directive.toolName);
            auto const run = [this, &directive, tool, &turn, &calls] {
                return _router.execute(directive, tool, turn.frontend, calls);
            };
            try
            {
                pending.push_back(std::async(std::launch::async, run));
            }
            catch (const std::system_error& e)
            {
                log::warning("Running tool {} inline: {}", directive.toolName, e.what());
                auto promise = std::promise<ToolCallResult> {};
                promise.set_value(run());
                pending.push_back(promise.get_future());
            }
        }

        for (auto i = size_t { 0 }; i < directives.size(); ++i)
        {
            auto const& directive = directives[i];
            auto const result = pending[i].get();

            if (result.status == ToolStatus::Completed)
            {
                if (callbacks.onToolCompleted)
                    callbacks.onToolCompleted(directive.toolName,
                                              directive.parameters,
                                              result.result.value_or(nullptr),
                                              result.executionTimeMs.value_or(0));
            }
            else if (callbacks.onToolFailed)
                callbacks.onToolFailed(directive.toolName, directive.parameters, result.error.value_or(""));

            session.addToolResult(directive.id, formatToolResultMessage(result));
        }
    }

    log::warning("Reached the maximum of {} iterations; ending turn with the last reply", _config.maxIterations);
    forward(IterationLimitNote);
    if (callbacks.onComplete)
        callbacks.onComplete(visibleText);

    return TurnResult {
        .finalText = std::move(visibleText),
        .messages = session.takeMessages(),
        .toolCalls = calls.entries(),
        .iterations = session.iterationCount(),
    };
}

} // namespace toolchat
