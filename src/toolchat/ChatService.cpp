// SPDX-License-Identifier: Apache-2.0
#include "ChatService.hpp"

#include <agent/ToolPrompt.hpp>
#include <core/Log.hpp>
#include <llm/ProviderFactory.hpp>
#include <tools/ToolRouter.hpp>

#include <algorithm>
#include <filesystem>
#include <format>
#include <iterator>

namespace toolchat
{

ChatService::ChatService(AppConfig config, ChatServiceDeps deps): _config(std::move(config)), _deps(deps)
{
}

auto ChatService::toolsFor(const AgentConfig& agent) const -> std::vector<ToolDefinition>
{
    auto tools = std::vector<ToolDefinition> {};
    for (const auto& tool: _config.tools)
    {
        if (!agent.tools || std::ranges::find(*agent.tools, tool.name) != agent.tools->end())
            tools.push_back(tool);
    }

    if (_deps.mcp)
    {
        for (auto& tool: _deps.mcp->allTools())
        {
            auto const clash = std::ranges::any_of(tools, [&](const ToolDefinition& t) { return t.name == tool.name; });
            if (clash)
            {
                log::warning("MCP tool {} from server {} shadowed by a configured tool", tool.name, tool.mcpServer);
                continue;
            }
            tools.push_back(std::move(tool));
        }
    }
    return tools;
}

auto ChatService::buildContext(const ProjectContext& project,
                               const AgentConfig& agent,
                               const ProviderConfig& provider,
                               std::span<const ToolDefinition> tools,
                               std::vector<ConversationMessage> history,
                               std::span<const std::string> attachedFilePaths) const
    -> std::vector<ConversationMessage>
{
    auto context = std::vector<ConversationMessage> {};

    auto systemPrompt = agent.systemPrompt;
    // GLM receives the tools as structured definitions in the request instead.
    if (_config.orchestrator.enableTools && provider.type != ProviderType::Glm)
    {
        auto const toolPrompt = buildToolPrompt(tools);
        if (!toolPrompt.empty())
            systemPrompt = systemPrompt.empty() ? toolPrompt : std::format("{}\n\n{}", systemPrompt, toolPrompt);
    }
    if (!systemPrompt.empty())
        context.push_back(ConversationMessage { .role = Role::System, .content = std::move(systemPrompt) });

    std::ranges::move(history, std::back_inserter(context));

    for (const auto& attached: attachedFilePaths)
    {
        auto path = std::filesystem::path(attached);
        if (path.is_relative() && !project.path.empty())
            path = std::filesystem::path(project.path) / path;

        auto content = _deps.files.read(path.string());
        if (!content)
        {
            log::warning("Skipping attachment {}: {}", attached, content.error().message);
            continue;
        }
        context.push_back(ConversationMessage {
            .role = Role::System,
            .content = std::format("[File: {}]\n{}", path.filename().string(), *content),
        });
    }
    return context;
}

auto ChatService::sendTurn(const ProjectContext& project,
                           std::string_view agentName,
                           std::string userMessage,
                           std::span<const std::string> attachedFilePaths,
                           const TurnCallbacks& callbacks) -> Result<TurnResult>
{
    auto const fail = [&](Error error) -> Result<TurnResult> {
        log::error("Turn for agent {} failed: {}", agentName, error);
        if (callbacks.onError)
            callbacks.onError(error.message);
        return std::unexpected(std::move(error));
    };

    auto agent = findAgent(_config, agentName);
    if (!agent)
        return fail(agent.error());
    auto provider = findProvider(_config, agent->providerId);
    if (!provider)
        return fail(provider.error());
    auto model = findModelConfig(_config, agent->modelId);
    if (!model)
        return fail(model.error());
    if (provider->apiKey.empty() && provider->type != ProviderType::Custom)
        return fail(Error { ErrorCode::ConfigError, std::format("Provider \"{}\" has no API key", provider->id) });

    auto history = _deps.history.load(project.path, agent->name);
    if (!history)
        return fail(history.error());
    auto const persistedCount = history->size();
    auto persisted = *history;

    auto turn = TurnContext {
        .model = std::move(*model),
        .provider = std::move(*provider),
        .tools = toolsFor(*agent),
        .frontend = _deps.frontend,
    };

    auto context = buildContext(project, *agent, turn.provider, turn.tools, std::move(*history), attachedFilePaths);
    auto const contextSize = context.size();

    auto chatProvider = makeProvider(turn.provider.type, _deps.http);
    auto const router = ToolRouter(_deps.nodeExecutor, _deps.mcp);
    auto orchestrator = Orchestrator(*chatProvider, router, _config.orchestrator);

    log::info("Turn for agent {} ({} history messages, {} tools)", agent->name, persistedCount, turn.tools.size());

    // Orchestrator reports errors through onError itself.
    auto result = orchestrator.runTurn(std::move(context), std::move(userMessage), turn, callbacks);
    if (!result)
        return std::unexpected(result.error());

    // Only the turn's own messages join the history; the system prompt and
    // attachments are rebuilt every turn.
    persisted.insert(persisted.end(),
                     std::make_move_iterator(result->messages.begin() + static_cast<std::ptrdiff_t>(contextSize)),
                     std::make_move_iterator(result->messages.end()));

    if (auto saved = _deps.history.save(project.path, agent->name, persisted); !saved)
        log::error("Failed to save history of agent {}: {}", agent->name, saved.error());

    result->messages = std::move(persisted);
    return result;
}

auto ChatService::loadHistory(const ProjectContext& project, std::string_view agentName)
    -> Result<std::vector<ConversationMessage>>
{
    return _deps.history.load(project.path, agentName);
}

auto ChatService::clearHistory(const ProjectContext& project, std::string_view agentName) -> VoidResult
{
    return _deps.history.clear(project.path, agentName);
}

} // namespace toolchat
