// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/Orchestrator.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <llm/HttpClient.hpp>
#include <toolchat/Config.hpp>
#include <toolchat/FileReader.hpp>
#include <toolchat/HistoryStore.hpp>
#include <tools/FrontendBridge.hpp>
#include <tools/McpServerManager.hpp>
#include <tools/ToolExecutor.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace toolchat
{

/// @brief The project a conversation belongs to.
struct ProjectContext
{
    std::string path; ///< Root directory; relative attachment paths resolve against it.
};

/// @brief Collaborators of a ChatService. Non-owning; they must outlive the service.
struct ChatServiceDeps
{
    HttpClient& http;
    HistoryStore& history;
    FileReader& files;
    ToolExecutor& nodeExecutor;
    McpServerManager* mcp = nullptr;
    FrontendBridge* frontend = nullptr;
};

/// @brief Entry point of the UI: resolves an agent's configuration and runs one turn.
class ChatService
{
  public:
    ChatService(AppConfig config, ChatServiceDeps deps);

    /// @brief Sends a user message to an agent and runs the turn to completion.
    ///
    /// Configuration errors are returned before any network call. On success the
    /// agent's history is extended by the turn and saved; a failed turn saves nothing.
    [[nodiscard]] auto sendTurn(const ProjectContext& project,
                                std::string_view agentName,
                                std::string userMessage,
                                std::span<const std::string> attachedFilePaths,
                                const TurnCallbacks& callbacks) -> Result<TurnResult>;

    /// @brief The tools an agent may call: its configured tools plus every MCP tool.
    [[nodiscard]] auto toolsFor(const AgentConfig& agent) const -> std::vector<ToolDefinition>;

    [[nodiscard]] auto loadHistory(const ProjectContext& project, std::string_view agentName)
        -> Result<std::vector<ConversationMessage>>;

    [[nodiscard]] auto clearHistory(const ProjectContext& project, std::string_view agentName) -> VoidResult;

    [[nodiscard]] auto config() const noexcept -> const AppConfig& { return _config; }

  private:
    [[nodiscard]] auto buildContext(const ProjectContext& project,
                                    const AgentConfig& agent,
                                    const ProviderConfig& provider,
                                    std::span<const ToolDefinition> tools,
                                    std::vector<ConversationMessage> history,
                                    std::span<const std::string> attachedFilePaths) const
        -> std::vector<ConversationMessage>;

    AppConfig _config;
    ChatServiceDeps _deps;
};

} // namespace toolchat
