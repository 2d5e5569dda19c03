// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/MarkerSniffer.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <llm/ChatProvider.hpp>
#include <tools/FrontendBridge.hpp>
#include <tools/ToolRouter.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace toolchat
{

/// @brief Configuration for the orchestrator.
struct OrchestratorConfig
{
    int maxIterations = 10; ///< Upper bound on stream calls per turn.
    std::chrono::milliseconds streamTimeout { 60000 };
    std::vector<std::string> sentinels = defaultSentinels();
    bool enableTools = true;
};

/// @brief Lifecycle notifications of a turn, all invoked on the turn's thread.
///
/// For every tool call, onToolStarted precedes exactly one of onToolCompleted or
/// onToolFailed. A successful turn ends with exactly one onComplete, a failed one
/// with exactly one onError.
struct TurnCallbacks
{
    std::function<void(std::string_view text)> onChunk;
    std::function<void(std::string_view text)> onReasoning;
    std::function<void(std::string_view finalText)> onComplete;
    std::function<void(std::string_view message)> onError;
    std::function<void(std::string_view toolName, const nlohmann::json& parameters)> onToolStarted;
    std::function<void(std::string_view toolName,
                       const nlohmann::json& parameters,
                       const nlohmann::json& result,
                       int64_t executionTimeMs)>
        onToolCompleted;
    std::function<void(std::string_view toolName, const nlohmann::json& parameters, std::string_view error)>
        onToolFailed;
};

/// @brief Per-turn inputs besides the messages.
struct TurnContext
{
    ModelConfig model;
    ProviderConfig provider;
    std::vector<ToolDefinition> tools;
    FrontendBridge* frontend = nullptr; ///< Execution context for browser tools, if any.
};

/// @brief Outcome of a successful turn.
struct TurnResult
{
    std::string finalText;                      ///< The text the display saw.
    std::vector<ConversationMessage> messages;  ///< Full history including the new turn.
    std::vector<ToolCallResult> toolCalls;      ///< Every call made during the turn.
    int iterations = 0;
};

/// @brief Drives the stream, detect, execute, re-stream cycle of one turn.
///
/// Each iteration streams a reply through a MarkerSniffer, so directive text never
/// reaches onChunk. Directives found in the reply are executed concurrently and their
/// results appended to the history in invocation order before the next stream. The
/// turn ends when a reply has no directives or after maxIterations stream calls; in
/// the latter case a note saying so is appended to the visible text.
class Orchestrator
{
  public:
    Orchestrator(ChatProvider& provider, const ToolRouter& router, OrchestratorConfig config);

    /// @brief Runs one turn.
    /// @param context Prior messages: system prompt, attachments and history.
    /// @return The turn result, or the transport error that aborted the turn.
    [[nodiscard]] auto runTurn(std::vector<ConversationMessage> context,
                               std::string userMessage,
                               const TurnContext& turn,
                               const TurnCallbacks& callbacks) -> Result<TurnResult>;

    [[nodiscard]] auto config() const -> const OrchestratorConfig&;

  private:
    ChatProvider& _provider;
    const ToolRouter& _router;
    OrchestratorConfig _config;
};

} // namespace toolchat
