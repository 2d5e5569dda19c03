// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <conversation/DisplayMessage.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace toolchat
{

/// @brief Builds the display list of a conversation from turn events alone.
///
/// Streamed prose goes into a "slot": the last assistant message if it is not a
/// tool card, or a fresh one. Tool cards always get their own message and are
/// updated in place when their call finishes.
class MessageReconstructor
{
  public:
    /// @brief Receives user-facing error notifications.
    using Notifier = std::function<void(std::string_view message)>;

    explicit MessageReconstructor(Notifier notifier = {});

    /// @brief Seeds the list, e.g. with HistoryTransformer output.
    void load(std::vector<DisplayMessage> messages);

    void userMessage(std::string_view text);
    void chunk(std::string_view text);
    void reasoning(std::string_view text);
    void complete();

    /// @brief Closes the slot, drops the user message that started the turn and notifies.
    void error(std::string_view message);

    void toolStarted(std::string_view toolName, const nlohmann::json& parameters);
    void toolCompleted(std::string_view toolName,
                       const nlohmann::json& parameters,
                       const nlohmann::json& result,
                       int64_t executionTimeMs);
    void toolFailed(std::string_view toolName, const nlohmann::json& parameters, std::string_view error);

    [[nodiscard]] auto messages() const noexcept -> const std::vector<DisplayMessage>& { return _messages; }
    [[nodiscard]] auto isStreaming() const noexcept -> bool { return _streaming; }

    void clear();

  private:
    Notifier _notifier;
    std::vector<DisplayMessage> _messages;
    std::map<std::string, size_t> _toolCards; // call identity -> index into _messages
    bool _streaming = false;

    auto streamingSlot() -> DisplayMessage&;
    auto trackedCard(std::string_view toolName, const nlohmann::json& parameters) -> ToolCallResult*;
};

} // namespace toolchat
