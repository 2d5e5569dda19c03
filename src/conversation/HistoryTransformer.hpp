// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <conversation/DisplayMessage.hpp>

#include <span>
#include <string>
#include <vector>

namespace toolchat
{

/// @brief Rebuilds the display list from a persisted conversation.
///
/// System messages are skipped. An assistant message that made tool calls contributes
/// its visible prose first; each call becomes a tool card, completed by the tool-role
/// message answering it. Calls that never got an answer are appended as executing.
class HistoryTransformer
{
  public:
    explicit HistoryTransformer(std::vector<std::string> sentinels);

    [[nodiscard]] auto transform(std::span<const ConversationMessage> messages) const -> std::vector<DisplayMessage>;

  private:
    std::vector<std::string> _sentinels;
};

} // namespace toolchat
