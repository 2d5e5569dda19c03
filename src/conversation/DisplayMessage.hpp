// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <optional>
#include <string>

namespace toolchat
{

/// @brief One entry of the rendered conversation.
///
/// A message carrying a toolCall is a tool card and never receives streamed text.
struct DisplayMessage
{
    Role role = Role::Assistant; ///< Role::User or Role::Assistant.
    std::string content;
    std::optional<std::string> reasoning;
    std::optional<ToolCallResult> toolCall;

    [[nodiscard]] auto isToolCard() const noexcept -> bool { return toolCall.has_value(); }

    auto operator==(const DisplayMessage&) const -> bool = default;
};

} // namespace toolchat
