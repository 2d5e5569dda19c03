// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <span>
#include <string>

namespace toolchat
{

/// @brief Describes the enabled tools and the inline <tool_call> format for the system prompt.
/// @return An empty string if no tool is enabled.
[[nodiscard]] auto buildToolPrompt(std::span<const ToolDefinition> tools) -> std::string;

} // namespace toolchat
