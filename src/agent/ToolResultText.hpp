// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <string>
#include <string_view>

namespace toolchat
{

/// @brief Renders a terminal tool result as the tool-role message sent back to the model.
///
/// Completed: `Tool "<name>" executed successfully:\n<pretty JSON>\n(Execution time: <n>ms)`.
/// Failed:    `Tool "<name>" failed: <error>`.
[[nodiscard]] auto formatToolResultMessage(const ToolCallResult& result) -> std::string;

/// @brief Recovers status, result, error and execution time from a tool-role message.
///
/// Text in neither format yields a completed result holding the text as a string.
/// The returned toolName and parameters are left for the caller to fill in.
[[nodiscard]] auto parseToolResultMessage(std::string_view content) -> ToolCallResult;

} // namespace toolchat
