// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace toolchat
{

/// @brief Extracts inline tool-call directives from raw model output.
///
/// Recognizes tagged directives, <tool_call>{...}</tool_call>, and bare JSON objects
/// whose first key is "toolname" (blanks allowed after the brace). The tool name may be given as "toolname", "toolName"
/// or "name"; the inputs as "parameters" or "arguments" (an object, or a string
/// holding one). Malformed directives are skipped. Ids are assigned as call_<n>.
[[nodiscard]] auto parseDirectives(std::string_view text) -> std::vector<ToolCallDirective>;

/// @brief Interprets one JSON object as a directive.
/// @return The directive (without id), or std::nullopt if the object is not one.
[[nodiscard]] auto directiveFromJson(const nlohmann::json& value) -> std::optional<ToolCallDirective>;

/// @brief Collects all directives of one reply: structured ones first, then inline ones.
///
/// Inline directives are numbered call_<n> continuing after the structured ones;
/// duplicates are then removed by identity key.
[[nodiscard]] auto collectDirectives(std::vector<ToolCallDirective> structured, std::string_view rawText)
    -> std::vector<ToolCallDirective>;

/// @brief Removes later directives whose identity key repeats an earlier one.
[[nodiscard]] auto deduplicateDirectives(std::vector<ToolCallDirective> directives)
    -> std::vector<ToolCallDirective>;

} // namespace toolchat
