// SPDX-License-Identifier: Apache-2.0
#include "ToolPrompt.hpp"

#include <format>

namespace toolchat
{

auto buildToolPrompt(std::span<const ToolDefinition> tools) -> std::string
{
    auto listing = std::string {};
    for (const auto& tool: tools)
    {
        if (!tool.enabled)
            continue;
        listing += std::format("- {}: {}\n  Parameters: {}\n", tool.name, tool.description, tool.parameterSchema.dump());
    }

    if (listing.empty())
        return {};

    return std::format(
        "You can call the following tools:\n{}\n"
        "To call a tool, reply with one block per call in exactly this form:\n"
        "<tool_call>{{\"toolname\": \"<name>\", \"parameters\": {{...}}}}</tool_call>\n"
        "The result of each call is sent back to you in the next message. "
        "Answer normally, without tool_call blocks, once you have what you need.",
        listing);
}

} // namespace toolchat
