// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <tools/FrontendBridge.hpp>
#include <tools/ToolCallTable.hpp>
#include <tools/ToolExecutor.hpp>

namespace toolchat
{

/// @brief Validates tool calls and dispatches them to the matching execution environment.
class ToolRouter
{
  public:
    /// @param nodeExecutor Runs node-environment tools.
    /// @param mcpExecutor Runs mcp-environment tools; may be null if no server is configured.
    explicit ToolRouter(ToolExecutor& nodeExecutor, ToolExecutor* mcpExecutor = nullptr);

    /// @brief Runs one directive to a terminal result. Never throws, never aborts the turn.
    ///
    /// Validation order: tool exists and is enabled, required fields, property types,
    /// enum membership. A validation failure returns a failed result without running
    /// anything.
    /// @param tool The definition of directive.toolName, or nullptr if there is none.
    /// @param frontend The front-end bridge for browser tools, or nullptr.
    /// @param calls The turn's call table; the call is registered and finished in it.
    [[nodiscard]] auto execute(const ToolCallDirective& directive,
                               const ToolDefinition* tool,
                               FrontendBridge* frontend,
                               ToolCallTable& calls) const -> ToolCallResult;

  private:
    ToolExecutor& _nodeExecutor;
    ToolExecutor* _mcpExecutor;

    [[nodiscard]] auto run(const ToolCallDirective& directive, const ToolDefinition* tool, FrontendBridge* frontend) const
        -> ToolCallResult;
};

} // namespace toolchat
