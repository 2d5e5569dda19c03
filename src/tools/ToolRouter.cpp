// SPDX-License-Identifier: Apache-2.0
#include "ToolRouter.hpp"

#include <core/Log.hpp>
#include <tools/ToolSchema.hpp>

#include <chrono>
#include <format>

namespace toolchat
{

namespace
{

    auto failed(const ToolCallDirective& directive, std::string error) -> ToolCallResult
    {
        return ToolCallResult {
            .toolName = directive.toolName,
            .parameters = directive.parameters,
            .status = ToolStatus::Failed,
            .result = std::nullopt,
            .error = std::move(error),
            .executionTimeMs = std::nullopt,
        };
    }

} // namespace

ToolRouter::ToolRouter(ToolExecutor& nodeExecutor, ToolExecutor* mcpExecutor):
    _nodeExecutor(nodeExecutor), _mcpExecutor(mcpExecutor)
{
}

auto ToolRouter::execute(const ToolCallDirective& directive,
                         const ToolDefinition* tool,
                         FrontendBridge* frontend,
                         ToolCallTable& calls) const -> ToolCallResult
{
    auto const identity = callIdentity(directive.toolName, directive.parameters);
    if (auto registered = calls.begin(identity, directive); !registered)
        return failed(directive, registered.error().message);

    auto result = run(directive, tool, frontend);
    calls.finish(identity, result);
    return result;
}

auto ToolRouter::run(const ToolCallDirective& directive, const ToolDefinition* tool, FrontendBridge* frontend) const
    -> ToolCallResult
{
    if (!tool)
        return failed(directive, std::format("Tool \"{}\" not found", directive.toolName));
    if (!tool->enabled)
        return failed(directive, std::format("Tool \"{}\" is disabled", directive.toolName));

    if (auto valid = validateParameters(directive.parameters, tool->parameterSchema); !valid)
    {
        log::info("Tool {} rejected: {}", tool->name, valid.error().message);
        return failed(directive, valid.error().message);
    }

    ToolExecutor* executor = nullptr;
    switch (tool->environment)
    {
        case ExecutionEnvironment::Node: executor = &_nodeExecutor; break;
        case ExecutionEnvironment::Browser:
            if (!frontend)
                return failed(directive, "No front-end execution context available");
            executor = frontend;
            break;
        case ExecutionEnvironment::Mcp:
            if (!_mcpExecutor)
                return failed(directive, std::format("MCP tool \"{}\" has no connected server", tool->name));
            executor = _mcpExecutor;
            break;
    }

    log::debug("Executing tool {} in {} environment", tool->name, environmentToString(tool->environment));
    auto const start = std::chrono::steady_clock::now();
    auto output = executor->execute(*tool, directive.parameters);
    auto const elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();

    if (!output)
    {
        log::warning("Tool {} failed: {}", tool->name, output.error().message);
        return failed(directive, output.error().message);
    }

    return ToolCallResult {
        .toolName = directive.toolName,
        .parameters = directive.parameters,
        .status = ToolStatus::Completed,
        .result = std::move(output->result),
        .error = std::nullopt,
        .executionTimeMs = output->executionTimeMs.value_or(elapsed),
    };
}

} // namespace toolchat
