// SPDX-License-Identifier: Apache-2.0
#include "McpServerManager.hpp"

#include <core/Log.hpp>

#include <chrono>
#include <format>

namespace toolchat
{

McpServerManager::McpServerManager() = default;

McpServerManager::~McpServerManager()
{
    shutdown();
}

auto McpServerManager::addServer(const McpServerConfig& config) -> VoidResult
{
    auto channel = std::make_unique<ProcessChannel>();

    auto started = channel->start(ProcessConfig {
        .command = config.command,
        .args = config.args,
        .env = config.env,
    });
    if (!started)
        return std::unexpected(started.error());

    log::info("MCP server started: {} ({})", config.name, config.command);
    return addClient(config.name, std::make_unique<McpClient>(std::move(channel)));
}

auto McpServerManager::addClient(std::string name, std::unique_ptr<McpClient> client) -> VoidResult
{
    if (_servers.contains(name))
        return makeError(ErrorCode::InvalidArgument, std::format("MCP server \"{}\" already registered", name));

    auto initResult = client->initialize();
    if (!initResult)
        return std::unexpected(initResult.error());

    auto toolsResult = client->listTools(name);
    if (!toolsResult)
        log::warning("Failed to list tools for server '{}': {}", name, toolsResult.error().message);

    auto entry = ServerEntry {
        .client = std::move(client),
        .tools = toolsResult ? std::move(*toolsResult) : std::vector<ToolDefinition> {},
    };

    for (const auto& tool: entry.tools)
        log::debug("  Tool registered: {} (from server '{}')", tool.name, name);
    log::info("MCP server '{}' connected with {} tools", name, entry.tools.size());

    _servers.emplace(std::move(name), std::move(entry));
    return {};
}

auto McpServerManager::allTools() const -> std::vector<ToolDefinition>
{
    auto result = std::vector<ToolDefinition> {};
    for (const auto& [name, server]: _servers)
        result.insert(result.end(), server.tools.begin(), server.tools.end());
    return result;
}

auto McpServerManager::execute(const ToolDefinition& tool, const nlohmann::json& parameters) -> Result<ToolOutput>
{
    auto const it = _servers.find(tool.mcpServer);
    if (it == _servers.end())
        return makeError(ErrorCode::ToolCallError, std::format("MCP server \"{}\" is not connected", tool.mcpServer));

    auto const& remoteName = tool.mcpToolName.empty() ? tool.name : tool.mcpToolName;
    auto result = it->second.client->callTool(remoteName, parameters, std::chrono::milliseconds(tool.timeoutMs));
    if (!result)
    {
        if (result.error().code == ErrorCode::TimeoutError)
            return makeError(ErrorCode::TimeoutError,
                             std::format("Tool execution timed out after {}ms", tool.timeoutMs));
        return std::unexpected(result.error());
    }

    if (result->isError)
        return makeError(ErrorCode::ToolCallError, result->content);

    return ToolOutput { .result = std::move(result->content), .executionTimeMs = std::nullopt };
}

auto McpServerManager::serverCount() const -> size_t
{
    return _servers.size();
}

void McpServerManager::shutdown()
{
    _servers.clear();
}

} // namespace toolchat
