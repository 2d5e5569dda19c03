// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <tools/JsonRpc.hpp>

#include <format>

namespace toolchat
{

McpClient::McpClient(std::unique_ptr<MessageChannel> channel): _channel(std::move(channel))
{
}

McpClient::~McpClient()
{
    if (_channel)
        _channel->close();
}

auto McpClient::initialize() -> Result<McpServerInfo>
{
    auto params = nlohmann::json {
        { "protocolVersion", "2024-11-05" },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", "toolchat" },
              { "version", "0.1.0" },
          } },
    };

    return sendRequest("initialize", std::move(params))
        .and_then([this](const nlohmann::json& result) -> Result<McpServerInfo> {
            auto const serverInfo = result.value("serverInfo", nlohmann::json::object());
            auto info = McpServerInfo {
                .hasTools = result.contains("capabilities") && result["capabilities"].contains("tools"),
                .serverName = json::getStringOr(serverInfo, "name", "unknown"),
                .serverVersion = json::getStringOr(serverInfo, "version", "unknown"),
            };

            auto const lock = std::lock_guard { _mutex };
            if (auto sent = _channel->send(jsonrpc::makeNotification("notifications/initialized")); !sent)
                return std::unexpected(sent.error());

            _initialized = true;
            log::info("MCP server initialized: {} v{}", info.serverName, info.serverVersion);
            return info;
        });
}

auto McpClient::listTools(std::string_view serverName) -> Result<std::vector<ToolDefinition>>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    return sendRequest("tools/list")
        .and_then([serverName](const nlohmann::json& result) -> Result<std::vector<ToolDefinition>> {
            auto tools = std::vector<ToolDefinition> {};

            if (!result.contains("tools") || !result["tools"].is_array())
                return tools;

            for (const auto& toolJson: result["tools"])
            {
                auto name = json::getStringOr(toolJson, "name", "");
                if (name.empty())
                    continue;
                tools.push_back(ToolDefinition {
                    .name = name,
                    .description = json::getStringOr(toolJson, "description", ""),
                    .code = {},
                    .parameterSchema = toolJson.value("inputSchema", nlohmann::json::object()),
                    .environment = ExecutionEnvironment::Mcp,
                    .timeoutMs = DefaultToolTimeoutMs,
                    .enabled = true,
                    .mcpServer = std::string(serverName),
                    .mcpToolName = name,
                });
            }

            return tools;
        });
}

auto McpClient::callTool(std::string_view name,
                         const nlohmann::json& arguments,
                         std::optional<std::chrono::milliseconds> timeout) -> Result<McpCallResult>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments },
    };

    return sendRequest("tools/call", std::move(params), timeout)
        .and_then([name](const nlohmann::json& result) -> Result<McpCallResult> {
            auto callResult = McpCallResult {};
            callResult.isError = json::getBoolOr(result, "isError", false);

            if (result.contains("content") && result["content"].is_array())
            {
                for (const auto& item: result["content"])
                {
                    if (json::getStringOr(item, "type", "") != "text")
                        continue;
                    if (!callResult.content.empty())
                        callResult.content += "\n";
                    callResult.content += json::getStringOr(item, "text", "");
                }
            }

            log::debug("Tool '{}' returned: {} (isError: {})", name, callResult.content, callResult.isError);
            return callResult;
        });
}

auto McpClient::isInitialized() const -> bool
{
    return _initialized;
}

auto McpClient::sendRequest(std::string_view method,
                            nlohmann::json params,
                            std::optional<std::chrono::milliseconds> timeout) -> Result<nlohmann::json>
{
    auto const lock = std::lock_guard { _mutex };
    auto const id = _nextId++;

    if (auto sent = _channel->send(jsonrpc::makeRequest(id, method, std::move(params))); !sent)
        return std::unexpected(sent.error());

    // Skip server notifications and stale responses until ours arrives.
    while (true)
    {
        auto message = _channel->receive(timeout);
        if (!message)
            return std::unexpected(message.error());

        auto response = jsonrpc::parseMessage(*message);
        if (!response)
            return std::unexpected(response.error());

        if (!response->isResponse())
        {
            log::trace("MCP server message: {}", response->method);
            continue;
        }
        if (!response->answers(id))
        {
            log::debug("Ignoring MCP response for id {}", response->id.dump());
            continue;
        }

        if (response->error)
            return makeError(ErrorCode::ProtocolError,
                             std::format("RPC error {}: {}", response->error->code, response->error->message));
        return response->result.value_or(nlohmann::json::object());
    }
}

} // namespace toolchat
