// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <tools/MessageChannel.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolchat
{

/// @brief MCP server identity reported during initialization.
struct McpServerInfo
{
    bool hasTools = false;
    std::string serverName;
    std::string serverVersion;
};

/// @brief Text content of a tools/call result.
struct McpCallResult
{
    std::string content; ///< "text" items joined by newlines.
    bool isError = false;
};

/// @brief Client for the Model Context Protocol over a MessageChannel.
///
/// Requests are serialized; concurrent callers take turns on the channel.
class McpClient
{
  public:
    explicit McpClient(std::unique_ptr<MessageChannel> channel);
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Performs the initialize handshake and sends notifications/initialized.
    [[nodiscard]] auto initialize() -> Result<McpServerInfo>;

    /// @brief Lists the server's tools as mcp-environment definitions.
    /// @param serverName Recorded as ToolDefinition::mcpServer.
    [[nodiscard]] auto listTools(std::string_view serverName) -> Result<std::vector<ToolDefinition>>;

    /// @brief Calls a tool; @p timeout bounds the wait for the response.
    [[nodiscard]] auto callTool(std::string_view name,
                                const nlohmann::json& arguments,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<McpCallResult>;

    [[nodiscard]] auto isInitialized() const -> bool;

  private:
    std::unique_ptr<MessageChannel> _channel;
    std::mutex _mutex;
    int64_t _nextId = 1;
    bool _initialized = false;

    [[nodiscard]] auto sendRequest(std::string_view method,
                                   nlohmann::json params = nullptr,
                                   std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<nlohmann::json>;
};

} // namespace toolchat
