// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <tools/McpClient.hpp>
#include <tools/ProcessChannel.hpp>
#include <tools/ToolExecutor.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace toolchat
{

struct McpServerConfig
{
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

/// @brief Owns the MCP server connections and executes mcp-environment tools.
class McpServerManager: public ToolExecutor
{
  public:
    McpServerManager();
    ~McpServerManager() override;

    McpServerManager(const McpServerManager&) = delete;
    McpServerManager& operator=(const McpServerManager&) = delete;

    /// @brief Spawns, initializes and lists the tools of a server.
    [[nodiscard]] auto addServer(const McpServerConfig& config) -> VoidResult;

    /// @brief Registers an already connected client (used with in-process channels).
    [[nodiscard]] auto addClient(std::string name, std::unique_ptr<McpClient> client) -> VoidResult;

    /// @brief Tools of all connected servers.
    [[nodiscard]] auto allTools() const -> std::vector<ToolDefinition>;

    [[nodiscard]] auto execute(const ToolDefinition& tool, const nlohmann::json& parameters)
        -> Result<ToolOutput> override;

    [[nodiscard]] auto serverCount() const -> size_t;

    void shutdown();

  private:
    struct ServerEntry
    {
        std::unique_ptr<McpClient> client;
        std::vector<ToolDefinition> tools;
    };

    std::map<std::string, ServerEntry> _servers;
};

} // namespace toolchat
