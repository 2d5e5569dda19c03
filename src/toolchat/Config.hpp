// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/Orchestrator.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <llm/ProviderConfig.hpp>
#include <tools/McpServerManager.hpp>
#include <tools/ProcessChannel.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolchat
{

/// @brief A named assistant persona bound to one provider and model.
struct AgentConfig
{
    std::string name;
    std::string providerId;
    std::string modelId;
    std::string systemPrompt;

    /// @brief Names of the tools this agent may use; std::nullopt means all enabled tools.
    std::optional<std::vector<std::string>> tools;
};

/// @brief Logging configuration section.
struct LogConfig
{
    std::string level = "info";
    std::string file; ///< Empty disables the log file.
};

/// @brief Path of the bundled node tool worker script.
///
/// Looks next to the running executable (build tree), then in ../share/toolchat
/// (install tree). Falls back to "tool-worker.js" relative to the working directory.
[[nodiscard]] auto defaultToolWorkerScript() -> std::string;

/// @brief Top-level application configuration.
struct AppConfig
{
    std::vector<ProviderConfig> providers;
    std::vector<ModelConfig> modelConfigs;
    std::vector<AgentConfig> agents;
    std::vector<ToolDefinition> tools;
    std::map<std::string, McpServerConfig> mcpServers;
    OrchestratorConfig orchestrator;
    ProcessConfig toolWorker { .command = "node", .args = { defaultToolWorkerScript() }, .env = {} };
    LogConfig log;
};

/// @brief Loads the application configuration from the default config path.
///
/// A missing file yields the defaults.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @return The configuration, or a ConfigError if the file is unreadable or malformed.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses an already decoded configuration document.
[[nodiscard]] auto configFromJson(const nlohmann::json& root) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating its directory.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief $XDG_CONFIG_HOME/toolchat or ~/.config/toolchat.
[[nodiscard]] auto defaultConfigDir() -> std::string;

[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief $XDG_DATA_HOME/toolchat or ~/.local/share/toolchat.
[[nodiscard]] auto defaultDataDir() -> std::string;

[[nodiscard]] auto findProvider(const AppConfig& config, std::string_view id) -> Result<ProviderConfig>;
[[nodiscard]] auto findModelConfig(const AppConfig& config, std::string_view id) -> Result<ModelConfig>;
[[nodiscard]] auto findAgent(const AppConfig& config, std::string_view name) -> Result<AgentConfig>;
[[nodiscard]] auto findTool(const AppConfig& config, std::string_view name) -> Result<ToolDefinition>;

} // namespace toolchat
