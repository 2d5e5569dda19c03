// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>

namespace toolchat
{

namespace
{

    auto xdgDir(char const* variable, std::string_view homeFallback) -> std::string
    {
        auto const* const xdg = std::getenv(variable);
        if (xdg && *xdg)
            return std::string(xdg) + "/toolchat";
        auto const* const home = std::getenv("HOME");
        if (home)
            return std::format("{}/{}/toolchat", home, homeFallback);
        return ".";
    }

    auto parseProviderType(const nlohmann::json& obj, std::string_view owner) -> Result<ProviderType>
    {
        auto const name = json::getStringOr(obj, "type", "openai");
        auto const type = providerTypeFromString(name);
        if (!type)
            return makeError(ErrorCode::ConfigError,
                             std::format("Unknown provider type \"{}\" in {}", name, owner));
        return *type;
    }

    auto parseProvider(const nlohmann::json& obj) -> Result<ProviderConfig>
    {
        auto provider = ProviderConfig {
            .id = json::getStringOr(obj, "id", ""),
            .type = ProviderType::OpenAi,
            .name = json::getStringOr(obj, "name", ""),
            .apiKey = json::getStringOr(obj, "apiKey", ""),
            .baseUrl = json::getStringOr(obj, "baseUrl", ""),
        };
        if (provider.id.empty())
            return makeError(ErrorCode::ConfigError, "Provider entry without \"id\"");

        auto type = parseProviderType(obj, std::format("provider \"{}\"", provider.id));
        if (!type)
            return std::unexpected(type.error());
        provider.type = *type;
        return provider;
    }

    auto parseModelConfig(const nlohmann::json& obj) -> Result<ModelConfig>
    {
        auto model = ModelConfig {
            .id = json::getStringOr(obj, "id", ""),
            .name = json::getStringOr(obj, "name", ""),
            .model = json::getStringOr(obj, "model", ""),
            .type = ProviderType::OpenAi,
            .temperature = json::getOptionalDouble(obj, "temperature"),
            .maxTokens = std::nullopt,
            .topP = json::getOptionalDouble(obj, "topP"),
            .extra = nlohmann::json::object(),
        };
        if (model.id.empty())
            return makeError(ErrorCode::ConfigError, "Model config entry without \"id\"");

        auto type = parseProviderType(obj, std::format("model config \"{}\"", model.id));
        if (!type)
            return std::unexpected(type.error());
        model.type = *type;

        if (obj.contains("maxTokens") && obj["maxTokens"].is_number_integer())
            model.maxTokens = obj["maxTokens"].get<int>();
        if (obj.contains("extra") && obj["extra"].is_object())
            model.extra = obj["extra"];
        return model;
    }

    auto parseAgent(const nlohmann::json& obj) -> AgentConfig
    {
        auto agent = AgentConfig {
            .name = json::getStringOr(obj, "name", ""),
            .providerId = json::getStringOr(obj, "providerId", ""),
            .modelId = json::getStringOr(obj, "modelId", ""),
            .systemPrompt = json::getStringOr(obj, "systemPrompt", ""),
            .tools = std::nullopt,
        };
        if (obj.contains("tools") && obj["tools"].is_array())
            agent.tools = json::getStringList(obj, "tools");
        return agent;
    }

    auto parseTool(const nlohmann::json& obj) -> ToolDefinition
    {
        auto tool = ToolDefinition {
            .name = json::getStringOr(obj, "name", ""),
            .description = json::getStringOr(obj, "description", ""),
            .code = json::getStringOr(obj, "code", ""),
            .parameterSchema = nlohmann::json::object(),
            .environment = environmentFromString(json::getStringOr(obj, "environment", "node")),
            .timeoutMs = json::getIntOr(obj, "timeout", DefaultToolTimeoutMs),
            .enabled = json::getBoolOr(obj, "enabled", true),
            .mcpServer = {},
            .mcpToolName = {},
        };
        if (obj.contains("parameters") && obj["parameters"].is_object())
            tool.parameterSchema = obj["parameters"];
        return tool;
    }

    auto toolToJson(const ToolDefinition& tool) -> nlohmann::json
    {
        return {
            { "name", tool.name },
            { "description", tool.description },
            { "code", tool.code },
            { "parameters", tool.parameterSchema },
            { "timeout", tool.timeoutMs },
            { "enabled", tool.enabled },
            { "environment", environmentToString(tool.environment) },
        };
    }

    auto processToJson(const ProcessConfig& process) -> nlohmann::json
    {
        auto obj = nlohmann::json { { "command", process.command }, { "args", process.args } };
        if (!process.env.empty())
            obj["env"] = process.env;
        return obj;
    }

    template <typename T, typename Key>
    auto findById(const std::vector<T>& items, Key T::*key, std::string_view id) -> const T*
    {
        auto const it = std::ranges::find_if(items, [&](const T& item) { return item.*key == id; });
        return it != items.end() ? &*it : nullptr;
    }

} // namespace

auto defaultConfigDir() -> std::string
{
    return xdgDir("XDG_CONFIG_HOME", ".config");
}

auto defaultDataDir() -> std::string
{
    return xdgDir("XDG_DATA_HOME", ".local/share");
}

auto defaultToolWorkerScript() -> std::string
{
    constexpr auto ScriptName = "tool-worker.js";

    auto ec = std::error_code {};
    auto const executable = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec)
        return ScriptName;

    auto const binDir = executable.parent_path();
    for (const auto& candidate: { binDir / ScriptName, binDir.parent_path() / "share" / "toolchat" / ScriptName })
    {
        if (std::filesystem::is_regular_file(candidate, ec))
            return candidate.string();
    }
    return ScriptName;
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto configFromJson(const nlohmann::json& root) -> Result<AppConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError,
                         std::format("Configuration must be an object, got {}", json::typeName(root)));

    auto config = AppConfig {};

    if (root.contains("providers") && root["providers"].is_array())
    {
        for (const auto& entry: root["providers"])
        {
            auto provider = parseProvider(entry);
            if (!provider)
                return std::unexpected(provider.error());
            config.providers.push_back(std::move(*provider));
        }
    }

    if (root.contains("modelConfigs") && root["modelConfigs"].is_array())
    {
        for (const auto& entry: root["modelConfigs"])
        {
            auto model = parseModelConfig(entry);
            if (!model)
                return std::unexpected(model.error());
            config.modelConfigs.push_back(std::move(*model));
        }
    }

    if (root.contains("agents") && root["agents"].is_array())
    {
        for (const auto& entry: root["agents"])
            config.agents.push_back(parseAgent(entry));
    }

    if (root.contains("tools") && root["tools"].is_array())
    {
        for (const auto& entry: root["tools"])
        {
            auto tool = parseTool(entry);
            if (tool.name.empty())
            {
                log::warning("Skipping tool entry without a name");
                continue;
            }
            config.tools.push_back(std::move(tool));
        }
    }

    // MCP servers section
    if (root.contains("mcpServers") && root["mcpServers"].is_object())
    {
        for (const auto& [name, serverJson]: root["mcpServers"].items())
        {
            config.mcpServers[name] = McpServerConfig {
                .name = name,
                .command = json::getStringOr(serverJson, "command", ""),
                .args = json::getStringList(serverJson, "args"),
                .env = json::getStringMap(serverJson, "env"),
            };
        }
    }

    if (root.contains("orchestrator"))
    {
        auto const& section = root["orchestrator"];
        auto& orchestrator = config.orchestrator;
        orchestrator.maxIterations = json::getIntOr(section, "maxIterations", orchestrator.maxIterations);
        orchestrator.streamTimeout = std::chrono::milliseconds(
            json::getIntOr(section, "streamTimeoutMs", static_cast<int>(orchestrator.streamTimeout.count())));
        orchestrator.enableTools = json::getBoolOr(section, "enableTools", orchestrator.enableTools);
        if (section.contains("sentinels") && section["sentinels"].is_array())
            orchestrator.sentinels = json::getStringList(section, "sentinels");
        if (orchestrator.maxIterations < 1)
            return makeError(ErrorCode::ConfigError,
                             std::format("orchestrator.maxIterations must be at least 1, got {}",
                                         orchestrator.maxIterations));
    }

    if (root.contains("toolWorker"))
    {
        auto const& section = root["toolWorker"];
        config.toolWorker.command = json::getStringOr(section, "command", config.toolWorker.command);
        if (section.contains("args"))
            config.toolWorker.args = json::getStringList(section, "args");
        config.toolWorker.env = json::getStringMap(section, "env");
    }

    if (root.contains("log"))
    {
        auto const& section = root["log"];
        config.log.level = json::getStringOr(section, "level", config.log.level);
        config.log.file = json::getStringOr(section, "file", "");
        if (!log::parseLevel(config.log.level))
            return makeError(ErrorCode::ConfigError, std::format("Unknown log level \"{}\"", config.log.level));
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, parseResult.error().message));

    return configFromJson(*parseResult);
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    auto providers = nlohmann::json::array();
    for (const auto& provider: config.providers)
    {
        providers.push_back({
            { "id", provider.id },
            { "type", providerTypeToString(provider.type) },
            { "name", provider.name },
            { "apiKey", provider.apiKey },
            { "baseUrl", provider.baseUrl },
        });
    }
    root["providers"] = std::move(providers);

    auto models = nlohmann::json::array();
    for (const auto& model: config.modelConfigs)
    {
        auto entry = nlohmann::json {
            { "id", model.id },
            { "name", model.name },
            { "model", model.model },
            { "type", providerTypeToString(model.type) },
        };
        if (model.temperature)
            entry["temperature"] = *model.temperature;
        if (model.maxTokens)
            entry["maxTokens"] = *model.maxTokens;
        if (model.topP)
            entry["topP"] = *model.topP;
        if (!model.extra.empty())
            entry["extra"] = model.extra;
        models.push_back(std::move(entry));
    }
    root["modelConfigs"] = std::move(models);

    auto agents = nlohmann::json::array();
    for (const auto& agent: config.agents)
    {
        auto entry = nlohmann::json {
            { "name", agent.name },
            { "providerId", agent.providerId },
            { "modelId", agent.modelId },
            { "systemPrompt", agent.systemPrompt },
        };
        if (agent.tools)
            entry["tools"] = *agent.tools;
        agents.push_back(std::move(entry));
    }
    root["agents"] = std::move(agents);

    auto tools = nlohmann::json::array();
    for (const auto& tool: config.tools)
        tools.push_back(toolToJson(tool));
    root["tools"] = std::move(tools);

    if (!config.mcpServers.empty())
    {
        auto servers = nlohmann::json::object();
        for (const auto& [name, server]: config.mcpServers)
        {
            servers[name] = processToJson(
                ProcessConfig { .command = server.command, .args = server.args, .env = server.env });
        }
        root["mcpServers"] = std::move(servers);
    }

    root["orchestrator"] = {
        { "maxIterations", config.orchestrator.maxIterations },
        { "streamTimeoutMs", config.orchestrator.streamTimeout.count() },
        { "sentinels", config.orchestrator.sentinels },
        { "enableTools", config.orchestrator.enableTools },
    };
    root["toolWorker"] = processToJson(config.toolWorker);
    root["log"] = { { "level", config.log.level }, { "file", config.log.file } };

    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto findProvider(const AppConfig& config, std::string_view id) -> Result<ProviderConfig>
{
    if (auto const* provider = findById(config.providers, &ProviderConfig::id, id))
        return *provider;
    return makeError(ErrorCode::ConfigError, std::format("Provider \"{}\" not found", id));
}

auto findModelConfig(const AppConfig& config, std::string_view id) -> Result<ModelConfig>
{
    if (auto const* model = findById(config.modelConfigs, &ModelConfig::id, id))
        return *model;
    return makeError(ErrorCode::ConfigError, std::format("Model config \"{}\" not found", id));
}

auto findAgent(const AppConfig& config, std::string_view name) -> Result<AgentConfig>
{
    auto const* agent = findById(config.agents, &AgentConfig::name, name);
    if (!agent)
        return makeError(ErrorCode::ConfigError, std::format("Agent \"{}\" not found", name));
    if (agent->providerId.empty())
        return makeError(ErrorCode::ConfigError, std::format("Agent \"{}\" has no providerId", name));
    if (agent->modelId.empty())
        return makeError(ErrorCode::ConfigError, std::format("Agent \"{}\" has no modelId", name));
    return *agent;
}

auto findTool(const AppConfig& config, std::string_view name) -> Result<ToolDefinition>
{
    if (auto const* tool = findById(config.tools, &ToolDefinition::name, name))
        return *tool;
    return makeError(ErrorCode::ConfigError, std::format("Tool \"{}\" not found", name));
}

} // namespace toolchat
