// SPDX-License-Identifier: Apache-2.0
#include <toolchat/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace toolchat;

namespace
{

auto writeTempConfig(std::string_view name, std::string_view content) -> std::filesystem::path
{
    auto const path = std::filesystem::temp_directory_path() / name;
    auto file = std::ofstream(path);
    file << content;
    return path;
}

constexpr auto SampleConfig = R"({
    "providers": [
        { "id": "oa", "type": "openai", "name": "OpenAI", "apiKey": "sk-test", "baseUrl": "" },
        { "id": "local", "type": "custom", "name": "Local", "baseUrl": "http://localhost:8080/v1" }
    ],
    "modelConfigs": [
        { "id": "fast", "name": "Fast", "model": "gpt-4o-mini", "type": "openai",
          "temperature": 0.2, "maxTokens": 512, "extra": { "seed": 7 } }
    ],
    "agents": [
        { "name": "helper", "providerId": "oa", "modelId": "fast", "systemPrompt": "Be brief.",
          "tools": ["add"] },
        { "name": "open", "providerId": "local", "modelId": "fast" }
    ],
    "tools": [
        { "name": "add", "description": "Adds", "code": "return params.a + params.b;",
          "parameters": { "type": "object", "required": ["a", "b"] }, "timeout": 5000 },
        { "name": "scroll", "environment": "browser", "enabled": false },
        { "description": "nameless" }
    ],
    "mcpServers": {
        "files": { "command": "mcp-files", "args": ["--root", "/tmp"], "env": { "KEY": "value" } }
    },
    "orchestrator": { "maxIterations": 4, "streamTimeoutMs": 1500, "enableTools": false,
                      "sentinels": ["<call>"] },
    "toolWorker": { "command": "/usr/bin/node", "args": ["worker.js"] },
    "log": { "level": "debug", "file": "/tmp/toolchat.log" }
})";

} // namespace

TEST_CASE("defaultConfigDir returns a non-empty path", "[config]")
{
    auto const dir = defaultConfigDir();
    REQUIRE(!dir.empty());
    CHECK(dir.ends_with("toolchat"));
}

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("config.json"));
}

TEST_CASE("defaultToolWorkerScript finds the worker copied next to the executable", "[config]")
{
    auto const script = std::filesystem::path(defaultToolWorkerScript());
    CHECK(script.is_absolute());
    CHECK(script.filename() == "tool-worker.js");
    CHECK(std::filesystem::is_regular_file(script));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.providers.empty());
    CHECK(config.orchestrator.maxIterations == 10);
    CHECK(config.orchestrator.enableTools);
    CHECK(config.orchestrator.sentinels == std::vector<std::string> { "<tool_call>", "\"toolname\"" });
    CHECK(config.toolWorker.command == "node");
    REQUIRE(config.toolWorker.args.size() == 1);
    CHECK(config.toolWorker.args[0].ends_with("tool-worker.js"));
    CHECK(config.log.level == "info");
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[config]")
{
    auto const tempPath = writeTempConfig("toolchat_test_config.json", SampleConfig);

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());
    auto const& config = *result;

    SECTION("providers")
    {
        REQUIRE(config.providers.size() == 2);
        CHECK(config.providers[0].id == "oa");
        CHECK(config.providers[0].apiKey == "sk-test");
        CHECK(config.providers[1].type == ProviderType::Custom);
        CHECK(config.providers[1].baseUrl == "http://localhost:8080/v1");
    }

    SECTION("model configs")
    {
        REQUIRE(config.modelConfigs.size() == 1);
        auto const& model = config.modelConfigs[0];
        CHECK(model.model == "gpt-4o-mini");
        CHECK(model.temperature == 0.2);
        CHECK(model.maxTokens == 512);
        CHECK(!model.topP.has_value());
        CHECK(model.extra["seed"] == 7);
    }

    SECTION("agents")
    {
        REQUIRE(config.agents.size() == 2);
        CHECK(config.agents[0].systemPrompt == "Be brief.");
        REQUIRE(config.agents[0].tools.has_value());
        CHECK(*config.agents[0].tools == std::vector<std::string> { "add" });
        CHECK(!config.agents[1].tools.has_value());
    }

    SECTION("tools")
    {
        REQUIRE(config.tools.size() == 2);
        CHECK(config.tools[0].name == "add");
        CHECK(config.tools[0].timeoutMs == 5000);
        CHECK(config.tools[0].environment == ExecutionEnvironment::Node);
        CHECK(config.tools[0].parameterSchema["required"].size() == 2);
        CHECK(config.tools[1].environment == ExecutionEnvironment::Browser);
        CHECK(!config.tools[1].enabled);
        CHECK(config.tools[1].timeoutMs == DefaultToolTimeoutMs);
    }

    SECTION("MCP servers")
    {
        REQUIRE(config.mcpServers.size() == 1);
        auto const& server = config.mcpServers.at("files");
        CHECK(server.name == "files");
        CHECK(server.command == "mcp-files");
        CHECK(server.args == std::vector<std::string> { "--root", "/tmp" });
        CHECK(server.env.at("KEY") == "value");
    }

    SECTION("orchestrator, worker and log")
    {
        CHECK(config.orchestrator.maxIterations == 4);
        CHECK(config.orchestrator.streamTimeout == std::chrono::milliseconds(1500));
        CHECK(!config.orchestrator.enableTools);
        CHECK(config.orchestrator.sentinels == std::vector<std::string> { "<call>" });
        CHECK(config.toolWorker.command == "/usr/bin/node");
        CHECK(config.toolWorker.args == std::vector<std::string> { "worker.js" });
        CHECK(config.log.level == "debug");
        CHECK(config.log.file == "/tmp/toolchat.log");
    }

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile returns error for missing file", "[config]")
{
    auto result = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("loadConfigFromFile returns error for invalid JSON", "[config]")
{
    auto const tempPath = writeTempConfig("toolchat_test_invalid.json", "{ not valid json }");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
    CHECK(result.error().message.starts_with(tempPath.string() + ": "));

    std::filesystem::remove(tempPath);
}

TEST_CASE("configFromJson rejects invalid entries", "[config]")
{
    SECTION("not an object")
    {
        auto result = configFromJson(nlohmann::json::array());
        REQUIRE(!result.has_value());
        CHECK(result.error().message == "Configuration must be an object, got array");
    }

    SECTION("unknown provider type")
    {
        auto result = configFromJson(nlohmann::json::parse(R"({"providers":[{"id":"x","type":"palm"}]})"));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
        CHECK(result.error().message == "Unknown provider type \"palm\" in provider \"x\"");
    }

    SECTION("provider without id")
    {
        auto result = configFromJson(nlohmann::json::parse(R"({"providers":[{"type":"openai"}]})"));
        REQUIRE(!result.has_value());
        CHECK(result.error().message == "Provider entry without \"id\"");
    }

    SECTION("model config without id")
    {
        auto result = configFromJson(nlohmann::json::parse(R"({"modelConfigs":[{"model":"m"}]})"));
        REQUIRE(!result.has_value());
        CHECK(result.error().message == "Model config entry without \"id\"");
    }

    SECTION("non-positive iteration cap")
    {
        auto result = configFromJson(nlohmann::json::parse(R"({"orchestrator":{"maxIterations":0}})"));
        REQUIRE(!result.has_value());
        CHECK(result.error().message == "orchestrator.maxIterations must be at least 1, got 0");
    }

    SECTION("unknown log level")
    {
        auto result = configFromJson(nlohmann::json::parse(R"({"log":{"level":"loud"}})"));
        REQUIRE(!result.has_value());
        CHECK(result.error().message == "Unknown log level \"loud\"");
    }
}

TEST_CASE("saveConfigToFile writes a config that loads back", "[config]")
{
    auto const source = writeTempConfig("toolchat_test_source.json", SampleConfig);
    auto original = loadConfigFromFile(source.string());
    REQUIRE(original.has_value());

    auto const target = std::filesystem::temp_directory_path() / "toolchat_test_dir" / "saved.json";
    std::filesystem::remove_all(target.parent_path());
    REQUIRE(saveConfigToFile(target.string(), *original).has_value());
    REQUIRE(std::filesystem::exists(target));

    auto reloaded = loadConfigFromFile(target.string());
    REQUIRE(reloaded.has_value());
    CHECK(reloaded->providers.size() == 2);
    CHECK(reloaded->modelConfigs[0].extra["seed"] == 7);
    CHECK(reloaded->agents[0].tools == original->agents[0].tools);
    CHECK(!reloaded->agents[1].tools.has_value());
    CHECK(reloaded->tools[1].environment == ExecutionEnvironment::Browser);
    CHECK(reloaded->mcpServers.at("files").env.at("KEY") == "value");
    CHECK(reloaded->orchestrator.streamTimeout == std::chrono::milliseconds(1500));
    CHECK(reloaded->log.file == "/tmp/toolchat.log");

    std::filesystem::remove(source);
    std::filesystem::remove_all(target.parent_path());
}

TEST_CASE("find helpers report what is missing", "[config]")
{
    auto const tempPath = writeTempConfig("toolchat_test_lookup.json", SampleConfig);
    auto config = loadConfigFromFile(tempPath.string());
    std::filesystem::remove(tempPath);
    REQUIRE(config.has_value());

    CHECK(findProvider(*config, "oa").has_value());
    CHECK(findModelConfig(*config, "fast")->model == "gpt-4o-mini");
    CHECK(findTool(*config, "scroll")->environment == ExecutionEnvironment::Browser);
    CHECK(findAgent(*config, "helper")->providerId == "oa");

    auto provider = findProvider(*config, "nope");
    REQUIRE(!provider.has_value());
    CHECK(provider.error().code == ErrorCode::ConfigError);
    CHECK(provider.error().message == "Provider \"nope\" not found");

    CHECK(findModelConfig(*config, "slow").error().message == "Model config \"slow\" not found");
    CHECK(findTool(*config, "mul").error().message == "Tool \"mul\" not found");
    CHECK(findAgent(*config, "ghost").error().message == "Agent \"ghost\" not found");

    config->agents.push_back(AgentConfig {
        .name = "incomplete",
        .providerId = "oa",
        .modelId = {},
        .systemPrompt = {},
        .tools = std::nullopt,
    });
    CHECK(findAgent(*config, "incomplete").error().message == "Agent \"incomplete\" has no modelId");
}
