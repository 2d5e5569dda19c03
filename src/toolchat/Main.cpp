// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <toolchat/App.hpp>
#include <toolchat/Config.hpp>

#include <CLI/CLI.hpp>

#include <iostream>

int main(int argc, char** argv)
{
    auto app = CLI::App { "toolchat - streaming LLM chat with tool calling" };

    auto configPath = std::string {};
    auto options = toolchat::SessionOptions {};
    auto maxIterations = 0;
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-p,--project", options.projectPath, "Project directory (default: current directory)");
    app.add_option("-a,--agent", options.agentName, "Agent name (default: first configured agent)");
    app.add_option("-f,--file", options.attachedFiles, "File to attach to the first message (repeatable)");
    app.add_option("--max-iterations", maxIterations, "Maximum stream calls per turn")->check(CLI::PositiveNumber);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        toolchat::log::setLevel(toolchat::log::Level::Debug);

    auto configResult = configPath.empty() ? toolchat::loadConfig() : toolchat::loadConfigFromFile(configPath);
    if (!configResult)
    {
        toolchat::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    if (maxIterations > 0)
        config.orchestrator.maxIterations = maxIterations;
    if (verbose)
        config.log.level = "debug";

    auto application = toolchat::App(std::move(config), std::move(options));
    auto initResult = application.initialize();
    if (!initResult)
    {
        toolchat::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run(std::cin, std::cout);
}
