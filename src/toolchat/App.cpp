// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <conversation/HistoryTransformer.hpp>
#include <conversation/MessageReconstructor.hpp>
#include <core/Log.hpp>
#include <llm/CurlHttpClient.hpp>
#include <toolchat/ChatService.hpp>
#include <toolchat/FileReader.hpp>
#include <toolchat/HistoryStore.hpp>
#include <tools/McpServerManager.hpp>
#include <tools/WorkerExecutor.hpp>

#include <filesystem>
#include <format>
#include <ostream>
#include <print>
#include <string_view>

namespace toolchat
{

namespace
{

    auto cardSummary(const ToolCallResult& call) -> std::string
    {
        switch (call.status)
        {
            case ToolStatus::Completed:
                return std::format("[tool] {} completed in {}ms", call.toolName, call.executionTimeMs.value_or(0));
            case ToolStatus::Failed:
                return std::format("[tool] {} failed: {}", call.toolName, call.error.value_or(""));
            case ToolStatus::Executing: break;
        }
        return std::format("[tool] {} still executing", call.toolName);
    }

} // namespace

struct App::Impl
{
    AppConfig config;
    SessionOptions options;
    ProjectContext project;

    CurlHttpClient ownHttp;
    JsonHistoryStore ownHistory;
    FilesystemReader ownFiles;
    HttpClient& http;
    HistoryStore& history;
    FileReader& files;
    WorkerExecutor worker;
    McpServerManager servers;
    std::unique_ptr<ChatService> service;
    MessageReconstructor display;

    Impl(AppConfig cfg, SessionOptions opts, AppServices services):
        config(std::move(cfg)),
        options(std::move(opts)),
        project { .path = options.projectPath },
        ownHistory(defaultDataDir()),
        http(services.http ? *services.http : ownHttp),
        history(services.history ? *services.history : ownHistory),
        files(services.files ? *services.files : ownFiles),
        worker(config.toolWorker),
        display([](std::string_view message) { std::println(stderr, "error: {}", message); })
    {
    }

    auto applyLogConfig() -> VoidResult
    {
        if (auto const level = log::parseLevel(config.log.level))
            log::setLevel(*level);
        return log::setFile(config.log.file);
    }

    void printNewCards(std::ostream& output, size_t firstIndex)
    {
        auto const& messages = display.messages();
        for (auto i = firstIndex; i < messages.size(); ++i)
        {
            if (messages[i].toolCall)
                std::println(output, "{}", cardSummary(*messages[i].toolCall));
        }
    }

    auto sendLine(std::string line, std::ostream& output) -> bool
    {
        display.userMessage(line);
        auto const firstIndex = display.messages().size();

        auto callbacks = TurnCallbacks {
            .onChunk =
                [&](std::string_view text) {
                    display.chunk(text);
                    output << text << std::flush;
                },
            .onReasoning =
                [&](std::string_view text) {
                    display.reasoning(text);
                    std::print(stderr, "{}", text);
                },
            .onComplete = [&](std::string_view) { display.complete(); },
            .onError = [&](std::string_view message) { display.error(message); },
            .onToolStarted = [&](std::string_view name,
                                 const nlohmann::json& params) { display.toolStarted(name, params); },
            .onToolCompleted = [&](std::string_view name,
                                   const nlohmann::json& params,
                                   const nlohmann::json& result,
                                   int64_t ms) { display.toolCompleted(name, params, result, ms); },
            .onToolFailed = [&](std::string_view name,
                                const nlohmann::json& params,
                                std::string_view error) { display.toolFailed(name, params, error); },
        };

        auto result = service->sendTurn(project, options.agentName, std::move(line), options.attachedFiles, callbacks);
        output << '\n';
        if (!result)
            return false;

        // Attachments go with the first successful message of the session.
        options.attachedFiles.clear();

        printNewCards(output, firstIndex);
        return true;
    }
};

App::App(AppConfig config, SessionOptions options, AppServices services):
    _impl(std::make_unique<Impl>(std::move(config), std::move(options), services))
{
}

App::~App()
{
    _impl->servers.shutdown();
}

auto App::initialize() -> VoidResult
{
    if (auto logResult = _impl->applyLogConfig(); !logResult)
        return logResult;

    if (_impl->project.path.empty())
        _impl->project.path = std::filesystem::current_path().string();

    if (_impl->options.agentName.empty())
    {
        if (_impl->config.agents.empty())
            return makeError(ErrorCode::ConfigError, "No agent configured");
        _impl->options.agentName = _impl->config.agents.front().name;
    }

    // Resolves the agent up front so a broken configuration fails before the prompt.
    auto agent = findAgent(_impl->config, _impl->options.agentName);
    if (!agent)
        return std::unexpected(agent.error());

    if (_impl->config.orchestrator.enableTools)
    {
        for (const auto& [name, serverConfig]: _impl->config.mcpServers)
        {
            auto addResult = _impl->servers.addServer(serverConfig);
            if (!addResult)
                log::warning("Failed to connect MCP server '{}': {}", name, addResult.error().message);
        }
    }

    _impl->service = std::make_unique<ChatService>(_impl->config,
                                                   ChatServiceDeps {
                                                       .http = _impl->http,
                                                       .history = _impl->history,
                                                       .files = _impl->files,
                                                       .nodeExecutor = _impl->worker,
                                                       .mcp = &_impl->servers,
                                                       .frontend = nullptr,
                                                   });

    auto history = _impl->service->loadHistory(_impl->project, agent->name);
    if (!history)
        return std::unexpected(history.error());

    auto const transformer = HistoryTransformer(_impl->config.orchestrator.sentinels);
    _impl->display.load(transformer.transform(*history));

    log::info("Agent {} ready with {} previous messages", agent->name, history->size());
    return {};
}

auto App::run(std::istream& input, std::ostream& output) -> int
{
    if (!_impl->service)
    {
        log::error("App::run called before initialize");
        return 1;
    }

    auto const& previous = _impl->display.messages();
    if (!previous.empty())
        std::println(output, "({} messages in history, /clear to start over)", previous.size());

    auto line = std::string {};
    while (true)
    {
        output << "> " << std::flush;
        if (!std::getline(input, line))
            break;
        if (line.empty())
            continue;
        if (line == "/quit")
            break;
        if (line == "/clear")
        {
            if (auto cleared = _impl->service->clearHistory(_impl->project, _impl->options.agentName); !cleared)
                log::error("Failed to clear history: {}", cleared.error());
            _impl->display.clear();
            std::println(output, "History cleared.");
            continue;
        }

        (void) _impl->sendLine(std::move(line), output);
    }
    return 0;
}

} // namespace toolchat
