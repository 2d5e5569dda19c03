// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <toolchat/Config.hpp>

#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace toolchat
{

class FileReader;
class HistoryStore;
class HttpClient;

/// @brief Command line selections that are not part of the configuration file.
struct SessionOptions
{
    std::string projectPath;
    std::string agentName;
    std::vector<std::string> attachedFiles; ///< Sent with every message until a turn succeeds.
};

/// @brief Replacements for the collaborators App creates itself; null keeps the default.
struct AppServices
{
    HttpClient* http = nullptr;
    HistoryStore* history = nullptr;
    FileReader* files = nullptr;
};

/// @brief Line-oriented terminal front-end: reads user lines, streams replies.
class App
{
  public:
    App(AppConfig config, SessionOptions options, AppServices services = {});
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Applies the log settings, connects MCP servers and loads the agent's history.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs until /quit or end of input.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run(std::istream& input, std::ostream& output) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolchat
