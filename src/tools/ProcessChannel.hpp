// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tools/MessageChannel.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolchat
{

/// @brief Command line and extra environment of a child process.
struct ProcessConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env; ///< Added to the inherited environment.
};

/// @brief MessageChannel over the stdin/stdout pipes of a spawned child process.
///
/// POSIX only. The child's stderr is inherited.
class ProcessChannel: public MessageChannel
{
  public:
    ProcessChannel();
    ~ProcessChannel() override;

    ProcessChannel(const ProcessChannel&) = delete;
    ProcessChannel& operator=(const ProcessChannel&) = delete;

    /// @brief Spawns the process, searching PATH for the command.
    [[nodiscard]] auto start(const ProcessConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive(std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<nlohmann::json> override;

    /// @brief Closes the pipes, asks the child to terminate and reaps it.
    void close() override;

    /// @brief Kills the child with SIGKILL and reaps it.
    void kill();

    /// @brief Reaps the child after it closed its output.
    /// @return The exit status, or std::nullopt if it was killed by a signal or never started.
    [[nodiscard]] auto wait() -> std::optional<int>;

    [[nodiscard]] auto isConnected() const -> bool override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolchat
