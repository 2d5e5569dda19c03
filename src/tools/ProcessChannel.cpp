// SPDX-License-Identifier: Apache-2.0
#include "ProcessChannel.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <mutex>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace toolchat
{

namespace
{
    std::once_flag ignoreSigpipeFlag;
}

struct ProcessChannel::Impl
{
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    bool connected = false;
    std::string readBuffer;
    std::string command;

    void closePipes()
    {
        if (stdinWrite >= 0)
        {
            ::close(stdinWrite);
            stdinWrite = -1;
        }
        if (stdoutRead >= 0)
        {
            ::close(stdoutRead);
            stdoutRead = -1;
        }
    }

    auto reap() -> std::optional<int>
    {
        if (childPid <= 0)
            return std::nullopt;

        int status = 0;
        while (waitpid(childPid, &status, 0) < 0 && errno == EINTR)
        {
        }
        childPid = -1;

        if (WIFEXITED(status))
            return WEXITSTATUS(status);
        return std::nullopt;
    }
};

ProcessChannel::ProcessChannel(): _impl(std::make_unique<Impl>())
{
    // A child that exits early must not take the host down on the next write.
    std::call_once(ignoreSigpipeFlag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

ProcessChannel::~ProcessChannel()
{
    close();
}

auto ProcessChannel::start(const ProcessConfig& config) -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::TransportError, "Process already running");

    int stdinPipe[2];
    int stdoutPipe[2];

    // O_CLOEXEC keeps concurrently spawned siblings from inheriting each other's pipes.
    if (pipe2(stdinPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::TransportError, "Failed to create stdin pipe");
    if (pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::TransportError, "Failed to create stdout pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);

    auto argStrings = std::vector<std::string> { config.command };
    argStrings.insert(argStrings.end(), config.args.begin(), config.args.end());
    auto argv = std::vector<char*> {};
    for (auto& arg: argStrings)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
            envStrings.emplace_back(*e);
    }
    for (const auto& [key, value]: config.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    auto const status = posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        return makeError(ErrorCode::TransportError,
                         std::format("Failed to spawn process '{}': {}", config.command, std::strerror(status)));
    }

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->connected = true;
    _impl->readBuffer.clear();
    _impl->command = config.command;
    log::debug("Process started: {} (pid {})", config.command, pid);
    return {};
}

auto ProcessChannel::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Process not running");

    auto const data = json::canonical(message) + "\n";
    auto offset = size_t { 0 };
    while (offset < data.size())
    {
        auto const written = ::write(_impl->stdinWrite, data.data() + offset, data.size() - offset);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError, "Failed to write to process stdin");
        }
        offset += static_cast<size_t>(written);
    }
    return {};
}

auto ProcessChannel::receive(std::optional<std::chrono::milliseconds> timeout) -> Result<nlohmann::json>
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Process not running");

    auto const deadline = timeout ? std::optional(std::chrono::steady_clock::now() + *timeout) : std::nullopt;

    while (true)
    {
        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);

            if (line.empty())
                continue;

            return json::parse(line);
        }

        auto waitMs = -1;
        if (deadline)
        {
            auto const remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
                return makeError(ErrorCode::TimeoutError,
                                 std::format("No output from '{}' within {}ms", _impl->command, timeout->count()));
            waitMs = static_cast<int>(remaining.count());
        }

        auto pfd = pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&pfd, 1, waitMs);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError, "Failed to poll process stdout");
        }
        if (ready == 0)
            continue; // deadline check above reports the timeout

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead <= 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, "Process stdout closed");
        }
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }
}

void ProcessChannel::close()
{
    _impl->connected = false;
    _impl->closePipes();

    if (_impl->childPid > 0)
    {
        ::kill(_impl->childPid, SIGTERM);
        (void) _impl->reap();
        log::debug("Process closed: {}", _impl->command);
    }
}

void ProcessChannel::kill()
{
    _impl->connected = false;
    if (_impl->childPid > 0)
    {
        ::kill(_impl->childPid, SIGKILL);
        (void) _impl->reap();
        log::debug("Process killed: {}", _impl->command);
    }
    _impl->closePipes();
}

auto ProcessChannel::wait() -> std::optional<int>
{
    _impl->connected = false;
    _impl->closePipes();
    return _impl->reap();
}

auto ProcessChannel::isConnected() const -> bool
{
    return _impl->connected;
}

} // namespace toolchat
