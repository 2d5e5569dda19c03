// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>
#include <ostream>
#include <print>

namespace toolchat::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto globalFile = std::ofstream {};
    auto globalMutex = std::mutex {};

    constexpr auto levelPrefix(Level l) -> std::string_view
    {
        switch (l)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    }
} // namespace

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    if (name == "error")
        return Level::Error;
    if (name == "warning" || name == "warn")
        return Level::Warning;
    if (name == "info")
        return Level::Info;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return std::nullopt;
}

void setCallback(LogCallback callback)
{
    auto const lock = std::lock_guard { globalMutex };
    globalCallback = std::move(callback);
}

auto setFile(std::string_view path) -> VoidResult
{
    auto const lock = std::lock_guard { globalMutex };
    if (globalFile.is_open())
        globalFile.close();

    if (path.empty())
        return {};

    globalFile.open(std::string(path), std::ios::app);
    if (!globalFile.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open log file: {}", path));
    return {};
}

void setLevel(Level level)
{
    globalLevel.store(level);
}

auto getLevel() -> Level
{
    return globalLevel.load();
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel.load())
        return;

    auto const lock = std::lock_guard { globalMutex };

    if (globalFile.is_open())
    {
        auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        std::println(globalFile, "{:%F %T} [{}] {}", now, levelPrefix(level), message);
        globalFile.flush();
    }

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    std::println(stderr, "[{}] {}", levelPrefix(level), message);
}

} // namespace toolchat::log
