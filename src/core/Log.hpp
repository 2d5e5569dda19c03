// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace toolchat::log
{

/// @brief Verbosity level for log messages.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Callback type that receives all log messages.
/// @param level The log level of the message.
/// @param message The formatted log message text (without level prefix).
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Parses a level name ("error", "warning"/"warn", "info", "debug", "trace").
/// @return The level, or std::nullopt for an unknown name.
[[nodiscard]] auto parseLevel(std::string_view name) -> std::optional<Level>;

/// @brief Sets a callback that receives all log messages.
///
/// When set, log messages are routed to the callback instead of stderr.
/// Pass an empty callback to revert to stderr output.
void setCallback(LogCallback callback);

/// @brief Mirrors every emitted line into an append-only file.
///
/// Pass an empty path to stop mirroring.
/// @return Success, or an IoError if the file cannot be opened.
[[nodiscard]] auto setFile(std::string_view path) -> VoidResult;

/// @brief Sets the global log verbosity level.
void setLevel(Level level);

/// @brief Returns the current global log verbosity level.
[[nodiscard]] auto getLevel() -> Level;

/// @brief Writes a log message at the given level.
///
/// Thread-safe; tool calls of one iteration log from worker threads.
void write(Level level, std::string_view message);

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Info)
        write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Debug)
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Trace)
        write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace toolchat::log
