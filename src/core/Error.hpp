// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace toolchat
{

/// @brief Error codes for categorizing failures across the engine.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    TransportError,
    ProtocolError,
    ToolCallError,
    ValidationError,
    TimeoutError,
};

/// @brief Returns a short, stable name for an error code (used in log lines).
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid-argument";
        case ErrorCode::IoError: return "io";
        case ErrorCode::ConfigError: return "config";
        case ErrorCode::TransportError: return "transport";
        case ErrorCode::ProtocolError: return "protocol";
        case ErrorCode::ToolCallError: return "tool-call";
        case ErrorCode::ValidationError: return "validation";
        case ErrorCode::TimeoutError: return "timeout";
    }
    return "unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace toolchat

template <>
struct std::formatter<toolchat::Error>: std::formatter<std::string>
{
    auto format(const toolchat::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", toolchat::errorCodeName(error.code), error.message), ctx);
    }
};
