// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolchat
{

/// @brief The role of a message participant in a conversation.
enum class Role
{
    System,
    User,
    Assistant,
    Tool,
};

[[nodiscard]] constexpr auto roleToString(Role role) -> std::string_view
{
    switch (role)
    {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "unknown";
}

/// @brief Parses a string to a Role enum value.
/// @return The corresponding Role, or Role::User if unknown.
[[nodiscard]] constexpr auto roleFromString(std::string_view str) -> Role
{
    if (str == "system")
        return Role::System;
    if (str == "assistant")
        return Role::Assistant;
    if (str == "tool")
        return Role::Tool;
    return Role::User;
}

/// @brief A "call this tool with these parameters" instruction taken from model output.
struct ToolCallDirective
{
    std::string id;
    std::string toolName;
    nlohmann::json parameters = nlohmann::json::object();
};

/// @brief Where a tool's code runs.
enum class ExecutionEnvironment : std::uint8_t
{
    Node,    ///< Isolated out-of-process worker.
    Browser, ///< Forwarded to the front-end execution context.
    Mcp,     ///< Owned by an MCP server.
};

[[nodiscard]] constexpr auto environmentToString(ExecutionEnvironment env) -> std::string_view
{
    switch (env)
    {
        case ExecutionEnvironment::Node: return "node";
        case ExecutionEnvironment::Browser: return "browser";
        case ExecutionEnvironment::Mcp: return "mcp";
    }
    return "node";
}

[[nodiscard]] constexpr auto environmentFromString(std::string_view str) -> ExecutionEnvironment
{
    if (str == "browser")
        return ExecutionEnvironment::Browser;
    if (str == "mcp")
        return ExecutionEnvironment::Mcp;
    return ExecutionEnvironment::Node;
}

/// @brief Default per-tool execution timeout.
constexpr auto DefaultToolTimeoutMs = 30000;

/// @brief Defines a tool that the model can invoke.
struct ToolDefinition
{
    std::string name;
    std::string description;
    std::string code;
    nlohmann::json parameterSchema = nlohmann::json::object();
    ExecutionEnvironment environment = ExecutionEnvironment::Node;
    int timeoutMs = DefaultToolTimeoutMs;
    bool enabled = true;
    std::string mcpServer;   // For ExecutionEnvironment::Mcp
    std::string mcpToolName; // Name on the MCP server, when it differs from name
};

/// @brief Lifecycle state of a single tool call.
enum class ToolStatus : std::uint8_t
{
    Executing,
    Completed,
    Failed,
};

[[nodiscard]] constexpr auto toolStatusToString(ToolStatus status) -> std::string_view
{
    switch (status)
    {
        case ToolStatus::Executing: return "executing";
        case ToolStatus::Completed: return "completed";
        case ToolStatus::Failed: return "failed";
    }
    return "executing";
}

/// @brief Outcome of a tool call; terminal (Completed or Failed) exactly once.
struct ToolCallResult
{
    std::string toolName;
    nlohmann::json parameters = nlohmann::json::object();
    ToolStatus status = ToolStatus::Executing;
    std::optional<nlohmann::json> result;
    std::optional<std::string> error;
    std::optional<int64_t> executionTimeMs;

    [[nodiscard]] auto isTerminal() const -> bool { return status != ToolStatus::Executing; }

    auto operator==(const ToolCallResult&) const -> bool = default;
};

/// @brief Identity key of a tool call: name plus canonical JSON of its parameters.
///
/// Two concurrent calls with the same key are the same logical call.
[[nodiscard]] auto callIdentity(std::string_view toolName, const nlohmann::json& parameters) -> std::string;

/// @brief A single entry of the durable conversation log.
struct ConversationMessage
{
    Role role = Role::User;
    std::string content;
    std::string toolCallId;                   // For Role::Tool messages
    std::vector<ToolCallDirective> toolCalls; // Structured calls made by Role::Assistant
};

/// @brief Serializes a message as {role, content, toolCallId?, toolCalls?}.
[[nodiscard]] auto toJson(const ConversationMessage& message) -> nlohmann::json;

/// @brief Reads a message written by toJson(); unknown fields are ignored.
[[nodiscard]] auto messageFromJson(const nlohmann::json& value) -> ConversationMessage;

} // namespace toolchat
