// SPDX-License-Identifier: Apache-2.0
#include "FrontendBridge.hpp"

#include <core/Log.hpp>

#include <chrono>
#include <format>

namespace toolchat
{

void FrontendBridge::attach(FrontendChannel* channel)
{
    auto const lock = std::lock_guard { _mutex };
    _channel = channel;
}

auto FrontendBridge::isAttached() const -> bool
{
    auto const lock = std::lock_guard { _mutex };
    return _channel != nullptr;
}

auto FrontendBridge::pendingCount() const -> size_t
{
    auto const lock = std::lock_guard { _mutex };
    return _slots.size();
}

auto FrontendBridge::execute(const ToolDefinition& tool, const nlohmann::json& parameters) -> Result<ToolOutput>
{
    auto const identity = callIdentity(tool.name, parameters);
    auto future = std::future<FrontendResponse> {};
    FrontendChannel* channel = nullptr;

    {
        auto const lock = std::lock_guard { _mutex };
        if (!_channel)
            return makeError(ErrorCode::ToolCallError, "No front-end execution context available");
        if (_slots.contains(identity))
            return makeError(ErrorCode::InvalidArgument,
                             std::format("Tool \"{}\" is already running with the same parameters", tool.name));

        future = _slots[identity].get_future();
        channel = _channel;
    }

    channel->dispatch(FrontendRequest {
        .identity = identity,
        .toolName = tool.name,
        .code = tool.code,
        .parameters = parameters,
        .timeoutMs = tool.timeoutMs,
    });

    if (future.wait_for(std::chrono::milliseconds(tool.timeoutMs)) != std::future_status::ready)
    {
        auto const lock = std::lock_guard { _mutex };
        _slots.erase(identity);
        log::warning("Browser tool {} timed out after {}ms", tool.name, tool.timeoutMs);
        return makeError(ErrorCode::TimeoutError,
                         std::format("Browser tool execution timed out after {}ms", tool.timeoutMs));
    }

    auto response = future.get();
    if (!response.success)
        return makeError(ErrorCode::ToolCallError,
                         response.error.empty() ? std::string("Browser tool execution failed") : response.error);

    return ToolOutput { .result = std::move(response.result), .executionTimeMs = response.executionTimeMs };
}

auto FrontendBridge::deliverResult(std::string_view identity, FrontendResponse response) -> bool
{
    auto const lock = std::lock_guard { _mutex };
    auto const it = _slots.find(identity);
    if (it == _slots.end())
    {
        log::debug("Dropping front-end result without a waiting call: {}", identity);
        return false;
    }

    it->second.set_value(std::move(response));
    _slots.erase(it);
    return true;
}

} // namespace toolchat
