// SPDX-License-Identifier: Apache-2.0
#include "ToolResultText.hpp"

#include <core/JsonUtils.hpp>

#include <charconv>
#include <format>

namespace toolchat
{

namespace
{

    constexpr auto SuccessMarker = std::string_view("\" executed successfully:\n");
    constexpr auto FailureMarker = std::string_view("\" failed: ");
    constexpr auto TimingPrefix = std::string_view("\n(Execution time: ");
    constexpr auto TimingSuffix = std::string_view("ms)");

    /// Returns the position right after `Tool "<name>` if @p marker follows a quoted name.
    auto findAfterName(std::string_view content, std::string_view marker) -> std::size_t
    {
        constexpr auto Prefix = std::string_view("Tool \"");
        auto const start = content.find(Prefix);
        if (start == std::string_view::npos)
            return std::string_view::npos;
        auto const nameStart = start + Prefix.size();
        auto const quote = content.find('"', nameStart);
        if (quote == std::string_view::npos || quote == nameStart || !content.substr(quote).starts_with(marker))
            return std::string_view::npos;
        return quote + marker.size();
    }

} // namespace

auto formatToolResultMessage(const ToolCallResult& result) -> std::string
{
    if (result.status == ToolStatus::Completed)
        return std::format("Tool \"{}\" executed successfully:\n{}\n(Execution time: {}ms)",
                           result.toolName,
                           result.result.value_or(nullptr).dump(2, ' ', false, nlohmann::json::error_handler_t::replace),
                           result.executionTimeMs.value_or(0));

    return std::format("Tool \"{}\" failed: {}", result.toolName, result.error.value_or("Tool execution failed"));
}

auto parseToolResultMessage(std::string_view content) -> ToolCallResult
{
    auto parsed = ToolCallResult {};

    if (auto const bodyStart = findAfterName(content, SuccessMarker); bodyStart != std::string_view::npos)
    {
        auto const timing = content.rfind(TimingPrefix);
        if (timing != std::string_view::npos && timing >= bodyStart && content.ends_with(TimingSuffix))
        {
            auto const digits = content.substr(timing + TimingPrefix.size(),
                                               content.size() - timing - TimingPrefix.size() - TimingSuffix.size());
            auto milliseconds = int64_t { 0 };
            auto const [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), milliseconds);
            if (ec == std::errc {} && end == digits.data() + digits.size() && !digits.empty())
            {
                auto const body = content.substr(bodyStart, timing - bodyStart);
                auto value = json::parse(body);
                parsed.status = ToolStatus::Completed;
                parsed.result = value ? std::move(*value) : nlohmann::json(std::string(body));
                parsed.executionTimeMs = milliseconds;
                return parsed;
            }
        }
    }

    if (auto const errorStart = findAfterName(content, FailureMarker); errorStart != std::string_view::npos)
    {
        auto error = content.substr(errorStart);
        error = error.substr(0, error.find('\n'));
        if (!error.empty())
        {
            parsed.status = ToolStatus::Failed;
            parsed.error = std::string(error);
            return parsed;
        }
    }

    parsed.status = ToolStatus::Completed;
    parsed.result = std::string(content);
    return parsed;
}

} // namespace toolchat
