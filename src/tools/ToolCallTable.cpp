// SPDX-License-Identifier: Apache-2.0
#include "ToolCallTable.hpp"

#include <format>

namespace toolchat
{

auto ToolCallTable::begin(const std::string& identity, const ToolCallDirective& directive) -> VoidResult
{
    auto const lock = std::lock_guard { _mutex };

    auto const it = _calls.find(identity);
    if (it != _calls.end() && !it->second.isTerminal())
        return makeError(ErrorCode::InvalidArgument, std::format("Tool call already executing: {}", identity));

    if (it == _calls.end())
        _order.push_back(identity);

    _calls[identity] = ToolCallResult {
        .toolName = directive.toolName,
        .parameters = directive.parameters,
        .status = ToolStatus::Executing,
        .result = std::nullopt,
        .error = std::nullopt,
        .executionTimeMs = std::nullopt,
    };
    return {};
}

auto ToolCallTable::finish(const std::string& identity, ToolCallResult result) -> bool
{
    auto const lock = std::lock_guard { _mutex };

    auto const it = _calls.find(identity);
    if (it == _calls.end() || it->second.isTerminal() || !result.isTerminal())
        return false;

    it->second = std::move(result);
    return true;
}

auto ToolCallTable::find(const std::string& identity) const -> std::optional<ToolCallResult>
{
    auto const lock = std::lock_guard { _mutex };
    auto const it = _calls.find(identity);
    if (it == _calls.end())
        return std::nullopt;
    return it->second;
}

auto ToolCallTable::entries() const -> std::vector<ToolCallResult>
{
    auto const lock = std::lock_guard { _mutex };
    auto result = std::vector<ToolCallResult> {};
    result.reserve(_order.size());
    for (const auto& identity: _order)
        result.push_back(_calls.at(identity));
    return result;
}

auto ToolCallTable::size() const -> size_t
{
    auto const lock = std::lock_guard { _mutex };
    return _calls.size();
}

} // namespace toolchat
