// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolchat
{

/// @brief Tool calls of one turn, keyed by call identity.
///
/// Owned by the turn and shared by the router's worker threads. A result becomes
/// terminal exactly once; later updates for the same key are ignored.
class ToolCallTable
{
  public:
    /// @brief Registers a call as executing.
    /// @return An InvalidArgument error if the same call is already executing.
    [[nodiscard]] auto begin(const std::string& identity, const ToolCallDirective& directive) -> VoidResult;

    /// @brief Stores the terminal result of a call.
    /// @return false if the call is unknown or already terminal.
    auto finish(const std::string& identity, ToolCallResult result) -> bool;

    [[nodiscard]] auto find(const std::string& identity) const -> std::optional<ToolCallResult>;

    /// @brief All calls in the order they were first registered.
    [[nodiscard]] auto entries() const -> std::vector<ToolCallResult>;

    [[nodiscard]] auto size() const -> size_t;

  private:
    mutable std::mutex _mutex;
    std::map<std::string, ToolCallResult> _calls;
    std::vector<std::string> _order;
};

} // namespace toolchat
