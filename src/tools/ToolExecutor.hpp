// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>

namespace toolchat
{

/// @brief Successful outcome of running a tool.
struct ToolOutput
{
    nlohmann::json result;
    std::optional<int64_t> executionTimeMs; ///< As measured by the execution context, if it reports one.
};

/// @brief Runs already-validated tool calls in one execution environment.
///
/// Implementations must be safe to call from several threads at once.
class ToolExecutor
{
  public:
    virtual ~ToolExecutor() = default;

    /// @brief Runs @p tool with @p parameters, honoring tool.timeoutMs.
    /// @return The output, or an error whose message becomes the failed result's reason.
    [[nodiscard]] virtual auto execute(const ToolDefinition& tool, const nlohmann::json& parameters)
        -> Result<ToolOutput> = 0;
};

} // namespace toolchat
