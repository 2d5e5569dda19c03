// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tools/ToolExecutor.hpp>

#include <future>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace toolchat
{

/// @brief A browser-tool call handed to the front-end execution context.
struct FrontendRequest
{
    std::string identity; ///< Correlation key; pass it back to FrontendBridge::deliverResult().
    std::string toolName;
    std::string code;
    nlohmann::json parameters;
    int timeoutMs = DefaultToolTimeoutMs;
};

/// @brief What the front-end reports back for a FrontendRequest.
struct FrontendResponse
{
    bool success = false;
    nlohmann::json result;
    std::string error;
    std::optional<int64_t> executionTimeMs;
};

/// @brief The front-end side of the bridge.
///
/// dispatch() may be called from tool worker threads and must not block until the
/// tool finishes; the result comes back through FrontendBridge::deliverResult().
class FrontendChannel
{
  public:
    virtual ~FrontendChannel() = default;
    virtual void dispatch(const FrontendRequest& request) = 0;
};

/// @brief Executes browser tools by forwarding them to an attached front-end.
///
/// Each in-flight call occupies one correlation slot keyed by its call identity.
/// A call that times out drops its slot; a late result is discarded.
class FrontendBridge: public ToolExecutor
{
  public:
    FrontendBridge() = default;

    FrontendBridge(const FrontendBridge&) = delete;
    FrontendBridge& operator=(const FrontendBridge&) = delete;

    /// @brief Connects the front-end; pass nullptr to detach.
    void attach(FrontendChannel* channel);

    [[nodiscard]] auto isAttached() const -> bool;

    [[nodiscard]] auto execute(const ToolDefinition& tool, const nlohmann::json& parameters)
        -> Result<ToolOutput> override;

    /// @brief Completes the call waiting under @p identity. Called by the front-end thread.
    /// @return false if no call is waiting (unknown identity, or it already timed out).
    auto deliverResult(std::string_view identity, FrontendResponse response) -> bool;

    /// @brief Number of calls currently waiting for the front-end.
    [[nodiscard]] auto pendingCount() const -> size_t;

  private:
    mutable std::mutex _mutex;
    FrontendChannel* _channel = nullptr;
    std::map<std::string, std::promise<FrontendResponse>, std::less<>> _slots;
};

} // namespace toolchat
