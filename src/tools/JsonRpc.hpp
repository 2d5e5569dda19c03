// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace toolchat::jsonrpc
{

struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief One inbound JSON-RPC 2.0 message: a response, or a server-initiated
/// request or notification.
struct Message
{
    nlohmann::json id;   ///< Null for notifications.
    std::string method;  ///< Empty for responses.
    nlohmann::json params;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    [[nodiscard]] auto isResponse() const -> bool { return method.empty(); }
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }

    /// @brief True if this is a response to the request numbered @p requestId.
    [[nodiscard]] auto answers(int64_t requestId) const -> bool
    {
        return isResponse() && id.is_number_integer() && id.get<int64_t>() == requestId;
    }
};

[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr) -> nlohmann::json;

/// @brief Classifies an inbound message.
/// @return The parsed message, or a ProtocolError if it is not JSON-RPC 2.0 or carries
///         neither result, error nor method.
[[nodiscard]] auto parseMessage(const nlohmann::json& value) -> Result<Message>;

} // namespace toolchat::jsonrpc
