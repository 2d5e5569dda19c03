// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>

namespace toolchat
{

/// @brief Bidirectional stream of newline-delimited JSON messages.
class MessageChannel
{
  public:
    virtual ~MessageChannel() = default;

    /// @brief Sends a JSON message to the peer.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Receives the next JSON message.
    /// @param timeout How long to wait; std::nullopt blocks indefinitely.
    /// @return The message, a TimeoutError, or a TransportError once the peer closed its end.
    [[nodiscard]] virtual auto receive(std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<nlohmann::json> = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace toolchat
