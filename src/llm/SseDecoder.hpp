// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace toolchat
{

/// @brief One decoded server-sent event.
struct SseEvent
{
    std::string event; ///< Value of the last "event:" field, empty if none.
    std::string data;  ///< Payload of a single "data:" line.
};

/// @brief Incremental decoder for text/event-stream bodies.
///
/// Bytes may be split anywhere, including inside a line or a UTF-8 sequence.
/// Every "data:" line is dispatched as soon as its newline arrives; the "event:"
/// name applies until the next blank line.
class SseDecoder
{
  public:
    /// @brief Consumes a fragment and returns the events completed by it.
    [[nodiscard]] auto feed(std::string_view bytes) -> std::vector<SseEvent>;

    /// @brief Flushes a trailing line that was not newline-terminated.
    [[nodiscard]] auto finish() -> std::vector<SseEvent>;

  private:
    std::string _buffer;
    std::string _eventName;

    void processLine(std::string_view line, std::vector<SseEvent>& out);
};

} // namespace toolchat
