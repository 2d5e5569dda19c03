// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolchat
{

/// @brief Returns the sentinels that open an inline directive: "<tool_call>" and the key "\"toolname\"".
[[nodiscard]] auto defaultSentinels() -> std::vector<std::string>;

/// @brief Filters a text stream so no part of a tool-call directive reaches the display.
///
/// The sniffer forwards text as soon as it cannot be the beginning of a sentinel.
/// A trailing fragment that is a strict prefix of any sentinel is withheld until the
/// next chunk decides it. Once a full sentinel is seen, everything from that point
/// on is suppressed for the rest of the stream. The unfiltered text is kept for
/// directive parsing.
///
/// A sentinel starting with a double quote names a reserved object key. Its match
/// starts at the "{" opening that object (blanks allowed in between), and a trailing
/// "{" that may still open such an object is withheld as well.
class MarkerSniffer
{
  public:
    explicit MarkerSniffer(std::vector<std::string> sentinels = defaultSentinels());

    /// @brief Consumes a fragment and returns the part that is safe to display (possibly empty).
    [[nodiscard]] auto feed(std::string_view fragment) -> std::string;

    /// @brief Ends the stream, returning withheld text if no sentinel was confirmed.
    [[nodiscard]] auto finish() -> std::string;

    /// @brief Prepares for the next stream of the same turn.
    void reset();

    [[nodiscard]] auto suppressed() const noexcept -> bool { return _suppressedSince.has_value(); }

    /// @brief Offset in rawText() at which the confirmed sentinel starts.
    [[nodiscard]] auto suppressedSinceIndex() const noexcept -> std::optional<std::size_t> { return _suppressedSince; }

    [[nodiscard]] auto rawText() const noexcept -> const std::string& { return _raw; }

  private:
    std::vector<std::string> _sentinels;
    std::string _raw;
    std::string _pending;
    std::optional<std::size_t> _suppressedSince;

    [[nodiscard]] auto withheldLength() const -> std::size_t;
};

} // namespace toolchat
