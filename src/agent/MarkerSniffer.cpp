// SPDX-License-Identifier: Apache-2.0
#include "MarkerSniffer.hpp"

#include <algorithm>
#include <utility>

namespace toolchat
{

namespace
{

    /// A sentinel written as a quoted key also claims the "{" that opens its object.
    auto isKeySentinel(std::string_view sentinel) -> bool
    {
        return sentinel.front() == '"';
    }

    auto isBlank(char ch) -> bool
    {
        return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
    }

    /// Position of the "{" opening the object whose key starts at @p keyPos, or @p keyPos if none does.
    auto objectStart(std::string_view text, std::size_t keyPos) -> std::size_t
    {
        auto pos = keyPos;
        while (pos > 0 && isBlank(text[pos - 1]))
            --pos;
        return pos > 0 && text[pos - 1] == '{' ? pos - 1 : keyPos;
    }

} // namespace

auto defaultSentinels() -> std::vector<std::string>
{
    return { "<tool_call>", R"("toolname")" };
}

MarkerSniffer::MarkerSniffer(std::vector<std::string> sentinels): _sentinels(std::move(sentinels))
{
    std::erase_if(_sentinels, [](const std::string& s) { return s.empty(); });
}

auto MarkerSniffer::feed(std::string_view fragment) -> std::string
{
    _raw.append(fragment);
    if (suppressed())
        return {};

    _pending.append(fragment);

    auto match = std::string::npos;
    for (const auto& sentinel: _sentinels)
    {
        auto found = _pending.find(sentinel);
        if (found != std::string::npos && isKeySentinel(sentinel))
            found = objectStart(_pending, found);
        match = std::min(match, found);
    }

    if (match != std::string::npos)
    {
        _suppressedSince = _raw.size() - _pending.size() + match;
        auto safe = _pending.substr(0, match);
        _pending.clear();
        return safe;
    }

    auto const keep = withheldLength();
    auto safe = _pending.substr(0, _pending.size() - keep);
    _pending.erase(0, _pending.size() - keep);
    return safe;
}

auto MarkerSniffer::finish() -> std::string
{
    if (suppressed())
        return {};
    return std::exchange(_pending, {});
}

void MarkerSniffer::reset()
{
    _raw.clear();
    _pending.clear();
    _suppressedSince.reset();
}

auto MarkerSniffer::withheldLength() const -> std::size_t
{
    // Longest suffix of _pending that is a strict prefix of some sentinel, or for a key
    // sentinel a "{" followed by blanks and such a prefix.
    auto longest = std::size_t { 0 };
    for (const auto& sentinel: _sentinels)
    {
        if (isKeySentinel(sentinel))
        {
            auto const brace = _pending.rfind('{');
            if (brace != std::string::npos)
            {
                auto rest = std::string_view(_pending).substr(brace + 1);
                auto const keyStart = rest.find_first_not_of(" \t\r\n");
                rest = keyStart == std::string_view::npos ? std::string_view {} : rest.substr(keyStart);
                if (rest.size() < sentinel.size() && std::string_view(sentinel).starts_with(rest))
                    longest = std::max(longest, _pending.size() - brace);
            }
        }

        auto const maxLength = std::min(sentinel.size() - 1, _pending.size());
        for (auto length = maxLength; length > longest; --length)
        {
            if (std::string_view(_pending).ends_with(std::string_view(sentinel).substr(0, length)))
            {
                longest = length;
                break;
            }
        }
    }
    return longest;
}

} // namespace toolchat
