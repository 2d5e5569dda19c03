// SPDX-License-Identifier: Apache-2.0
#include "SseDecoder.hpp"

namespace toolchat
{

auto SseDecoder::feed(std::string_view bytes) -> std::vector<SseEvent>
{
    auto events = std::vector<SseEvent> {};
    _buffer.append(bytes);

    auto start = size_t { 0 };
    while (true)
    {
        auto const newline = _buffer.find('\n', start);
        if (newline == std::string::npos)
            break;
        processLine(std::string_view(_buffer).substr(start, newline - start), events);
        start = newline + 1;
    }
    _buffer.erase(0, start);

    return events;
}

auto SseDecoder::finish() -> std::vector<SseEvent>
{
    auto events = std::vector<SseEvent> {};
    if (!_buffer.empty())
    {
        auto const line = std::move(_buffer);
        _buffer.clear();
        processLine(line, events);
    }
    return events;
}

void SseDecoder::processLine(std::string_view line, std::vector<SseEvent>& out)
{
    if (!line.empty() && line.back() == '\r')
        line.remove_suffix(1);

    if (line.empty())
    {
        _eventName.clear();
        return;
    }

    if (line.front() == ':')
        return; // comment / keep-alive

    auto const colon = line.find(':');
    auto const field = line.substr(0, colon);
    auto value = colon == std::string_view::npos ? std::string_view {} : line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ')
        value.remove_prefix(1);

    if (field == "event")
        _eventName = std::string(value);
    else if (field == "data")
        out.push_back(SseEvent { .event = _eventName, .data = std::string(value) });
}

} // namespace toolchat
