// SPDX-License-Identifier: Apache-2.0
#include "DirectiveParser.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <cctype>
#include <format>
#include <set>
#include <string>

namespace toolchat
{

namespace
{

    constexpr auto TagOpen = std::string_view("<tool_call>");
    constexpr auto TagClose = std::string_view("</tool_call>");
    constexpr auto BareKey = std::string_view(R"("toolname")");

    /// Returns the "{" at or after @p pos that opens an object keyed by BareKey.
    auto findBareObject(std::string_view text, std::size_t pos) -> std::size_t
    {
        for (auto key = text.find(BareKey, pos); key != std::string_view::npos; key = text.find(BareKey, key + 1))
        {
            auto brace = key;
            while (brace > pos && std::isspace(static_cast<unsigned char>(text[brace - 1])))
                --brace;
            if (brace > pos && text[brace - 1] == '{')
                return brace - 1;
        }
        return std::string_view::npos;
    }

    /// Returns the end (one past the closing brace) of the JSON object starting at @p start.
    auto findObjectEnd(std::string_view text, std::size_t start) -> std::optional<std::size_t>
    {
        auto depth = 0;
        auto inString = false;
        auto escaped = false;

        for (auto i = start; i < text.size(); ++i)
        {
            auto const ch = text[i];
            if (inString)
            {
                if (escaped)
                    escaped = false;
                else if (ch == '\\')
                    escaped = true;
                else if (ch == '"')
                    inString = false;
                continue;
            }

            if (ch == '"')
                inString = true;
            else if (ch == '{')
                ++depth;
            else if (ch == '}' && --depth == 0)
                return i + 1;
        }
        return std::nullopt;
    }

    void appendParsed(std::string_view candidate, std::vector<ToolCallDirective>& out)
    {
        auto parsed = json::parse(candidate);
        if (!parsed)
        {
            log::debug("Ignoring malformed directive: {}", parsed.error().message);
            return;
        }

        auto directive = directiveFromJson(*parsed);
        if (!directive)
            return;

        directive->id = std::format("call_{}", out.size());
        out.push_back(std::move(*directive));
    }

} // namespace

auto directiveFromJson(const nlohmann::json& value) -> std::optional<ToolCallDirective>
{
    if (!value.is_object())
        return std::nullopt;

    auto name = std::string {};
    for (auto const* key: { "toolname", "toolName", "name" })
    {
        name = json::getStringOr(value, key, "");
        if (!name.empty())
            break;
    }
    if (name.empty())
        return std::nullopt;

    auto parameters = nlohmann::json::object();
    for (auto const* key: { "parameters", "arguments" })
    {
        if (!value.contains(key))
            continue;

        auto const& field = value[key];
        if (field.is_object())
            parameters = field;
        else if (field.is_string())
        {
            auto parsed = json::parse(field.get<std::string>());
            if (!parsed || !parsed->is_object())
                return std::nullopt;
            parameters = std::move(*parsed);
        }
        else if (!field.is_null())
            return std::nullopt;
        break;
    }

    return ToolCallDirective { .id = {}, .toolName = std::move(name), .parameters = std::move(parameters) };
}

auto parseDirectives(std::string_view text) -> std::vector<ToolCallDirective>
{
    auto directives = std::vector<ToolCallDirective> {};
    auto pos = std::size_t { 0 };

    while (pos < text.size())
    {
        auto const tag = text.find(TagOpen, pos);
        auto const bare = findBareObject(text, pos);
        if (tag == std::string_view::npos && bare == std::string_view::npos)
            break;

        if (tag < bare)
        {
            auto const start = tag + TagOpen.size();
            auto const end = text.find(TagClose, start);
            if (end == std::string_view::npos)
            {
                // Unterminated tag: accept a complete object right after it.
                auto const objectStart = text.find('{', start);
                auto const objectEnd =
                    objectStart == std::string_view::npos ? std::nullopt : findObjectEnd(text, objectStart);
                if (objectEnd)
                    appendParsed(text.substr(objectStart, *objectEnd - objectStart), directives);
                break;
            }
            appendParsed(text.substr(start, end - start), directives);
            pos = end + TagClose.size();
        }
        else
        {
            auto const end = findObjectEnd(text, bare);
            if (!end)
            {
                pos = bare + 1;
                continue;
            }
            appendParsed(text.substr(bare, *end - bare), directives);
            pos = *end;
        }
    }

    return directives;
}

auto collectDirectives(std::vector<ToolCallDirective> structured, std::string_view rawText)
    -> std::vector<ToolCallDirective>
{
    auto directives = std::move(structured);
    for (auto& directive: parseDirectives(rawText))
    {
        directive.id = std::format("call_{}", directives.size());
        directives.push_back(std::move(directive));
    }
    return deduplicateDirectives(std::move(directives));
}

auto deduplicateDirectives(std::vector<ToolCallDirective> directives) -> std::vector<ToolCallDirective>
{
    auto seen = std::set<std::string> {};
    auto unique = std::vector<ToolCallDirective> {};
    unique.reserve(directives.size());

    for (auto& directive: directives)
    {
        if (seen.insert(callIdentity(directive.toolName, directive.parameters)).second)
            unique.push_back(std::move(directive));
    }

    if (unique.size() != directives.size())
        log::warning("Removed {} duplicate tool call(s)", directives.size() - unique.size());

    return unique;
}

} // namespace toolchat
