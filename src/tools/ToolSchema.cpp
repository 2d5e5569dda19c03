// SPDX-License-Identifier: Apache-2.0
#include "ToolSchema.hpp"

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <format>
#include <string>

namespace toolchat
{

namespace
{

    auto describeType(const nlohmann::json& value) -> std::string_view
    {
        auto const name = json::typeName(value);
        return name == "integer" ? "number" : name;
    }

    auto enumText(const nlohmann::json& values) -> std::string
    {
        auto text = std::string {};
        for (const auto& value: values)
        {
            if (!text.empty())
                text += ", ";
            text += value.is_string() ? value.get<std::string>() : value.dump();
        }
        return text;
    }

} // namespace

auto matchesSchemaType(const nlohmann::json& value, std::string_view declaredType) -> bool
{
    if (declaredType == "string")
        return value.is_string();
    if (declaredType == "number")
        return value.is_number();
    if (declaredType == "integer")
        return value.is_number_integer();
    if (declaredType == "boolean")
        return value.is_boolean();
    if (declaredType == "array")
        return value.is_array();
    if (declaredType == "object")
        return value.is_object();
    if (declaredType == "null")
        return value.is_null();
    return true;
}

auto validateParameters(const nlohmann::json& parameters, const nlohmann::json& schema) -> VoidResult
{
    if (!parameters.is_object())
        return makeError(ErrorCode::ValidationError,
                         std::format("Parameters must be object, got {}", describeType(parameters)));

    if (!schema.is_object())
        return {};

    for (const auto& name: json::getStringList(schema, "required"))
    {
        if (!parameters.contains(name))
            return makeError(ErrorCode::ValidationError, std::format("Missing required property: {}", name));
    }

    if (!schema.contains("properties") || !schema["properties"].is_object())
        return {};
    auto const& properties = schema["properties"];

    for (const auto& [name, value]: parameters.items())
    {
        if (!properties.contains(name))
            continue;
        auto const declared = json::getStringOr(properties[name], "type", "");
        if (!declared.empty() && !matchesSchemaType(value, declared))
            return makeError(ErrorCode::ValidationError,
                             std::format("Property \"{}\" must be {}, got {}", name, declared, describeType(value)));
    }

    for (const auto& [name, value]: parameters.items())
    {
        if (!properties.contains(name))
            continue;
        auto const& property = properties[name];
        if (!property.is_object() || !property.contains("enum") || !property["enum"].is_array())
            continue;
        auto const& allowed = property["enum"];
        if (std::find(allowed.begin(), allowed.end(), value) == allowed.end())
            return makeError(ErrorCode::ValidationError,
                             std::format("Property \"{}\" must be one of: {}", name, enumText(allowed)));
    }

    return {};
}

} // namespace toolchat
