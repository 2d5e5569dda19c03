// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace toolchat::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON value or a ProtocolError.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Serializes a value in canonical form: object keys sorted, no whitespace.
///
/// nlohmann::json stores objects in a std::map, so dump() without indentation is
/// already key-sorted and stable. Invalid UTF-8 is replaced rather than thrown on.
[[nodiscard]] inline auto canonical(const nlohmann::json& value) -> std::string
{
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

/// @brief Returns the JSON-Schema type name of a runtime value.
///
/// Integral numbers report "integer"; callers that accept any number must treat
/// "integer" as a "number".
[[nodiscard]] inline auto typeName(const nlohmann::json& value) -> std::string_view
{
    switch (value.type())
    {
        case nlohmann::json::value_t::null: return "null";
        case nlohmann::json::value_t::boolean: return "boolean";
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned: return "integer";
        case nlohmann::json::value_t::number_float: return "number";
        case nlohmann::json::value_t::string: return "string";
        case nlohmann::json::value_t::array: return "array";
        case nlohmann::json::value_t::object: return "object";
        case nlohmann::json::value_t::binary:
        case nlohmann::json::value_t::discarded: break;
    }
    return "unknown";
}

/// @brief Extracts a required string field from a JSON object.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto const keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_string())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid string field: {}", key));
    return obj[keyStr].get<std::string>();
}

[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto const keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::string(defaultValue);
}

[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto const keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_number_integer())
        return obj[keyStr].get<int>();
    return defaultValue;
}

/// @brief Extracts an optional number; absent means "let the provider decide".
[[nodiscard]] inline auto getOptionalDouble(const nlohmann::json& obj, std::string_view key)
    -> std::optional<double>
{
    auto const keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_number())
        return obj[keyStr].get<double>();
    return std::nullopt;
}

[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto const keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_boolean())
        return obj[keyStr].get<bool>();
    return defaultValue;
}

/// @brief Extracts an array of strings, skipping non-string entries.
[[nodiscard]] inline auto getStringList(const nlohmann::json& obj, std::string_view key)
    -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    auto const keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_array())
        return result;
    for (const auto& item: obj[keyStr])
    {
        if (item.is_string())
            result.push_back(item.get<std::string>());
    }
    return result;
}

/// @brief Extracts an object of string values, skipping non-string entries.
[[nodiscard]] inline auto getStringMap(const nlohmann::json& obj, std::string_view key)
    -> std::map<std::string, std::string>
{
    auto result = std::map<std::string, std::string> {};
    auto const keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_object())
        return result;
    for (const auto& [name, value]: obj[keyStr].items())
    {
        if (value.is_string())
            result[name] = value.get<std::string>();
    }
    return result;
}

} // namespace toolchat::json
