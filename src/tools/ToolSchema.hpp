// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

namespace toolchat
{

/// @brief Checks whether a runtime value satisfies a declared JSON-Schema type name.
///
/// "number" accepts any number, "integer" only integral ones, "array" only lists.
/// Unknown type names accept everything.
[[nodiscard]] auto matchesSchemaType(const nlohmann::json& value, std::string_view declaredType) -> bool;

/// @brief Validates tool parameters against a parameter schema.
///
/// Checks run in stages and the first failure wins: every "required" field present,
/// then each present property's "type", then each present property's "enum".
/// @return Success, or a ValidationError with a message such as
///         `Missing required property: a` or `Property "a" must be number, got string`.
[[nodiscard]] auto validateParameters(const nlohmann::json& parameters, const nlohmann::json& schema) -> VoidResult;

} // namespace toolchat
