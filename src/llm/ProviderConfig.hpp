// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace toolchat
{

/// @brief Wire-format family of an LLM backend.
enum class ProviderType : std::uint8_t
{
    OpenAi,
    Azure,
    Custom,
    Glm,
    Anthropic,
};

[[nodiscard]] constexpr auto providerTypeToString(ProviderType type) -> std::string_view
{
    switch (type)
    {
        case ProviderType::OpenAi: return "openai";
        case ProviderType::Azure: return "azure";
        case ProviderType::Custom: return "custom";
        case ProviderType::Glm: return "glm";
        case ProviderType::Anthropic: return "anthropic";
    }
    return "openai";
}

/// @brief Parses a provider type name.
/// @return The type, or std::nullopt if the name is not recognized.
[[nodiscard]] constexpr auto providerTypeFromString(std::string_view str) -> std::optional<ProviderType>
{
    if (str == "openai")
        return ProviderType::OpenAi;
    if (str == "azure")
        return ProviderType::Azure;
    if (str == "custom")
        return ProviderType::Custom;
    if (str == "glm")
        return ProviderType::Glm;
    if (str == "anthropic")
        return ProviderType::Anthropic;
    return std::nullopt;
}

/// @brief Connection parameters of one backend account.
struct ProviderConfig
{
    std::string id;
    ProviderType type = ProviderType::OpenAi;
    std::string name;
    std::string apiKey;
    std::string baseUrl; // empty selects the provider family's default
};

/// @brief Model selection and sampling parameters sent with every request.
struct ModelConfig
{
    std::string id;
    std::string name;
    std::string model;
    ProviderType type = ProviderType::OpenAi;
    std::optional<double> temperature;
    std::optional<int> maxTokens;
    std::optional<double> topP;
    nlohmann::json extra = nlohmann::json::object(); // merged verbatim into the request body
};

} // namespace toolchat
