// SPDX-License-Identifier: Apache-2.0
#include "ProviderFactory.hpp"

#include <llm/AnthropicProvider.hpp>
#include <llm/OpenAiProvider.hpp>

namespace toolchat
{

auto defaultBaseUrl(ProviderType type) -> std::string
{
    switch (type)
    {
        case ProviderType::Glm: return "https://open.bigmodel.cn/api/paas/v4";
        case ProviderType::Anthropic: return "https://api.anthropic.com";
        case ProviderType::OpenAi:
        case ProviderType::Azure:
        case ProviderType::Custom: break;
    }
    return "https://api.openai.com/v1";
}

auto makeProvider(ProviderType type, HttpClient& http) -> std::unique_ptr<ChatProvider>
{
    switch (type)
    {
        case ProviderType::Glm: return std::make_unique<GlmProvider>(http);
        case ProviderType::Anthropic: return std::make_unique<AnthropicProvider>(http);
        case ProviderType::OpenAi:
        case ProviderType::Azure:
        case ProviderType::Custom: break;
    }
    return std::make_unique<OpenAiProvider>(http);
}

} // namespace toolchat
