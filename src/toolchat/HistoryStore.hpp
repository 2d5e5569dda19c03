// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace toolchat
{

/// @brief Persists the conversation of each agent, scoped per project.
class HistoryStore
{
  public:
    virtual ~HistoryStore() = default;

    /// @brief Loads an agent's history; an agent without history has an empty one.
    [[nodiscard]] virtual auto load(std::string_view projectPath, std::string_view agentName)
        -> Result<std::vector<ConversationMessage>> = 0;

    [[nodiscard]] virtual auto save(std::string_view projectPath,
                                    std::string_view agentName,
                                    const std::vector<ConversationMessage>& messages) -> VoidResult = 0;

    [[nodiscard]] virtual auto clear(std::string_view projectPath, std::string_view agentName) -> VoidResult = 0;
};

/// @brief Keeps each history as a JSON array in <dataDir>/history/<project-hash>/<agent>.json.
class JsonHistoryStore: public HistoryStore
{
  public:
    explicit JsonHistoryStore(std::filesystem::path dataDir);

    [[nodiscard]] auto load(std::string_view projectPath, std::string_view agentName)
        -> Result<std::vector<ConversationMessage>> override;
    [[nodiscard]] auto save(std::string_view projectPath,
                            std::string_view agentName,
                            const std::vector<ConversationMessage>& messages) -> VoidResult override;
    [[nodiscard]] auto clear(std::string_view projectPath, std::string_view agentName) -> VoidResult override;

    [[nodiscard]] auto pathFor(std::string_view projectPath, std::string_view agentName) const
        -> std::filesystem::path;

  private:
    std::filesystem::path _root;
};

/// @brief Stable directory name for a project path.
[[nodiscard]] auto projectHash(std::string_view projectPath) -> std::string;

} // namespace toolchat
