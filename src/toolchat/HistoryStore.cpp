// SPDX-License-Identifier: Apache-2.0
#include "HistoryStore.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>
#include <fstream>
#include <functional>
#include <sstream>

namespace toolchat
{

namespace
{

    // Agent names become file names; keep them to one path component.
    auto sanitizeFileName(std::string_view name) -> std::string
    {
        auto result = std::string {};
        result.reserve(name.size());
        for (auto const c: name)
        {
            if (c == '/' || c == '\\' || c == '\0')
                result += '_';
            else
                result += c;
        }
        if (result.empty() || result == "." || result == "..")
            result = "_" + result;
        return result;
    }

} // namespace

auto projectHash(std::string_view projectPath) -> std::string
{
    return std::format("{:016x}", std::hash<std::string_view> {}(projectPath));
}

JsonHistoryStore::JsonHistoryStore(std::filesystem::path dataDir): _root { std::move(dataDir) / "history" }
{
}

auto JsonHistoryStore::pathFor(std::string_view projectPath, std::string_view agentName) const
    -> std::filesystem::path
{
    return _root / projectHash(projectPath) / (sanitizeFileName(agentName) + ".json");
}

auto JsonHistoryStore::load(std::string_view projectPath, std::string_view agentName)
    -> Result<std::vector<ConversationMessage>>
{
    auto const path = pathFor(projectPath, agentName);
    auto messages = std::vector<ConversationMessage> {};

    auto file = std::ifstream(path);
    if (!file.is_open())
        return messages;

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parsed = json::parse(ss.str());
    if (!parsed)
        return makeError(ErrorCode::IoError,
                         std::format("Corrupt history file {}: {}", path.string(), parsed.error().message));
    if (!parsed->is_array())
        return makeError(ErrorCode::IoError, std::format("History file {} is not an array", path.string()));

    for (const auto& entry: *parsed)
        messages.push_back(messageFromJson(entry));

    log::debug("Loaded {} history messages for agent {}", messages.size(), agentName);
    return messages;
}

auto JsonHistoryStore::save(std::string_view projectPath,
                            std::string_view agentName,
                            const std::vector<ConversationMessage>& messages) -> VoidResult
{
    auto const path = pathFor(projectPath, agentName);
    auto const directory = path.parent_path();

    auto ec = std::error_code {};
    std::filesystem::create_directories(directory, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to create history directory '{}': {}", directory.string(), ec.message()));

    auto array = nlohmann::json::array();
    for (const auto& message: messages)
        array.push_back(toJson(message));

    // Written beside the target, then renamed over it.
    auto tmpPath = path;
    tmpPath += ".tmp";
    {
        auto file = std::ofstream(tmpPath, std::ios::trunc);
        if (!file.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot write history file: {}", tmpPath.string()));
        file << array.dump(2) << '\n';
        if (!file)
            return makeError(ErrorCode::IoError, std::format("Failed writing history file: {}", tmpPath.string()));
    }

    std::filesystem::rename(tmpPath, path, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Cannot replace history file {}: {}", path.string(), ec.message()));
    return {};
}

auto JsonHistoryStore::clear(std::string_view projectPath, std::string_view agentName) -> VoidResult
{
    auto ec = std::error_code {};
    std::filesystem::remove(pathFor(projectPath, agentName), ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Cannot remove history of agent {}: {}", agentName, ec.message()));
    return {};
}

} // namespace toolchat
