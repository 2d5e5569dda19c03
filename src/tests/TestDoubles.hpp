// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <llm/HttpClient.hpp>
#include <toolchat/FileReader.hpp>
#include <toolchat/HistoryStore.hpp>

#include <nlohmann/json.hpp>

#include <deque>
#include <format>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolchat::test
{

/// Answers each request with the next canned OpenAI stream.
class ScriptedHttpClient: public HttpClient
{
  public:
    std::deque<std::string> replies;
    std::optional<Error> failure;
    int failuresBeforeReply = 0; ///< Requests to refuse before replying normally.
    std::vector<HttpRequest> requests;

    auto postStream(const HttpRequest& request, const ByteSink& sink) -> VoidResult override
    {
        requests.push_back(request);
        if (failure)
            return std::unexpected(*failure);
        if (failuresBeforeReply > 0)
        {
            --failuresBeforeReply;
            return makeError(ErrorCode::TransportError, "Connection refused");
        }
        if (replies.empty())
            return makeError(ErrorCode::TransportError, "No scripted reply");

        auto const body = std::move(replies.front());
        replies.pop_front();
        (void) sink(body);
        return {};
    }

    void queueText(std::string_view text)
    {
        auto const payload = nlohmann::json {
            { "choices", nlohmann::json::array({ { { "delta", { { "content", std::string(text) } } }, { "finish_reason", nullptr } } }) },
        };
        replies.push_back("data: " + payload.dump() + "\n\ndata: [DONE]\n\n");
    }

    [[nodiscard]] auto requestMessages(size_t index) const -> nlohmann::json
    {
        return nlohmann::json::parse(requests.at(index).body)["messages"];
    }
};

class MemoryHistoryStore: public HistoryStore
{
  public:
    std::map<std::string, std::vector<ConversationMessage>> histories;
    int saveCount = 0;

    static auto key(std::string_view project, std::string_view agent) -> std::string
    {
        return std::format("{}#{}", project, agent);
    }

    auto load(std::string_view project, std::string_view agent) -> Result<std::vector<ConversationMessage>> override
    {
        auto const it = histories.find(key(project, agent));
        return it != histories.end() ? it->second : std::vector<ConversationMessage> {};
    }

    auto save(std::string_view project, std::string_view agent, const std::vector<ConversationMessage>& messages)
        -> VoidResult override
    {
        ++saveCount;
        histories[key(project, agent)] = messages;
        return {};
    }

    auto clear(std::string_view project, std::string_view agent) -> VoidResult override
    {
        histories.erase(key(project, agent));
        return {};
    }
};

class MemoryFileReader: public FileReader
{
  public:
    std::map<std::string, std::string> files;
    std::vector<std::string> reads;

    auto read(std::string_view path) -> Result<std::string> override
    {
        reads.emplace_back(path);
        auto const it = files.find(std::string(path));
        if (it == files.end())
            return makeError(ErrorCode::IoError, std::format("Not a regular file: {}", path));
        return it->second;
    }
};

} // namespace toolchat::test
