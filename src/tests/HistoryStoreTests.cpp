// SPDX-License-Identifier: Apache-2.0
#include <toolchat/FileReader.hpp>
#include <toolchat/HistoryStore.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace toolchat;

namespace
{

/// Fresh directory under the system temp dir, removed again on scope exit.
struct TempDir
{
    std::filesystem::path path;

    explicit TempDir(std::string_view name): path(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }

    ~TempDir() { std::filesystem::remove_all(path); }
};

auto sampleConversation() -> std::vector<ConversationMessage>
{
    auto assistant = ConversationMessage {
        .role = Role::Assistant,
        .content = "Checking.",
        .toolCallId = {},
        .toolCalls = { ToolCallDirective { .id = "toolu_1", .toolName = "add", .parameters = { { "a", 1 } } } },
    };
    return {
        ConversationMessage { .role = Role::User, .content = "Add 1", .toolCallId = {}, .toolCalls = {} },
        assistant,
        ConversationMessage {
            .role = Role::Tool, .content = "Tool \"add\" failed: b missing", .toolCallId = "toolu_1", .toolCalls = {} },
    };
}

} // namespace

TEST_CASE("JsonHistoryStore loads an empty history for a new agent", "[history]")
{
    auto const dir = TempDir("toolchat_history_empty");
    auto store = JsonHistoryStore(dir.path);

    auto history = store.load("/work/project", "helper");
    REQUIRE(history.has_value());
    CHECK(history->empty());
}

TEST_CASE("JsonHistoryStore saves and loads a conversation", "[history]")
{
    auto const dir = TempDir("toolchat_history_roundtrip");
    auto store = JsonHistoryStore(dir.path);

    REQUIRE(store.save("/work/project", "helper", sampleConversation()).has_value());
    CHECK(std::filesystem::exists(store.pathFor("/work/project", "helper")));
    CHECK(!std::filesystem::exists(std::filesystem::path(store.pathFor("/work/project", "helper")) += ".tmp"));

    auto history = store.load("/work/project", "helper");
    REQUIRE(history.has_value());
    REQUIRE(history->size() == 3);
    CHECK((*history)[0].role == Role::User);
    CHECK((*history)[1].toolCalls.size() == 1);
    CHECK((*history)[1].toolCalls[0].toolName == "add");
    CHECK((*history)[1].toolCalls[0].parameters == nlohmann::json { { "a", 1 } });
    CHECK((*history)[2].toolCallId == "toolu_1");
}

TEST_CASE("JsonHistoryStore keeps projects and agents apart", "[history]")
{
    auto const dir = TempDir("toolchat_history_scopes");
    auto store = JsonHistoryStore(dir.path);

    REQUIRE(store.save("/work/a", "helper", sampleConversation()).has_value());

    CHECK(store.load("/work/b", "helper")->empty());
    CHECK(store.load("/work/a", "other")->empty());
    CHECK(store.load("/work/a", "helper")->size() == 3);
    CHECK(store.pathFor("/work/a", "helper").parent_path() != store.pathFor("/work/b", "helper").parent_path());
}

TEST_CASE("JsonHistoryStore keeps agent names to one path component", "[history]")
{
    auto const dir = TempDir("toolchat_history_names");
    auto store = JsonHistoryStore(dir.path);

    auto const path = store.pathFor("/work/a", "../../escape");
    CHECK(path.parent_path() == dir.path / "history" / projectHash("/work/a"));
    CHECK(path.filename() == ".._.._escape.json");
}

TEST_CASE("JsonHistoryStore clear removes the history", "[history]")
{
    auto const dir = TempDir("toolchat_history_clear");
    auto store = JsonHistoryStore(dir.path);

    REQUIRE(store.save("/work/a", "helper", sampleConversation()).has_value());
    REQUIRE(store.clear("/work/a", "helper").has_value());
    CHECK(store.load("/work/a", "helper")->empty());

    // Clearing again is fine.
    CHECK(store.clear("/work/a", "helper").has_value());
}

TEST_CASE("JsonHistoryStore reports a corrupt history file", "[history]")
{
    auto const dir = TempDir("toolchat_history_corrupt");
    auto store = JsonHistoryStore(dir.path);
    auto const path = store.pathFor("/work/a", "helper");
    std::filesystem::create_directories(path.parent_path());

    SECTION("unparsable")
    {
        std::ofstream(path) << "[{ broken";
        auto history = store.load("/work/a", "helper");
        REQUIRE(!history.has_value());
        CHECK(history.error().code == ErrorCode::IoError);
    }

    SECTION("not an array")
    {
        std::ofstream(path) << R"({"role":"user"})";
        auto history = store.load("/work/a", "helper");
        REQUIRE(!history.has_value());
        CHECK(history.error().message.ends_with("is not an array"));
    }
}

TEST_CASE("projectHash is stable and distinguishes paths", "[history]")
{
    CHECK(projectHash("/work/a") == projectHash("/work/a"));
    CHECK(projectHash("/work/a") != projectHash("/work/b"));
    CHECK(projectHash("/work/a").size() == 16);
}

TEST_CASE("FilesystemReader reads regular files within the limit", "[files]")
{
    auto const dir = TempDir("toolchat_file_reader");
    auto const file = dir.path / "notes.txt";
    std::ofstream(file) << "line one\nline two\n";

    SECTION("reads the content")
    {
        auto reader = FilesystemReader {};
        auto content = reader.read(file.string());
        REQUIRE(content.has_value());
        CHECK(*content == "line one\nline two\n");
    }

    SECTION("rejects files over the limit")
    {
        auto reader = FilesystemReader(4);
        auto content = reader.read(file.string());
        REQUIRE(!content.has_value());
        CHECK(content.error().code == ErrorCode::IoError);
    }

    SECTION("rejects directories and missing files")
    {
        auto reader = FilesystemReader {};
        CHECK(reader.read(dir.path.string()).error().message.starts_with("Not a regular file"));
        CHECK(!reader.read((dir.path / "missing.txt").string()).has_value());
    }
}
