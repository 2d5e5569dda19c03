// SPDX-License-Identifier: Apache-2.0
#include <conversation/MessageReconstructor.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace toolchat;

namespace
{

auto params(int a, int b) -> nlohmann::json
{
    return { { "a", a }, { "b", b } };
}

} // namespace

TEST_CASE("MessageReconstructor appends chunks into one assistant message", "[reconstructor]")
{
    auto display = MessageReconstructor {};
    display.userMessage("Hi");
    display.chunk("Hello");
    display.chunk(" wor");
    display.chunk("ld");
    CHECK(display.isStreaming());
    display.complete();

    auto const& messages = display.messages();
    REQUIRE(messages.size() == 2);
    CHECK(messages[0].role == Role::User);
    CHECK(messages[1].role == Role::Assistant);
    CHECK(messages[1].content == "Hello world");
    CHECK(!display.isStreaming());
}

TEST_CASE("MessageReconstructor keeps reasoning beside the content", "[reconstructor]")
{
    auto display = MessageReconstructor {};
    display.userMessage("Why?");
    display.reasoning("Let me ");
    display.reasoning("think.");
    display.chunk("Because.");
    display.complete();

    REQUIRE(display.messages().size() == 2);
    auto const& reply = display.messages()[1];
    REQUIRE(reply.reasoning.has_value());
    CHECK(*reply.reasoning == "Let me think.");
    CHECK(reply.content == "Because.");
}

TEST_CASE("MessageReconstructor interleaves prose and tool cards", "[reconstructor]")
{
    auto display = MessageReconstructor {};
    display.userMessage("What is 1+2?");
    display.chunk("Let me add. ");
    display.toolStarted("add", params(1, 2));
    display.toolCompleted("add", params(1, 2), 3, 5);
    display.chunk("The sum is 3.");
    display.complete();

    auto const& messages = display.messages();
    REQUIRE(messages.size() == 4);
    CHECK(messages[1].content == "Let me add. ");
    REQUIRE(messages[2].toolCall.has_value());
    CHECK(messages[2].toolCall->status == ToolStatus::Completed);
    CHECK(messages[2].toolCall->result.value() == 3);
    CHECK(messages[2].toolCall->executionTimeMs == 5);
    CHECK(messages[2].content.empty());
    CHECK(messages[3].content == "The sum is 3.");
    CHECK(!messages[3].toolCall.has_value());
}

TEST_CASE("MessageReconstructor ignores replayed terminal events", "[reconstructor]")
{
    auto display = MessageReconstructor {};
    display.userMessage("go");
    display.toolStarted("add", params(1, 2));
    display.toolCompleted("add", params(1, 2), 3, 5);

    auto const snapshot = display.messages();

    display.toolCompleted("add", params(1, 2), 3, 5);
    display.toolFailed("add", params(1, 2), "late failure");
    display.toolCompleted("add", params(9, 9), 18, 1);

    CHECK(display.messages() == snapshot);
}

TEST_CASE("MessageReconstructor matches tool events by identity, not order", "[reconstructor]")
{
    auto display = MessageReconstructor {};
    display.userMessage("two");
    display.toolStarted("add", params(1, 1));
    display.toolStarted("add", params(2, 2));
    display.toolFailed("add", params(2, 2), "boom");
    display.toolCompleted("add", nlohmann::json::parse(R"({"b": 1, "a": 1})"), 2, 1);

    auto const& messages = display.messages();
    REQUIRE(messages.size() == 3);
    CHECK(messages[1].toolCall->status == ToolStatus::Completed);
    CHECK(messages[2].toolCall->status == ToolStatus::Failed);
    CHECK(messages[2].toolCall->error == "boom");
}

TEST_CASE("MessageReconstructor error removes the user message and notifies", "[reconstructor]")
{
    auto notifications = std::vector<std::string> {};
    auto display = MessageReconstructor([&](std::string_view message) { notifications.emplace_back(message); });

    display.userMessage("first");
    display.chunk("answer");
    display.complete();

    display.userMessage("second");
    display.chunk("partial");
    display.error("API request failed (500): oops");

    auto const& messages = display.messages();
    REQUIRE(messages.size() == 3);
    CHECK(messages[0].content == "first");
    CHECK(messages[1].content == "answer");
    CHECK(messages[2].content == "partial");
    CHECK(!display.isStreaming());
    CHECK(notifications == std::vector<std::string> { "API request failed (500): oops" });
}

TEST_CASE("MessageReconstructor keeps tracking cards after an error shifted them", "[reconstructor]")
{
    auto display = MessageReconstructor {};
    display.userMessage("go");
    display.toolStarted("add", params(1, 2));
    display.error("stream died");

    REQUIRE(display.messages().size() == 1);
    display.toolCompleted("add", params(1, 2), 3, 1);
    CHECK(display.messages()[0].toolCall->status == ToolStatus::Completed);
}

TEST_CASE("MessageReconstructor continues a loaded assistant message", "[reconstructor]")
{
    auto display = MessageReconstructor {};
    display.load({
        DisplayMessage { .role = Role::User, .content = "earlier" },
        DisplayMessage { .role = Role::Assistant, .content = "reply" },
    });

    display.chunk(" more");
    REQUIRE(display.messages().size() == 2);
    CHECK(display.messages()[1].content == "reply more");

    display.clear();
    CHECK(display.messages().empty());
}
