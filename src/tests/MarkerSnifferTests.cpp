// SPDX-License-Identifier: Apache-2.0
#include <agent/MarkerSniffer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace toolchat;

namespace
{

/// Feeds @p fragments and returns everything the sniffer let through, flush included.
auto runSniffer(MarkerSniffer& sniffer, const std::vector<std::string>& fragments) -> std::string
{
    auto out = std::string {};
    for (const auto& fragment: fragments)
        out += sniffer.feed(fragment);
    out += sniffer.finish();
    return out;
}

/// Splits @p text into pieces of @p width bytes.
auto chop(std::string_view text, size_t width) -> std::vector<std::string>
{
    auto pieces = std::vector<std::string> {};
    for (auto i = size_t { 0 }; i < text.size(); i += width)
        pieces.emplace_back(text.substr(i, width));
    return pieces;
}

} // namespace

TEST_CASE("MarkerSniffer passes plain text through unchanged", "[sniffer]")
{
    auto sniffer = MarkerSniffer();
    CHECK(runSniffer(sniffer, { "Hello", " wor", "ld" }) == "Hello world");
    CHECK(!sniffer.suppressed());
    CHECK(sniffer.rawText() == "Hello world");
}

TEST_CASE("MarkerSniffer withholds a possible sentinel prefix", "[sniffer]")
{
    auto sniffer = MarkerSniffer();

    CHECK(sniffer.feed("Let me check {\"tool") == "Let me check ");
    CHECK(!sniffer.suppressed());

    // Not the sentinel after all: the withheld text comes out with the next fragment.
    CHECK(sniffer.feed("s\": 1}") == "{\"tools\": 1}");
}

TEST_CASE("MarkerSniffer suppresses everything after a confirmed sentinel", "[sniffer]")
{
    auto sniffer = MarkerSniffer();

    auto visible = std::string {};
    visible += sniffer.feed("Sure. {\"tool");
    visible += sniffer.feed("name\": \"add\", \"parameters\": {\"a\": 1}}");
    visible += sniffer.feed(" trailing words");
    visible += sniffer.finish();

    CHECK(visible == "Sure. ");
    CHECK(sniffer.suppressed());
    REQUIRE(sniffer.suppressedSinceIndex().has_value());
    CHECK(*sniffer.suppressedSinceIndex() == 6);
    CHECK(sniffer.rawText().substr(6, 11) == R"({"toolname")");
}

TEST_CASE("MarkerSniffer suppresses a bare directive with blanks after the brace", "[sniffer]")
{
    auto sniffer = MarkerSniffer();

    auto visible = std::string {};
    visible += sniffer.feed("Sure: {");
    visible += sniffer.feed(R"( "toolname": "add",)");
    visible += sniffer.feed(R"( "parameters": {"a": 1, "b": 2}})");
    visible += sniffer.finish();

    CHECK(visible == "Sure: ");
    CHECK(sniffer.suppressed());
    REQUIRE(sniffer.suppressedSinceIndex().has_value());
    CHECK(*sniffer.suppressedSinceIndex() == 6);
}

TEST_CASE("MarkerSniffer suppresses a pretty-printed bare directive", "[sniffer]")
{
    auto const prose = std::string("Calling it now.\n");
    auto const text = prose + "{\n  \"toolname\": \"add\",\n  \"parameters\": {}\n}";

    for (auto width = size_t { 1 }; width <= text.size(); ++width)
    {
        auto sniffer = MarkerSniffer();
        INFO("fragment width " << width);
        CHECK(runSniffer(sniffer, chop(text, width)) == prose);
        CHECK(sniffer.suppressed());
    }
}

TEST_CASE("MarkerSniffer releases a brace that does not open a directive", "[sniffer]")
{
    auto sniffer = MarkerSniffer();
    CHECK(sniffer.feed("if (x) {") == "if (x) ");
    CHECK(sniffer.feed("\n  ") == "");
    CHECK(sniffer.feed("return; }") == "{\n  return; }");
    CHECK(!sniffer.suppressed());
}

TEST_CASE("MarkerSniffer flushes a dangling prefix at the end of the stream", "[sniffer]")
{
    auto sniffer = MarkerSniffer();
    CHECK(sniffer.feed("a < b and <tool") == "a < b and ");
    CHECK(sniffer.finish() == "<tool");
    CHECK(!sniffer.suppressed());
}

TEST_CASE("MarkerSniffer picks the earliest of several sentinels", "[sniffer]")
{
    auto sniffer = MarkerSniffer();
    auto const out = sniffer.feed(R"(x <tool_call>{"toolname": "a"}</tool_call>)");
    CHECK(out == "x ");
    REQUIRE(sniffer.suppressedSinceIndex().has_value());
    CHECK(*sniffer.suppressedSinceIndex() == 2);
}

TEST_CASE("MarkerSniffer is safe under every fragment split", "[sniffer]")
{
    auto const prose = std::string("The answer needs a tool. ");
    auto const directive = std::string(R"(<tool_call>{"toolname": "add", "parameters": {"a": 1}}</tool_call>)");
    auto const text = prose + directive;

    for (auto width = size_t { 1 }; width <= text.size(); ++width)
    {
        auto sniffer = MarkerSniffer();
        auto const visible = runSniffer(sniffer, chop(text, width));

        INFO("fragment width " << width);
        CHECK(visible == prose);
        CHECK(visible.find('<') == std::string::npos);
        CHECK(sniffer.rawText() == text);
    }
}

TEST_CASE("MarkerSniffer never loses text without a sentinel", "[sniffer]")
{
    auto const text = std::string(R"(Use {"tool": 1} or <tool> but not the real thing {"toolnam)");

    for (auto width = size_t { 1 }; width <= text.size(); ++width)
    {
        auto sniffer = MarkerSniffer();
        INFO("fragment width " << width);
        CHECK(runSniffer(sniffer, chop(text, width)) == text);
    }
}

TEST_CASE("MarkerSniffer reset starts a fresh iteration", "[sniffer]")
{
    auto sniffer = MarkerSniffer();
    (void) sniffer.feed(R"({"toolname": "x"})");
    REQUIRE(sniffer.suppressed());

    sniffer.reset();
    CHECK(!sniffer.suppressed());
    CHECK(sniffer.rawText().empty());
    CHECK(sniffer.feed("fresh") == "fresh");
}

TEST_CASE("MarkerSniffer ignores empty sentinels", "[sniffer]")
{
    auto sniffer = MarkerSniffer({ "", "@@" });
    CHECK(sniffer.feed("a@") == "a");
    CHECK(sniffer.feed("@b") == "");
    CHECK(sniffer.suppressed());
}
