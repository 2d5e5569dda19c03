// SPDX-License-Identifier: Apache-2.0
#include <tools/FrontendBridge.hpp>
#include <tools/ToolCallTable.hpp>
#include <tools/ToolRouter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <mutex>
#include <vector>

using namespace toolchat;

namespace
{

/// Records every invocation and answers a + b, or a scripted error.
class RecordingExecutor: public ToolExecutor
{
  public:
    std::vector<std::pair<std::string, nlohmann::json>> invocations;
    std::optional<Error> failure;
    std::optional<int64_t> reportedTime = 4;

    auto execute(const ToolDefinition& tool, const nlohmann::json& parameters) -> Result<ToolOutput> override
    {
        auto const lock = std::lock_guard { _mutex };
        invocations.emplace_back(tool.name, parameters);
        if (failure)
            return std::unexpected(*failure);
        return ToolOutput { .result = parameters.value("a", 0) + parameters.value("b", 0),
                            .executionTimeMs = reportedTime };
    }

  private:
    std::mutex _mutex;
};

auto addTool(ExecutionEnvironment environment = ExecutionEnvironment::Node) -> ToolDefinition
{
    return ToolDefinition {
        .name = "add",
        .description = "Adds two numbers",
        .code = "function tool(p) { return p.a + p.b; }",
        .parameterSchema = nlohmann::json::parse(R"({
            "type": "object",
            "required": ["a", "b"],
            "properties": {"a": {"type": "number"}, "b": {"type": "number"}}
        })"),
        .environment = environment,
    };
}

auto addCall(nlohmann::json parameters) -> ToolCallDirective
{
    return ToolCallDirective { .id = "call_0", .toolName = "add", .parameters = std::move(parameters) };
}

} // namespace

TEST_CASE("ToolRouter runs a valid call on the node executor", "[router]")
{
    auto node = RecordingExecutor {};
    auto const router = ToolRouter(node);
    auto calls = ToolCallTable {};
    auto const tool = addTool();

    auto const result = router.execute(addCall({ { "a", 1 }, { "b", 2 } }), &tool, nullptr, calls);

    CHECK(result.status == ToolStatus::Completed);
    REQUIRE(result.result.has_value());
    CHECK(*result.result == 3);
    CHECK(result.executionTimeMs == 4);
    CHECK(node.invocations.size() == 1);

    auto const tracked = calls.find(callIdentity("add", { { "a", 1 }, { "b", 2 } }));
    REQUIRE(tracked.has_value());
    CHECK(tracked->status == ToolStatus::Completed);
}

TEST_CASE("ToolRouter measures the time when the executor does not", "[router]")
{
    auto node = RecordingExecutor {};
    node.reportedTime.reset();
    auto const router = ToolRouter(node);
    auto calls = ToolCallTable {};
    auto const tool = addTool();

    auto const result = router.execute(addCall({ { "a", 1 }, { "b", 2 } }), &tool, nullptr, calls);
    REQUIRE(result.executionTimeMs.has_value());
    CHECK(*result.executionTimeMs >= 0);
}

TEST_CASE("ToolRouter rejects a type mismatch without executing", "[router]")
{
    auto node = RecordingExecutor {};
    auto const router = ToolRouter(node);
    auto calls = ToolCallTable {};
    auto const tool = addTool();

    auto const result = router.execute(addCall({ { "a", "x" }, { "b", 2 } }), &tool, nullptr, calls);

    CHECK(result.status == ToolStatus::Failed);
    CHECK(result.error == R"(Property "a" must be number, got string)");
    CHECK(node.invocations.empty());
}

TEST_CASE("ToolRouter rejects a missing required field without executing", "[router]")
{
    auto node = RecordingExecutor {};
    auto const router = ToolRouter(node);
    auto calls = ToolCallTable {};
    auto const tool = addTool();

    auto const result = router.execute(addCall({ { "a", 1 } }), &tool, nullptr, calls);

    CHECK(result.status == ToolStatus::Failed);
    CHECK(result.error == "Missing required property: b");
    CHECK(node.invocations.empty());
}

TEST_CASE("ToolRouter fails unknown and disabled tools", "[router]")
{
    auto node = RecordingExecutor {};
    auto const router = ToolRouter(node);
    auto calls = ToolCallTable {};

    auto const missing = router.execute(addCall({ { "a", 1 }, { "b", 2 } }), nullptr, nullptr, calls);
    CHECK(missing.status == ToolStatus::Failed);
    CHECK(missing.error == R"(Tool "add" not found)");

    auto tool = addTool();
    tool.enabled = false;
    auto const disabled = router.execute(addCall({ { "a", 2 }, { "b", 2 } }), &tool, nullptr, calls);
    CHECK(disabled.error == R"(Tool "add" is disabled)");
    CHECK(node.invocations.empty());
}

TEST_CASE("ToolRouter reports executor errors as failed results", "[router]")
{
    auto node = RecordingExecutor {};
    node.failure = Error { ErrorCode::TimeoutError, "Tool execution timed out after 30000ms" };
    auto const router = ToolRouter(node);
    auto calls = ToolCallTable {};
    auto const tool = addTool();

    auto const result = router.execute(addCall({ { "a", 1 }, { "b", 2 } }), &tool, nullptr, calls);
    CHECK(result.status == ToolStatus::Failed);
    CHECK(result.error == "Tool execution timed out after 30000ms");
    CHECK(calls.find(callIdentity("add", result.parameters))->status == ToolStatus::Failed);
}

TEST_CASE("ToolRouter routes by execution environment", "[router]")
{
    auto node = RecordingExecutor {};
    auto mcp = RecordingExecutor {};
    auto const router = ToolRouter(node, &mcp);
    auto calls = ToolCallTable {};

    auto const mcpTool = addTool(ExecutionEnvironment::Mcp);
    CHECK(router.execute(addCall({ { "a", 1 }, { "b", 2 } }), &mcpTool, nullptr, calls).status
          == ToolStatus::Completed);
    CHECK(mcp.invocations.size() == 1);
    CHECK(node.invocations.empty());

    auto const browserTool = addTool(ExecutionEnvironment::Browser);
    auto const noFrontend = router.execute(addCall({ { "a", 5 }, { "b", 5 } }), &browserTool, nullptr, calls);
    CHECK(noFrontend.status == ToolStatus::Failed);
    CHECK(noFrontend.error == "No front-end execution context available");
}

TEST_CASE("ToolRouter without an MCP executor fails MCP tools", "[router]")
{
    auto node = RecordingExecutor {};
    auto const router = ToolRouter(node);
    auto calls = ToolCallTable {};
    auto const tool = addTool(ExecutionEnvironment::Mcp);

    auto const result = router.execute(addCall({ { "a", 1 }, { "b", 2 } }), &tool, nullptr, calls);
    CHECK(result.error == R"(MCP tool "add" has no connected server)");
}
