// SPDX-License-Identifier: Apache-2.0
#include <tools/FrontendBridge.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using namespace toolchat;
using namespace std::chrono_literals;

namespace
{

auto browserTool(int timeoutMs = 2000) -> ToolDefinition
{
    return ToolDefinition {
        .name = "scroll",
        .description = "Scrolls the page",
        .code = "window.scrollBy(0, params.dy);",
        .parameterSchema = nlohmann::json::object(),
        .environment = ExecutionEnvironment::Browser,
        .timeoutMs = timeoutMs,
        .enabled = true,
        .mcpServer = {},
        .mcpToolName = {},
    };
}

/// Answers every request right away from inside dispatch().
class ImmediateFrontend: public FrontendChannel
{
  public:
    ImmediateFrontend(FrontendBridge& bridge, FrontendResponse response):
        _bridge(bridge), _response(std::move(response))
    {
    }

    void dispatch(const FrontendRequest& request) override
    {
        requests.push_back(request);
        delivered = _bridge.deliverResult(request.identity, _response);
    }

    std::vector<FrontendRequest> requests;
    bool delivered = false;

  private:
    FrontendBridge& _bridge;
    FrontendResponse _response;
};

/// Records requests and never answers on its own.
class SilentFrontend: public FrontendChannel
{
  public:
    void dispatch(const FrontendRequest& request) override
    {
        auto const lock = std::lock_guard { _mutex };
        _requests.push_back(request);
    }

    auto requests() -> std::vector<FrontendRequest>
    {
        auto const lock = std::lock_guard { _mutex };
        return _requests;
    }

  private:
    std::mutex _mutex;
    std::vector<FrontendRequest> _requests;
};

void waitForPending(const FrontendBridge& bridge, size_t count)
{
    auto const deadline = std::chrono::steady_clock::now() + 5s;
    while (bridge.pendingCount() < count && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(1ms);
}

} // namespace

TEST_CASE("FrontendBridge fails without an attached front-end", "[frontend]")
{
    auto bridge = FrontendBridge {};
    CHECK(!bridge.isAttached());

    auto output = bridge.execute(browserTool(), { { "dy", 10 } });
    REQUIRE(!output.has_value());
    CHECK(output.error().code == ErrorCode::ToolCallError);
    CHECK(output.error().message == "No front-end execution context available");
}

TEST_CASE("FrontendBridge forwards the call and returns the front-end's result", "[frontend]")
{
    auto bridge = FrontendBridge {};
    auto frontend = ImmediateFrontend(bridge,
                                      FrontendResponse {
                                          .success = true,
                                          .result = { { "scrolled", true } },
                                          .error = {},
                                          .executionTimeMs = 3,
                                      });
    bridge.attach(&frontend);
    CHECK(bridge.isAttached());

    auto output = bridge.execute(browserTool(), { { "dy", 10 } });
    REQUIRE(output.has_value());
    CHECK(output->result == nlohmann::json { { "scrolled", true } });
    CHECK(output->executionTimeMs == 3);
    CHECK(frontend.delivered);
    CHECK(bridge.pendingCount() == 0);

    REQUIRE(frontend.requests.size() == 1);
    auto const& request = frontend.requests[0];
    CHECK(request.toolName == "scroll");
    CHECK(request.code == "window.scrollBy(0, params.dy);");
    CHECK(request.parameters == nlohmann::json { { "dy", 10 } });
    CHECK(request.timeoutMs == 2000);
    CHECK(request.identity == callIdentity("scroll", { { "dy", 10 } }));
}

TEST_CASE("FrontendBridge reports a front-end failure", "[frontend]")
{
    auto bridge = FrontendBridge {};
    auto frontend = ImmediateFrontend(bridge,
                                      FrontendResponse {
                                          .success = false,
                                          .result = nullptr,
                                          .error = "document is not defined",
                                          .executionTimeMs = std::nullopt,
                                      });
    bridge.attach(&frontend);

    auto output = bridge.execute(browserTool(), { { "dy", 1 } });
    REQUIRE(!output.has_value());
    CHECK(output.error().code == ErrorCode::ToolCallError);
    CHECK(output.error().message == "document is not defined");
}

TEST_CASE("FrontendBridge completes a call answered from another thread", "[frontend]")
{
    auto bridge = FrontendBridge {};
    auto frontend = SilentFrontend {};
    bridge.attach(&frontend);

    auto call = std::async(std::launch::async, [&] { return bridge.execute(browserTool(), { { "dy", 5 } }); });
    waitForPending(bridge, 1);
    REQUIRE(frontend.requests().size() == 1);

    auto const delivered = bridge.deliverResult(frontend.requests()[0].identity,
                                                FrontendResponse {
                                                    .success = true,
                                                    .result = "done",
                                                    .error = {},
                                                    .executionTimeMs = std::nullopt,
                                                });
    CHECK(delivered);

    auto output = call.get();
    REQUIRE(output.has_value());
    CHECK(output->result == "done");
    CHECK(!output->executionTimeMs.has_value());
}

TEST_CASE("FrontendBridge times out and discards a late result", "[frontend]")
{
    auto bridge = FrontendBridge {};
    auto frontend = SilentFrontend {};
    bridge.attach(&frontend);

    auto output = bridge.execute(browserTool(100), { { "dy", 1 } });
    REQUIRE(!output.has_value());
    CHECK(output.error().code == ErrorCode::TimeoutError);
    CHECK(output.error().message == "Browser tool execution timed out after 100ms");
    CHECK(bridge.pendingCount() == 0);

    REQUIRE(frontend.requests().size() == 1);
    auto const late = bridge.deliverResult(frontend.requests()[0].identity,
                                           FrontendResponse {
                                               .success = true,
                                               .result = 1,
                                               .error = {},
                                               .executionTimeMs = std::nullopt,
                                           });
    CHECK(!late);
}

TEST_CASE("FrontendBridge rejects a second call with the same identity while one is running", "[frontend]")
{
    auto bridge = FrontendBridge {};
    auto frontend = SilentFrontend {};
    bridge.attach(&frontend);

    auto first = std::async(std::launch::async, [&] { return bridge.execute(browserTool(), { { "dy", 7 } }); });
    waitForPending(bridge, 1);

    auto second = bridge.execute(browserTool(), { { "dy", 7 } });
    REQUIRE(!second.has_value());
    CHECK(second.error().code == ErrorCode::InvalidArgument);

    // Different parameters are a different call.
    auto other = std::async(std::launch::async, [&] { return bridge.execute(browserTool(), { { "dy", 8 } }); });
    waitForPending(bridge, 2);
    CHECK(bridge.pendingCount() == 2);

    for (const auto& request: frontend.requests())
        bridge.deliverResult(request.identity,
                             FrontendResponse {
                                 .success = true,
                                 .result = request.parameters["dy"],
                                 .error = {},
                                 .executionTimeMs = std::nullopt,
                             });

    auto firstOutput = first.get();
    auto otherOutput = other.get();
    REQUIRE(firstOutput.has_value());
    REQUIRE(otherOutput.has_value());
    CHECK(firstOutput->result == 7);
    CHECK(otherOutput->result == 8);
}

TEST_CASE("FrontendBridge ignores results for unknown calls", "[frontend]")
{
    auto bridge = FrontendBridge {};
    CHECK(!bridge.deliverResult("nothing|{}", FrontendResponse {}));
}
