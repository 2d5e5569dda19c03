// SPDX-License-Identifier: Apache-2.0
#include "WorkerExecutor.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <chrono>
#include <format>

namespace toolchat
{

WorkerExecutor::WorkerExecutor(ProcessConfig workerCommand): _workerCommand(std::move(workerCommand))
{
}

auto WorkerExecutor::execute(const ToolDefinition& tool, const nlohmann::json& parameters) -> Result<ToolOutput>
{
    auto const timeout = std::chrono::milliseconds(tool.timeoutMs);
    auto worker = ProcessChannel {};

    if (auto started = worker.start(_workerCommand); !started)
        return makeError(ErrorCode::ToolCallError, std::format("Failed to spawn worker: {}", started.error().message));

    auto const request = nlohmann::json {
        { "type", "execute" },
        { "code", tool.code },
        { "parameters", parameters },
        { "timeout", tool.timeoutMs },
    };
    if (auto sent = worker.send(request); !sent)
        log::debug("Worker for {} did not accept the request: {}", tool.name, sent.error().message);

    auto reply = worker.receive(timeout);
    if (!reply)
    {
        if (reply.error().code == ErrorCode::TimeoutError)
        {
            worker.kill();
            log::warning("Tool {} timed out after {}ms; worker killed", tool.name, tool.timeoutMs);
            return makeError(ErrorCode::TimeoutError, std::format("Tool execution timed out after {}ms", tool.timeoutMs));
        }

        if (reply.error().code == ErrorCode::ProtocolError)
        {
            worker.kill();
            return makeError(ErrorCode::ProtocolError,
                             std::format("Invalid worker response: {}", reply.error().message));
        }

        auto const exitCode = worker.wait();
        if (exitCode && *exitCode != 0)
            return makeError(ErrorCode::ToolCallError, std::format("Worker process exited with code {}", *exitCode));
        return makeError(ErrorCode::ToolCallError, "Worker exited without sending response");
    }

    // One request per worker; whatever it does after answering is irrelevant.
    worker.kill();

    auto const& response = *reply;
    if (!json::getBoolOr(response, "success", false))
        return makeError(ErrorCode::ToolCallError, json::getStringOr(response, "error", "Tool execution failed"));

    auto output = ToolOutput {
        .result = response.value("result", nlohmann::json()),
        .executionTimeMs = std::nullopt,
    };
    if (response.contains("executionTime") && response["executionTime"].is_number())
        output.executionTimeMs = response["executionTime"].get<int64_t>();
    return output;
}

} // namespace toolchat
