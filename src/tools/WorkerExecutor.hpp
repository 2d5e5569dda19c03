// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tools/ProcessChannel.hpp>
#include <tools/ToolExecutor.hpp>

namespace toolchat
{

/// @brief Runs tool code in a fresh worker process per call.
///
/// The worker reads one request line
/// `{"type":"execute","code":...,"parameters":...,"timeout":...}` from stdin and
/// answers with one line `{"success":bool,"result":...,"error":"...","executionTime":ms}`.
/// A worker that does not answer within the tool's timeout is killed.
class WorkerExecutor: public ToolExecutor
{
  public:
    explicit WorkerExecutor(ProcessConfig workerCommand);

    [[nodiscard]] auto execute(const ToolDefinition& tool, const nlohmann::json& parameters)
        -> Result<ToolOutput> override;

  private:
    ProcessConfig _workerCommand;
};

} // namespace toolchat
