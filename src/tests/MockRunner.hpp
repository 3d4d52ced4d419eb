// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <process/ProcessRunner.hpp>

#include <chrono>
#include <deque>
#include <mutex>
#include <vector>

namespace dictum::test
{

/// @brief ProcessRunner that records invocations and replays queued results.
class MockRunner: public ProcessRunner
{
  public:
    std::vector<ProcessSpec> calls;
    std::deque<Result<ProcessOutput>> results;

    auto run(const ProcessSpec& spec, std::chrono::milliseconds /*timeout*/) -> Result<ProcessOutput> override
    {
        auto const lock = std::lock_guard(_mutex);
        calls.push_back(spec);
        if (results.empty())
            return makeError(ErrorCode::ProcessError, "No more mock results");
        auto result = std::move(results.front());
        results.pop_front();
        return result;
    }

    void queueOutput(int exitCode, std::string stdoutText, std::string stderrText = {})
    {
        results.emplace_back(ProcessOutput {
            .exitCode = exitCode, .stdoutText = std::move(stdoutText), .stderrText = std::move(stderrText) });
    }

    void queueError(ErrorCode code, std::string message)
    {
        results.emplace_back(makeError(code, std::move(message)));
    }

  private:
    std::mutex _mutex;
};

} // namespace dictum::test
