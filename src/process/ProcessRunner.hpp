// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dictum
{

/// @brief Describes one external program invocation.
struct ProcessSpec
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> stdinData;

    /// @brief Indices into args whose values carry user content and are redacted by describe().
    std::set<std::size_t> sensitiveArgs;

    /// @brief Kill the process group after a normal exit as well, not only on timeout.
    ///
    /// Programs that hand their work to a background process (wl-copy, xclip) set this to false.
    bool killDescendantsOnExit = true;
};

/// @brief Everything a finished process produced.
struct ProcessOutput
{
    int exitCode = 0;
    std::string stdoutText;
    std::string stderrText;
    std::chrono::milliseconds duration {};
};

/// @brief Renders the argument vector of a spec for logging.
/// @param spec The process spec.
/// @param redact If true, sensitive arguments are replaced by their length.
/// @return A single line like `whisper-cli --model "m.bin" ...`.
[[nodiscard]] auto describe(const ProcessSpec& spec, bool redact = true) -> std::string;

/// @brief Abstract interface for running an external program to completion.
class ProcessRunner
{
  public:
    virtual ~ProcessRunner() = default;

    /// @brief Runs the program and waits for it to exit or for the timeout to expire.
    ///
    /// On timeout the process and every process it spawned are killed before this returns.
    /// @param spec The program, arguments, environment and optional stdin payload.
    /// @param timeout Maximum wall-clock time the program may run.
    /// @return The exit code and captured output, ErrorCode::Timeout, or ErrorCode::ProcessError
    ///         if the program could not be started.
    [[nodiscard]] virtual auto run(const ProcessSpec& spec, std::chrono::milliseconds timeout)
        -> Result<ProcessOutput> = 0;
};

/// @brief Runs programs as child processes in their own process group (job object on Windows).
class SubprocessRunner: public ProcessRunner
{
  public:
    [[nodiscard]] auto run(const ProcessSpec& spec, std::chrono::milliseconds timeout)
        -> Result<ProcessOutput> override;
};

} // namespace dictum
