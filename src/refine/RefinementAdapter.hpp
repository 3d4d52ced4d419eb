// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <process/ProcessRunner.hpp>
#include <refine/Refiner.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dictum
{

/// @brief Settings of the refinement backend.
struct RefinementConfig
{
    bool enabled = false;
    std::string cliPath = "llama-cli";
    std::string modelPath;
    std::chrono::seconds timeout { 5 };
    bool gpuAcceleration = true;
    bool useGlossary = false;
    std::string glossaryPath;
    double temperature = 0.0;
    double topP = 0.25;
    double repeatPenalty = 1.05;
    int maxTokens = 512;

    /// @brief Case-insensitive stderr fragments that mean GPU offloading failed.
    std::vector<std::string> gpuFailurePatterns = defaultGpuFailurePatterns();

    /// @brief Line prefixes of engine banner and timing output to drop from stdout.
    std::vector<std::string> preamblePatterns = defaultPreamblePatterns();

    [[nodiscard]] static auto defaultGpuFailurePatterns() -> std::vector<std::string>;
    [[nodiscard]] static auto defaultPreamblePatterns() -> std::vector<std::string>;
};

/// @brief Classification of a refinement backend run.
enum class RefinementOutcome : std::uint8_t
{
    Success,
    Error,
    Timeout,
};

[[nodiscard]] constexpr auto refinementOutcomeName(RefinementOutcome outcome) -> std::string_view
{
    switch (outcome)
    {
        case RefinementOutcome::Success: return "Success";
        case RefinementOutcome::Error: return "Error";
        case RefinementOutcome::Timeout: return "Timeout";
    }
    return "Unknown";
}

/// @brief Maps a refinement backend exit code.
[[nodiscard]] constexpr auto classifyRefinementExit(int exitCode) -> RefinementOutcome
{
    return exitCode == 0 ? RefinementOutcome::Success : RefinementOutcome::Error;
}

/// @brief Runs the llama command line tool on a transcript.
///
/// Invocation:
///   <cli> -m <model> -sys <system prompt> -p <text> --temp <t> --top-p <p>
///         --repeat-penalty <r> -n <tokens> --no-display-prompt [-ngl 99]
/// If the GPU run fails with a stderr line matching a GPU failure pattern, the call is
/// repeated once without -ngl.
class RefinementAdapter: public Refiner
{
  public:
    RefinementAdapter(RefinementConfig config, ProcessRunner& runner);

    [[nodiscard]] auto refine(const RefinementRequest& request) -> Result<RefinementResult> override;

    /// @brief Builds the process invocation.
    [[nodiscard]] auto buildSpec(std::string_view systemPrompt, std::string_view userText, bool useGpu) const
        -> ProcessSpec;

    /// @brief Returns true if stderr contains any configured GPU failure pattern (case-insensitive).
    [[nodiscard]] auto isGpuFailure(std::string_view stderrText) const -> bool;

    /// @brief Removes preamble lines and surrounding whitespace from backend output.
    [[nodiscard]] auto stripPreamble(std::string_view output) const -> std::string;

  private:
    [[nodiscard]] auto runOnce(const ProcessSpec& spec) -> Result<ProcessOutput>;

    RefinementConfig _config;
    ProcessRunner& _runner;
};

} // namespace dictum
