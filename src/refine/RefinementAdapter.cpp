// SPDX-License-Identifier: Apache-2.0
#include "RefinementAdapter.hpp"

#include <core/Log.hpp>
#include <refine/PromptBuilder.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <ranges>

namespace dictum
{

namespace
{
    auto toLower(std::string_view text) -> std::string
    {
        auto result = std::string(text);
        std::ranges::transform(
            result, result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }
} // namespace

auto RefinementConfig::defaultGpuFailurePatterns() -> std::vector<std::string>
{
    return {
        "CUDA error",
        "out of memory",
        "cudaMalloc failed",
        "failed to allocate",
        "no CUDA-capable device",
        "ggml_cuda_init: failed",
        "Vulkan error",
        "Metal error",
    };
}

auto RefinementConfig::defaultPreamblePatterns() -> std::vector<std::string>
{
    return {
        "llama_", "llm_load", "load_backend:", "ggml_",   "main:",         "build:",        "system_info:",
        "sampler", "sampling", "generate:",    "Log start", "[end of text]", "> EOF by user",
    };
}

RefinementAdapter::RefinementAdapter(RefinementConfig config, ProcessRunner& runner):
    _config(std::move(config)), _runner(runner)
{
}

auto RefinementAdapter::buildSpec(std::string_view systemPrompt, std::string_view userText, bool useGpu) const
    -> ProcessSpec
{
    auto spec = ProcessSpec {
        .command = _config.cliPath,
        .args = { "-m",
                  _config.modelPath,
                  "-sys",
                  std::string(systemPrompt),
                  "-p",
                  std::string(userText),
                  "--temp",
                  std::format("{:.2f}", _config.temperature),
                  "--top-p",
                  std::format("{:.2f}", _config.topP),
                  "--repeat-penalty",
                  std::format("{:.2f}", _config.repeatPenalty),
                  "-n",
                  std::to_string(_config.maxTokens),
                  "--no-display-prompt" },
        .sensitiveArgs = { 3, 5 },
    };
    if (useGpu)
    {
        spec.args.emplace_back("-ngl");
        spec.args.emplace_back("99");
    }
    return spec;
}

auto RefinementAdapter::isGpuFailure(std::string_view stderrText) const -> bool
{
    auto const haystack = toLower(stderrText);
    return std::ranges::any_of(_config.gpuFailurePatterns, [&](std::string const& pattern) {
        return !pattern.empty() && haystack.find(toLower(pattern)) != std::string::npos;
    });
}

auto RefinementAdapter::stripPreamble(std::string_view output) const -> std::string
{
    auto result = std::string {};
    for (auto const range: output | std::views::split('\n'))
    {
        auto line = std::string_view(range.begin(), range.end());
        if (line.ends_with('\r'))
            line.remove_suffix(1);

        auto const content = line.substr(std::min(line.find_first_not_of(" \t"), line.size()));
        auto const isPreamble = std::ranges::any_of(_config.preamblePatterns, [&](std::string const& prefix) {
            return !prefix.empty() && content.starts_with(prefix);
        });
        if (isPreamble)
            continue;

        result += line;
        result += '\n';
    }
    return std::string(trim(result));
}

auto RefinementAdapter::runOnce(const ProcessSpec& spec) -> Result<ProcessOutput>
{
    log::info("Refinement: {}", describe(spec));
    auto output = _runner.run(spec, _config.timeout);
    if (!output)
    {
        log::warning("Refinement failed ({}): {}",
                     refinementOutcomeName(output.error().code == ErrorCode::Timeout ? RefinementOutcome::Timeout
                                                                                    : RefinementOutcome::Error),
                     output.error().message);
        return output;
    }

    log::info("Refinement finished in {}ms: exit {} ({})",
              output->duration.count(),
              output->exitCode,
              refinementOutcomeName(classifyRefinementExit(output->exitCode)));
    return output;
}

auto RefinementAdapter::refine(const RefinementRequest& request) -> Result<RefinementResult>
{
    auto const detection = detectRefinementMode(request.text);
    if (trim(detection.text).empty())
        return makeError(ErrorCode::InvalidInput, "Nothing to refine");

    auto const systemPrompt = buildSystemPrompt(detection.mode, request.glossary);
    log::debug("Refinement mode {}, glossary {} entries",
               detection.mode == RefinementMode::Markdown ? "markdown" : "plain",
               request.glossary.size());

    auto useGpu = _config.gpuAcceleration;
    auto output = runOnce(buildSpec(systemPrompt, detection.text, useGpu));
    if (!output)
        return std::unexpected(output.error());

    if (output->exitCode != 0 && useGpu && isGpuFailure(output->stderrText))
    {
        log::warning("GPU failure detected in refinement, retrying once without GPU offloading");
        useGpu = false;
        output = runOnce(buildSpec(systemPrompt, detection.text, useGpu));
        if (!output)
            return std::unexpected(output.error());
    }

    if (classifyRefinementExit(output->exitCode) != RefinementOutcome::Success)
    {
        log::debug("Refinement stderr: {}", output->stderrText);
        return makeProcessError(ErrorCode::ProcessError,
                                std::format("Refinement failed (exit code {})", output->exitCode),
                                output->exitCode,
                                std::move(output->stderrText));
    }

    auto text = stripPreamble(output->stdoutText);
    if (text.empty())
        return makeError(ErrorCode::EmptyOutput, "Refinement produced no text");

    log::info("Refined {} -> {} chars{}", request.text.size(), text.size(), useGpu ? "" : " (CPU)");
    log::trace("Refined text: {}", text);
    return RefinementResult { .text = std::move(text), .mode = detection.mode, .succeeded = true };
}

} // namespace dictum
