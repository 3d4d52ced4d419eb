// SPDX-License-Identifier: Apache-2.0
#include "TranscriptionAdapter.hpp"

#include <core/Clock.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>
#include <fstream>
#include <sstream>

namespace dictum
{

namespace
{
    auto outcomeErrorCode(TranscriptionOutcome outcome) -> ErrorCode
    {
        switch (outcome)
        {
            case TranscriptionOutcome::ModelNotFound: return ErrorCode::ModelNotFound;
            case TranscriptionOutcome::DeviceError: return ErrorCode::DeviceError;
            case TranscriptionOutcome::Timeout: return ErrorCode::Timeout;
            case TranscriptionOutcome::InvalidInput: return ErrorCode::InvalidInput;
            case TranscriptionOutcome::Success:
            case TranscriptionOutcome::GenericError: break;
        }
        return ErrorCode::ProcessError;
    }

    auto outcomeMessage(TranscriptionOutcome outcome, int exitCode) -> std::string
    {
        switch (outcome)
        {
            case TranscriptionOutcome::ModelNotFound: return "Speech model not found";
            case TranscriptionOutcome::DeviceError: return "Transcription device not available";
            case TranscriptionOutcome::Timeout: return "Transcription took too long";
            case TranscriptionOutcome::InvalidInput: return "Invalid audio file";
            case TranscriptionOutcome::Success:
            case TranscriptionOutcome::GenericError: break;
        }
        return std::format("Transcription failed (exit code {})", exitCode);
    }

    /// @brief Reads the side-channel file and removes it (and the name whisper.cpp itself would use).
    auto consumeOutputFile(const std::filesystem::path& path) -> Result<std::string>
    {
        auto ec = std::error_code {};
        auto const appended = std::filesystem::path(path.string() + ".json");
        auto const source = std::filesystem::exists(path, ec) ? path : appended;

        auto content = std::string {};
        {
            auto file = std::ifstream(source);
            if (!file.is_open())
                return makeError(ErrorCode::MalformedOutput,
                                 std::format("Transcription output file not found: {}", path.string()));
            auto ss = std::stringstream {};
            ss << file.rdbuf();
            content = ss.str();
        }

        std::filesystem::remove(path, ec);
        std::filesystem::remove(appended, ec);
        return content;
    }

    void removeOutputFile(const std::filesystem::path& path)
    {
        auto ec = std::error_code {};
        std::filesystem::remove(path, ec);
        std::filesystem::remove(std::filesystem::path(path.string() + ".json"), ec);
    }
} // namespace

TranscriptionAdapter::TranscriptionAdapter(TranscriptionConfig config, ProcessRunner& runner):
    _config(std::move(config)), _runner(runner)
{
}

auto TranscriptionAdapter::buildSpec(const TranscriptionRequest& request,
                                     const std::filesystem::path& outputJson) const -> ProcessSpec
{
    auto const& language = request.language.empty() ? _config.language : request.language;
    return ProcessSpec {
        .command = _config.cliPath,
        .args = { "--model",
                  _config.modelPath,
                  "--language",
                  language,
                  "--output-format",
                  "json",
                  "--output-file",
                  outputJson.string(),
                  request.artifactPath.string() },
    };
}

auto TranscriptionAdapter::parseResult(std::string_view json) -> Result<TranscriptionResult>
{
    auto parsed = json::parse(json, ErrorCode::MalformedOutput);
    if (!parsed)
        return std::unexpected(parsed.error());

    auto const& root = *parsed;
    auto text = json::getString(root, "text");
    if (!text)
        return makeError(ErrorCode::MalformedOutput, "Transcription output has no 'text' field");

    auto result = TranscriptionResult {
        .text = std::move(*text),
        .language = json::getStringOr(root, "language", ""),
        .durationSeconds = json::getDoubleOr(root, "duration_sec", 0.0),
        .segments = {},
    };

    if (root.contains("segments") && root["segments"].is_array())
    {
        for (auto const& segment: root["segments"])
        {
            result.segments.push_back(TranscriptSegment {
                .start = json::getDoubleOr(segment, "start", 0.0),
                .end = json::getDoubleOr(segment, "end", 0.0),
                .text = json::getStringOr(segment, "text", ""),
            });
        }
    }

    return result;
}

auto TranscriptionAdapter::transcribe(const TranscriptionRequest& request) -> Result<TranscriptionResult>
{
    auto ec = std::error_code {};
    if (!std::filesystem::is_regular_file(request.artifactPath, ec))
        return makeError(ErrorCode::InvalidArtifact,
                         std::format("Audio file not found: {}", request.artifactPath.string()));

    auto const outputJson = request.artifactPath.parent_path()
                            / std::format("stt_result_{}.json", compactTimestamp(std::chrono::system_clock::now()));
    auto const spec = buildSpec(request, outputJson);

    log::info("Transcription: {}", describe(spec));
    auto output = _runner.run(spec, _config.timeout);
    if (!output)
    {
        log::error("Transcription failed: {}", output.error());
        removeOutputFile(outputJson);
        return std::unexpected(output.error());
    }

    auto const outcome = classifyTranscriptionExit(output->exitCode);
    log::info("Transcription finished in {}ms: exit {} ({})",
              output->duration.count(),
              output->exitCode,
              transcriptionOutcomeName(outcome));

    if (outcome != TranscriptionOutcome::Success)
    {
        log::debug("Transcription stderr: {}", output->stderrText);
        removeOutputFile(outputJson);
        return makeProcessError(outcomeErrorCode(outcome),
                                outcomeMessage(outcome, output->exitCode),
                                output->exitCode,
                                std::move(output->stderrText));
    }

    auto content = consumeOutputFile(outputJson);
    if (!content)
    {
        log::error("{}", content.error());
        return std::unexpected(content.error());
    }

    auto result = parseResult(*content);
    if (!result)
    {
        log::error("{}", result.error());
        return result;
    }

    log::info("Transcribed {} chars, language '{}', {:.1f}s, {} segments{}",
              result->text.size(),
              result->language,
              result->durationSeconds,
              result->segments.size(),
              result->isEmpty() ? " (empty)" : "");
    log::trace("Transcript: {}", result->text);
    return result;
}

} // namespace dictum
