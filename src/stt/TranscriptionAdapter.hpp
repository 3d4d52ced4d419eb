// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <process/ProcessRunner.hpp>
#include <stt/Transcriber.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace dictum
{

/// @brief Settings of the transcription backend.
struct TranscriptionConfig
{
    std::string cliPath = "whisper-cli";
    std::string modelPath;
    std::string language = "de";
    std::chrono::seconds timeout { 60 };
};

/// @brief Classification of a transcription backend exit.
enum class TranscriptionOutcome : std::uint8_t
{
    Success,
    ModelNotFound,
    DeviceError,
    Timeout,
    InvalidInput,
    GenericError,
};

[[nodiscard]] constexpr auto transcriptionOutcomeName(TranscriptionOutcome outcome) -> std::string_view
{
    switch (outcome)
    {
        case TranscriptionOutcome::Success: return "Success";
        case TranscriptionOutcome::ModelNotFound: return "ModelNotFound";
        case TranscriptionOutcome::DeviceError: return "DeviceError";
        case TranscriptionOutcome::Timeout: return "Timeout";
        case TranscriptionOutcome::InvalidInput: return "InvalidInput";
        case TranscriptionOutcome::GenericError: return "GenericError";
    }
    return "Unknown";
}

/// @brief Maps a whisper CLI exit code: 0 ok, 2 model, 3 device, 4 timeout, 5 input, anything else generic.
[[nodiscard]] constexpr auto classifyTranscriptionExit(int exitCode) -> TranscriptionOutcome
{
    switch (exitCode)
    {
        case 0: return TranscriptionOutcome::Success;
        case 2: return TranscriptionOutcome::ModelNotFound;
        case 3: return TranscriptionOutcome::DeviceError;
        case 4: return TranscriptionOutcome::Timeout;
        case 5: return TranscriptionOutcome::InvalidInput;
        default: return TranscriptionOutcome::GenericError;
    }
}

/// @brief Runs the whisper command line tool and reads its JSON result file.
///
/// Invocation:
///   <cli> --model <model> --language <lang> --output-format json --output-file <json> <wav>
/// The JSON file is written next to the WAV as stt_result_<timestamp>.json and removed after parsing.
class TranscriptionAdapter: public Transcriber
{
  public:
    TranscriptionAdapter(TranscriptionConfig config, ProcessRunner& runner);

    [[nodiscard]] auto transcribe(const TranscriptionRequest& request) -> Result<TranscriptionResult> override;

    /// @brief Builds the process invocation for one artifact.
    [[nodiscard]] auto buildSpec(const TranscriptionRequest& request, const std::filesystem::path& outputJson) const
        -> ProcessSpec;

    /// @brief Parses the JSON side-channel.
    /// @return The result, or ErrorCode::MalformedOutput if the JSON is invalid or "text" is missing.
    [[nodiscard]] static auto parseResult(std::string_view json) -> Result<TranscriptionResult>;

    [[nodiscard]] auto config() const noexcept -> const TranscriptionConfig& { return _config; }

  private:
    TranscriptionConfig _config;
    ProcessRunner& _runner;
};

} // namespace dictum
