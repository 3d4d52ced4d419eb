// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dictum
{

/// @brief Phase of the dictation session.
enum class SessionState : std::uint8_t
{
    Idle,
    Recording,
    Processing,
    PostProcessing,
};

/// @brief Converts a SessionState to its string representation.
[[nodiscard]] constexpr auto sessionStateName(SessionState state) -> std::string_view
{
    switch (state)
    {
        case SessionState::Idle: return "Idle";
        case SessionState::Recording: return "Recording";
        case SessionState::Processing: return "Processing";
        case SessionState::PostProcessing: return "PostProcessing";
    }
    return "Unknown";
}

/// @brief Abbreviation to expansion mapping applied during refinement.
using Glossary = std::map<std::string, std::string>;

/// @brief A captured audio unit on disk.
struct AudioArtifact
{
    std::filesystem::path path;
    double durationSeconds = 0.0;
};

/// @brief A timestamped piece of a transcript.
struct TranscriptSegment
{
    double start = 0.0;
    double end = 0.0;
    std::string text;
};

/// @brief Input of one transcription backend invocation.
struct TranscriptionRequest
{
    std::filesystem::path artifactPath;
    std::string language; ///< Overrides the configured language when non-empty.
};

/// @brief Structured output of the transcription backend.
struct TranscriptionResult
{
    std::string text;
    std::string language;
    double durationSeconds = 0.0;
    std::vector<TranscriptSegment> segments;

    /// @brief Returns true if no speech was recognized (blank text).
    [[nodiscard]] auto isEmpty() const -> bool
    {
        return text.find_first_not_of(" \t\r\n") == std::string::npos;
    }
};

/// @brief Output style requested from the refinement backend.
enum class RefinementMode : std::uint8_t
{
    Plain,
    Markdown,
};

/// @brief Input of one refinement backend invocation.
struct RefinementRequest
{
    std::string text;
    Glossary glossary;
};

/// @brief Output of the refinement backend.
struct RefinementResult
{
    std::string text;
    RefinementMode mode = RefinementMode::Plain;
    bool succeeded = false;
};

/// @brief What one completed pipeline run delivered.
struct PipelineOutcome
{
    std::string finalText;
    bool postProcessed = false;
    bool clipboardOk = false;
    std::optional<std::filesystem::path> historyPath;
};

/// @brief Severity of an operator-facing notification.
enum class NotificationKind : std::uint8_t
{
    Success,
    Warning,
    Error,
};

} // namespace dictum
