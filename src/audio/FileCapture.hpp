// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/CaptureSource.hpp>

#include <chrono>
#include <filesystem>

namespace dictum
{

/// @brief Capture collaborator that hands out an existing WAV file instead of recording.
///
/// Used for one-shot transcription of a file and for driving the pipeline in tests.
class FileCapture: public CaptureSource
{
  public:
    FileCapture(std::filesystem::path source, std::chrono::milliseconds minDuration);

    [[nodiscard]] auto startCapture() -> Result<CaptureHandle> override;
    [[nodiscard]] auto finishCapture(const CaptureHandle& handle) -> Result<AudioArtifact> override;
    [[nodiscard]] auto validate(const AudioArtifact& artifact) -> Result<AudioArtifact> override;

  private:
    std::filesystem::path _source;
    std::chrono::milliseconds _minDuration;
    std::uint64_t _nextId = 1;
};

} // namespace dictum
