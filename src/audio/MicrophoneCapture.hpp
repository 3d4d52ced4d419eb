// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/CaptureSource.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace dictum
{

/// @brief Records the microphone with miniaudio and writes 16 kHz mono 16-bit WAV artifacts.
///
/// The device is opened on the first startCapture() and kept open afterwards.
class MicrophoneCapture: public CaptureSource
{
  public:
    /// @param recordingDir Directory for artifacts (usually <dataRoot>/tmp).
    /// @param deviceName Case-insensitive substring of the capture device name; empty selects automatically.
    /// @param minDuration Shortest recording that validate() accepts.
    MicrophoneCapture(std::filesystem::path recordingDir, std::string deviceName, std::chrono::milliseconds minDuration);
    ~MicrophoneCapture() override;

    MicrophoneCapture(const MicrophoneCapture&) = delete;
    MicrophoneCapture& operator=(const MicrophoneCapture&) = delete;

    [[nodiscard]] auto startCapture() -> Result<CaptureHandle> override;
    [[nodiscard]] auto finishCapture(const CaptureHandle& handle) -> Result<AudioArtifact> override;
    [[nodiscard]] auto validate(const AudioArtifact& artifact) -> Result<AudioArtifact> override;

    /// @brief Returns the current peak audio level (0.0 to 1.0). Safe to call from any thread.
    [[nodiscard]] auto peakLevel() const -> float;

    // Impl must be accessible from the C audio callback
    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace dictum
