// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace dictum::wav
{

/// @brief Sample rate every artifact is recorded and validated at.
constexpr std::uint32_t SampleRate = 16000;

/// @brief Header fields of a RIFF/WAVE file.
struct WavInfo
{
    std::uint16_t audioFormat = 0; ///< 1 = PCM
    std::uint16_t channels = 0;
    std::uint32_t sampleRate = 0;
    std::uint16_t bitsPerSample = 0;
    std::uint32_t dataBytes = 0;

    /// @brief Returns the playback duration of the data chunk in seconds.
    [[nodiscard]] auto durationSeconds() const -> double
    {
        auto const bytesPerSecond =
            static_cast<double>(sampleRate) * channels * (bitsPerSample / 8);
        return bytesPerSecond > 0.0 ? static_cast<double>(dataBytes) / bytesPerSecond : 0.0;
    }
};

/// @brief Converts float samples in [-1, 1] to signed 16-bit PCM, clamping out-of-range values.
[[nodiscard]] auto toPcm16(std::span<const float> samples) -> std::vector<std::int16_t>;

/// @brief Writes a 16 kHz mono 16-bit PCM WAV file.
/// @return ErrorCode::IoError if the file cannot be written.
[[nodiscard]] auto write(const std::filesystem::path& path, std::span<const std::int16_t> samples) -> VoidResult;

/// @brief Reads the RIFF header, the fmt chunk and the size of the data chunk.
/// @return ErrorCode::InvalidArtifact if the file is missing, truncated or not RIFF/WAVE.
[[nodiscard]] auto readInfo(const std::filesystem::path& path) -> Result<WavInfo>;

/// @brief Checks that a file is a speech-recognition-ready artifact.
///
/// Requires PCM, 1 channel, 16000 Hz, 16 bit and at least minDuration of samples.
/// @return The artifact with its measured duration, or ErrorCode::InvalidArtifact.
[[nodiscard]] auto validate(const std::filesystem::path& path, std::chrono::milliseconds minDuration)
    -> Result<AudioArtifact>;

/// @brief Moves a rejected file into a "failed" directory next to it.
///
/// A name collision is resolved by appending a timestamp to the file stem.
/// @return The new location.
[[nodiscard]] auto moveToFailedDirectory(const std::filesystem::path& path) -> Result<std::filesystem::path>;

/// @brief validate(), moving the file into the failed directory if it is rejected.
[[nodiscard]] auto validateOrQuarantine(const std::filesystem::path& path, std::chrono::milliseconds minDuration)
    -> Result<AudioArtifact>;

} // namespace dictum::wav
