// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>

namespace dictum
{

/// @brief Identifies one capture between startCapture() and finishCapture().
struct CaptureHandle
{
    std::uint64_t id = 0;
    std::filesystem::path path; ///< Where the artifact will be written.
    std::chrono::steady_clock::time_point startedAt {};
};

/// @brief Abstract interface for the collaborator that produces audio artifacts.
class CaptureSource
{
  public:
    virtual ~CaptureSource() = default;

    /// @brief Starts a capture.
    /// @return A handle for finishCapture(), or ErrorCode::Capture.
    [[nodiscard]] virtual auto startCapture() -> Result<CaptureHandle> = 0;

    /// @brief Stops the capture and writes the artifact.
    /// @return The artifact on disk, or ErrorCode::Capture.
    [[nodiscard]] virtual auto finishCapture(const CaptureHandle& handle) -> Result<AudioArtifact> = 0;

    /// @brief Checks the artifact format and non-triviality.
    ///
    /// Implementations move rejected files out of the way.
    /// @return The artifact with its measured duration, or ErrorCode::InvalidArtifact.
    [[nodiscard]] virtual auto validate(const AudioArtifact& artifact) -> Result<AudioArtifact> = 0;
};

} // namespace dictum
