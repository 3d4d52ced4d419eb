// SPDX-License-Identifier: Apache-2.0
#include "FileCapture.hpp"

#include <audio/WavFile.hpp>
#include <core/Log.hpp>

#include <format>

namespace dictum
{

FileCapture::FileCapture(std::filesystem::path source, std::chrono::milliseconds minDuration):
    _source(std::move(source)), _minDuration(minDuration)
{
}

auto FileCapture::startCapture() -> Result<CaptureHandle>
{
    auto ec = std::error_code {};
    if (!std::filesystem::is_regular_file(_source, ec))
        return makeError(ErrorCode::Capture, std::format("Audio file not found: {}", _source.string()));

    log::info("Using recorded audio {}", _source.string());
    return CaptureHandle { .id = _nextId++, .path = _source, .startedAt = std::chrono::steady_clock::now() };
}

auto FileCapture::finishCapture(const CaptureHandle& handle) -> Result<AudioArtifact>
{
    auto ec = std::error_code {};
    if (!std::filesystem::is_regular_file(handle.path, ec))
        return makeError(ErrorCode::Capture, std::format("Audio file disappeared: {}", handle.path.string()));

    auto const info = wav::readInfo(handle.path);
    return AudioArtifact { .path = handle.path, .durationSeconds = info ? info->durationSeconds() : 0.0 };
}

auto FileCapture::validate(const AudioArtifact& artifact) -> Result<AudioArtifact>
{
    // Files supplied by the user are rejected but never moved.
    return wav::validate(artifact.path, _minDuration);
}

} // namespace dictum
