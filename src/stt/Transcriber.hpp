// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

namespace dictum
{

/// @brief Abstract interface for speech-to-text backends.
class Transcriber
{
  public:
    virtual ~Transcriber() = default;

    /// @brief Transcribes one audio artifact.
    /// @return The structured result (possibly empty), or a classified error.
    [[nodiscard]] virtual auto transcribe(const TranscriptionRequest& request) -> Result<TranscriptionResult> = 0;
};

} // namespace dictum
