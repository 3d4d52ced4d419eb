// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

namespace dictum
{

/// @brief Abstract interface for text refinement backends.
class Refiner
{
  public:
    virtual ~Refiner() = default;

    /// @brief Reformats a transcript.
    /// @return The refined text, or an error. Callers fall back to the original text on error.
    [[nodiscard]] virtual auto refine(const RefinementRequest& request) -> Result<RefinementResult> = 0;
};

} // namespace dictum
