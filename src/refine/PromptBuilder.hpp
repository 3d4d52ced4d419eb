// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace dictum
{

/// @brief Number of words at either end of a transcript that are searched for the trigger phrase.
constexpr std::size_t MarkdownTriggerWindow = 20;

/// @brief Result of looking for the spoken "markdown mode" trigger.
struct ModeDetection
{
    RefinementMode mode = RefinementMode::Plain;
    std::string text; ///< Transcript with the trigger phrase removed.
};

/// @brief Detects "markdown mode" (any case) within the first or last 20 words and strips it.
[[nodiscard]] auto detectRefinementMode(std::string_view transcript) -> ModeDetection;

/// @brief Builds the copy-editor system prompt for a mode, followed by the glossary block if any.
[[nodiscard]] auto buildSystemPrompt(RefinementMode mode, const Glossary& glossary) -> std::string;

} // namespace dictum
