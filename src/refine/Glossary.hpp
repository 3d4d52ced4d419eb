// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace dictum
{

/// @brief Upper bound on glossary entries; further lines are ignored.
constexpr std::size_t MaxGlossaryEntries = 500;

/// @brief Parses "abbreviation = expansion" lines.
///
/// Blank lines, lines starting with '#', lines without '=' and lines with an empty side are
/// skipped. Keys and values are trimmed; a repeated key keeps the last value.
[[nodiscard]] auto parseGlossary(std::string_view content) -> Glossary;

/// @brief Loads a glossary file. A missing or unreadable file yields an empty glossary.
[[nodiscard]] auto loadGlossary(const std::filesystem::path& path) -> Glossary;

/// @brief Renders the glossary as a prompt block headed "APPLY THESE ABBREVIATIONS:".
/// @return An empty string for an empty glossary.
[[nodiscard]] auto formatGlossaryForPrompt(const Glossary& glossary) -> std::string;

} // namespace dictum
