// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace dictum
{

/// @brief Slug used when a text yields no usable characters.
constexpr std::string_view DefaultSlug = "transcript";

/// @brief Turns UTF-8 text into a lowercase ASCII kebab-case file name fragment.
///
/// German umlauts and ß as well as accented Latin-1 letters are folded to ASCII, blanks and
/// underscores become hyphens, everything else outside [a-z0-9-] is dropped. Slugs longer than
/// maxLength are cut at the last hyphen when it lies in the second half, otherwise hard.
[[nodiscard]] auto makeSlug(std::string_view text, std::size_t maxLength = 50) -> std::string;

} // namespace dictum
