// SPDX-License-Identifier: Apache-2.0
#include "Slug.hpp"

#include <array>
#include <cctype>
#include <cstdint>

namespace dictum
{

namespace
{
    // ASCII folding of U+00C0 .. U+00FF. Letters without a decomposition map to nothing.
    constexpr auto Latin1Folding = std::array<std::string_view, 64> {
        "a", "a", "a", "a", "a", "a", "",  "c", // À Á Â Ã Ä Å Æ Ç
        "e", "e", "e", "e", "i", "i", "i", "i", // È É Ê Ë Ì Í Î Ï
        "",  "n", "o", "o", "o", "o", "o", "",  // Ð Ñ Ò Ó Ô Õ Ö ×
        "",  "u", "u", "u", "u", "y", "",  "ss", // Ø Ù Ú Û Ü Ý Þ ß
        "a", "a", "a", "a", "a", "a", "",  "c", // à á â ã ä å æ ç
        "e", "e", "e", "e", "i", "i", "i", "i", // è é ê ë ì í î ï
        "",  "n", "o", "o", "o", "o", "o", "",  // ð ñ ò ó ô õ ö ÷
        "",  "u", "u", "u", "u", "y", "",  "y", // ø ù ú û ü ý þ ÿ
    };

    /// @brief Decodes the UTF-8 sequence at text[i], advancing i. Invalid bytes decode to U+FFFD.
    auto nextCodepoint(std::string_view text, std::size_t& i) -> char32_t
    {
        auto const lead = static_cast<std::uint8_t>(text[i++]);
        if (lead < 0x80)
            return lead;

        auto length = 0;
        auto cp = char32_t { 0 };
        if ((lead & 0xE0) == 0xC0)
        {
            length = 1;
            cp = lead & 0x1F;
        }
        else if ((lead & 0xF0) == 0xE0)
        {
            length = 2;
            cp = lead & 0x0F;
        }
        else if ((lead & 0xF8) == 0xF0)
        {
            length = 3;
            cp = lead & 0x07;
        }
        else
            return 0xFFFD;

        for (auto n = 0; n < length; ++n)
        {
            if (i >= text.size() || (static_cast<std::uint8_t>(text[i]) & 0xC0) != 0x80)
                return 0xFFFD;
            cp = (cp << 6) | (static_cast<std::uint8_t>(text[i++]) & 0x3F);
        }
        return cp;
    }
} // namespace

auto makeSlug(std::string_view text, std::size_t maxLength) -> std::string
{
    auto slug = std::string {};
    auto const appendHyphen = [&] {
        if (!slug.empty() && slug.back() != '-')
            slug += '-';
    };

    for (auto i = std::size_t { 0 }; i < text.size();)
    {
        auto const cp = nextCodepoint(text, i);
        if (cp < 0x80)
        {
            auto const c = static_cast<unsigned char>(cp);
            if (std::isalnum(c))
                slug += static_cast<char>(std::tolower(c));
            else if (std::isspace(c) || c == '_' || c == '-')
                appendHyphen();
        }
        else if (cp == 0xA0)
            appendHyphen();
        else if (cp >= 0xC0 && cp <= 0xFF)
            slug += Latin1Folding[cp - 0xC0];
    }

    while (!slug.empty() && slug.back() == '-')
        slug.pop_back();

    if (slug.size() > maxLength)
    {
        slug.resize(maxLength);
        auto const lastHyphen = slug.rfind('-');
        if (lastHyphen != std::string::npos && lastHyphen > maxLength / 2)
            slug.resize(lastHyphen);
        while (!slug.empty() && slug.back() == '-')
            slug.pop_back();
    }

    return slug.empty() ? std::string(DefaultSlug) : slug;
}

} // namespace dictum
