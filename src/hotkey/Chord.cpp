// SPDX-License-Identifier: Apache-2.0
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <format>
#include <ranges>
#include <utility>

#include <hotkey/Chord.hpp>

namespace dictum
{

namespace
{
    auto toLower(std::string_view text) -> std::string
    {
        auto result = std::string(text);
        std::ranges::transform(
            result, result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t");
        return text.substr(first, last - first + 1);
    }

    constexpr auto NamedKeys = std::array {
        std::pair { std::string_view { "space" }, static_cast<KeyCode>(U' ') },
        std::pair { std::string_view { "enter" }, KeyCode::Enter },
        std::pair { std::string_view { "return" }, KeyCode::Enter },
        std::pair { std::string_view { "tab" }, KeyCode::Tab },
        std::pair { std::string_view { "backspace" }, KeyCode::Backspace },
    };

    // Display order of modifiers in formatted chords.
    constexpr auto ModifierOrder = std::array {
        std::pair { Modifier::Ctrl, std::string_view { "Ctrl" } },
        std::pair { Modifier::Alt, std::string_view { "Alt" } },
        std::pair { Modifier::Shift, std::string_view { "Shift" } },
        std::pair { Modifier::Super, std::string_view { "Super" } },
    };
} // namespace

auto parseKeyName(std::string_view name) -> Result<KeyCode>
{
    auto const trimmed = trim(name);
    if (trimmed.empty())
        return makeError(ErrorCode::InvalidArgument, "Hotkey key is empty");

    if (trimmed.size() == 1)
    {
        auto const c = static_cast<unsigned char>(trimmed[0]);
        if (c > 32 && c < 127)
            return keyCodeFromCodepoint(static_cast<char32_t>(c));
    }

    auto const lower = toLower(trimmed);
    for (auto const& [keyText, code]: NamedKeys)
        if (lower == keyText)
            return code;

    if (lower.size() >= 2 && lower[0] == 'f')
    {
        auto number = 0;
        auto const* const begin = lower.data() + 1;
        auto const* const end = lower.data() + lower.size();
        if (auto [ptr, ec] = std::from_chars(begin, end, number);
            ec == std::errc {} && ptr == end && number >= 1 && number <= 12)
            return static_cast<KeyCode>(static_cast<std::uint32_t>(KeyCode::F1) + static_cast<std::uint32_t>(number - 1));
    }

    return makeError(ErrorCode::InvalidArgument, std::format("Unknown hotkey key '{}'", trimmed));
}

auto parseModifierName(std::string_view name) -> Result<Modifier>
{
    auto const lower = toLower(trim(name));
    if (lower == "ctrl" || lower == "control")
        return Modifier::Ctrl;
    if (lower == "shift")
        return Modifier::Shift;
    if (lower == "alt")
        return Modifier::Alt;
    if (lower == "super" || lower == "win" || lower == "meta")
        return Modifier::Super;
    return makeError(ErrorCode::InvalidArgument, std::format("Unknown hotkey modifier '{}'", trim(name)));
}

auto makeChord(const std::vector<std::string>& modifiers, std::string_view key) -> Result<Chord>
{
    auto chord = Chord {};
    for (auto const& name: modifiers)
    {
        auto modifier = parseModifierName(name);
        if (!modifier)
            return std::unexpected(modifier.error());
        chord.modifiers |= *modifier;
    }

    if (chord.modifiers == Modifier::None)
        return makeError(ErrorCode::InvalidArgument, "Hotkey needs at least one modifier");

    auto code = parseKeyName(key);
    if (!code)
        return std::unexpected(code.error());
    if (modifierForKey(*code) != Modifier::None)
        return makeError(ErrorCode::InvalidArgument, "Hotkey key must not be a modifier");

    chord.key = *code;
    return chord;
}

auto parseChord(std::string_view text) -> Result<Chord>
{
    auto parts = std::vector<std::string> {};
    for (auto const part: text | std::views::split('+'))
        parts.emplace_back(part.begin(), part.end());

    if (parts.size() < 2)
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid hotkey '{}'", text));

    auto const key = std::move(parts.back());
    parts.pop_back();
    return makeChord(parts, key);
}

auto keyName(KeyCode key) -> std::string
{
    auto const value = static_cast<std::uint32_t>(key);
    if (key == static_cast<KeyCode>(U' '))
        return "Space";
    if (isPrintable(key) && value < 127)
        return std::string(1, static_cast<char>(std::toupper(static_cast<int>(value))));
    if (value >= static_cast<std::uint32_t>(KeyCode::F1) && value <= static_cast<std::uint32_t>(KeyCode::F12))
        return std::format("F{}", value - static_cast<std::uint32_t>(KeyCode::F1) + 1);

    switch (key)
    {
        case KeyCode::Enter: return "Enter";
        case KeyCode::Tab: return "Tab";
        case KeyCode::Backspace: return "Backspace";
        case KeyCode::Escape: return "Escape";
        default: break;
    }
    return std::format("U+{:04X}", value);
}

auto formatChord(const Chord& chord) -> std::string
{
    auto result = std::string {};
    for (auto const& [flag, label]: ModifierOrder)
    {
        if (hasModifier(chord.modifiers, flag))
        {
            result += label;
            result += '+';
        }
    }
    result += keyName(chord.key);
    return result;
}

auto isChordPress(const Chord& chord, const KeyEvent& event) -> bool
{
    if (event.type == KeyEventType::Release)
        return false;
    return event.key == chord.key && (event.modifiers & chord.modifiers) == chord.modifiers;
}

} // namespace dictum
