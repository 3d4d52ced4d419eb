// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>

namespace dictum
{

/// @brief Key codes for keyboard events.
///
/// Printable characters use their Unicode codepoint directly (cast to KeyCode), letters
/// always in lowercase. Non-printable keys use values in the 0x10000+ range.
enum class KeyCode : std::uint32_t
{
    Enter = 0x10000,
    Tab,
    Backspace,
    Escape,
    F1,
    F2,
    F3,
    F4,
    F5,
    F6,
    F7,
    F8,
    F9,
    F10,
    F11,
    F12,

    // Modifier keys themselves, reported when every key is sent as an escape code.
    LeftShift,
    LeftCtrl,
    LeftAlt,
    LeftSuper,
    RightShift,
    RightCtrl,
    RightAlt,
    RightSuper,
};

/// @brief Bitmask enumeration for keyboard modifier keys.
enum class Modifier : std::uint8_t
{
    None = 0,
    Shift = 1 << 0,
    Alt = 1 << 1,
    Ctrl = 1 << 2,
    Super = 1 << 3,
};

[[nodiscard]] constexpr auto operator|(Modifier lhs, Modifier rhs) noexcept -> Modifier
{
    return static_cast<Modifier>(static_cast<std::uint8_t>(lhs) | static_cast<std::uint8_t>(rhs));
}

[[nodiscard]] constexpr auto operator&(Modifier lhs, Modifier rhs) noexcept -> Modifier
{
    return static_cast<Modifier>(static_cast<std::uint8_t>(lhs) & static_cast<std::uint8_t>(rhs));
}

constexpr auto operator|=(Modifier& lhs, Modifier rhs) noexcept -> Modifier&
{
    lhs = lhs | rhs;
    return lhs;
}

/// @brief Tests whether a modifier flag is set.
[[nodiscard]] constexpr auto hasModifier(Modifier mods, Modifier flag) noexcept -> bool
{
    return (mods & flag) != Modifier::None;
}

/// @brief Returns the modifier a modifier key produces, or Modifier::None for any other key.
[[nodiscard]] constexpr auto modifierForKey(KeyCode key) noexcept -> Modifier
{
    switch (key)
    {
        case KeyCode::LeftShift:
        case KeyCode::RightShift: return Modifier::Shift;
        case KeyCode::LeftCtrl:
        case KeyCode::RightCtrl: return Modifier::Ctrl;
        case KeyCode::LeftAlt:
        case KeyCode::RightAlt: return Modifier::Alt;
        case KeyCode::LeftSuper:
        case KeyCode::RightSuper: return Modifier::Super;
        default: return Modifier::None;
    }
}

/// @brief Converts a Unicode codepoint to a KeyCode, folding ASCII letters to lowercase.
[[nodiscard]] constexpr auto keyCodeFromCodepoint(char32_t codepoint) noexcept -> KeyCode
{
    if (codepoint >= U'A' && codepoint <= U'Z')
        codepoint += U'a' - U'A';
    return static_cast<KeyCode>(codepoint);
}

/// @brief Checks whether a key code represents a printable Unicode character.
[[nodiscard]] constexpr auto isPrintable(KeyCode key) noexcept -> bool
{
    return static_cast<std::uint32_t>(key) < 0x10000 && static_cast<std::uint32_t>(key) >= 32;
}

/// @brief Physical phase of a key.
enum class KeyEventType : std::uint8_t
{
    Press,
    Repeat,
    Release,
};

/// @brief One key transition from the keyboard feed.
struct KeyEvent
{
    KeyCode key {};
    Modifier modifiers = Modifier::None; ///< Modifiers held while the event happened.
    KeyEventType type = KeyEventType::Press;
};

} // namespace dictum
