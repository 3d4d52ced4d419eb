// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string>
#include <string_view>
#include <vector>

#include <hotkey/KeyEvent.hpp>

namespace dictum
{

/// @brief A hotkey combination of modifier keys plus one primary key.
struct Chord
{
    Modifier modifiers = Modifier::None;
    KeyCode key {};

    [[nodiscard]] auto operator==(const Chord&) const -> bool = default;
};

/// @brief Parses a key name such as "D", "5", "Space", "Enter" or "F9".
/// @return The key code or ErrorCode::InvalidArgument.
[[nodiscard]] auto parseKeyName(std::string_view name) -> Result<KeyCode>;

/// @brief Parses a modifier name: Ctrl (Control), Shift, Alt or Super (Win, Meta).
/// @return The modifier or ErrorCode::InvalidArgument.
[[nodiscard]] auto parseModifierName(std::string_view name) -> Result<Modifier>;

/// @brief Builds a chord from configured modifier names and a key name.
///
/// At least one modifier is required.
[[nodiscard]] auto makeChord(const std::vector<std::string>& modifiers, std::string_view key) -> Result<Chord>;

/// @brief Parses a chord written as "Ctrl+Shift+D".
[[nodiscard]] auto parseChord(std::string_view text) -> Result<Chord>;

/// @brief Formats a chord as "Ctrl+Alt+Shift+Super+Key", listing only the modifiers it has.
[[nodiscard]] auto formatChord(const Chord& chord) -> std::string;

/// @brief Returns the display name of a key, e.g. "D" or "F9".
[[nodiscard]] auto keyName(KeyCode key) -> std::string;

/// @brief Returns true if the event is a press or repeat of the chord's key with all of its modifiers held.
[[nodiscard]] auto isChordPress(const Chord& chord, const KeyEvent& event) -> bool;

} // namespace dictum
