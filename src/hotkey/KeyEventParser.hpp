// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <hotkey/KeyEvent.hpp>

namespace dictum
{

/// @brief Feed-based incremental parser for terminal keyboard input.
///
/// Understands the kitty keyboard protocol with event types
/// (CSI code[:alternates] ; modifiers[:event] [; text] u, plus the P/Q/S and ~ forms of
/// function keys), so press, repeat and release arrive as separate events. Plain bytes
/// from terminals without the protocol are reported as presses.
class KeyEventParser
{
  public:
    /// @brief Feeds raw bytes and produces zero or more key events.
    [[nodiscard]] auto feed(std::string_view data) -> std::vector<KeyEvent>;

    /// @brief Call after a short idle period. Resolves a pending bare ESC into an Escape press.
    [[nodiscard]] auto timeout() -> std::vector<KeyEvent>;

  private:
    enum class State : std::uint8_t
    {
        Ground,
        Escape,
        CsiParam,
        Ss3,
        Utf8Sequence,
    };

    State _state = State::Ground;
    std::string _paramBuf;
    std::string _utf8Buf;
    int _utf8Remaining = 0;

    void processGround(std::uint8_t byte, std::vector<KeyEvent>& events);
    void processEscape(std::uint8_t byte, std::vector<KeyEvent>& events);
    void processCsi(std::uint8_t byte, std::vector<KeyEvent>& events);
    void processSs3(std::uint8_t byte, std::vector<KeyEvent>& events);
    void processUtf8(std::uint8_t byte, std::vector<KeyEvent>& events);
    void dispatchCsi(char finalByte, std::vector<KeyEvent>& events);
};

} // namespace dictum
