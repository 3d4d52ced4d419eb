// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <vector>

#include <termios.h>
#include <unistd.h>

#include <hotkey/KeyEvent.hpp>
#include <hotkey/KeyEventParser.hpp>

namespace dictum
{

/// @brief Reads key press, repeat and release events from the controlling terminal.
///
/// Puts the terminal into raw mode and pushes kitty keyboard protocol flags
/// 1 (disambiguate) | 2 (event types) | 8 (all keys as escape codes), so modifier keys and
/// key releases are reported. Terminals without the protocol only deliver presses.
class TerminalKeySource
{
  public:
    /// @param fd Input descriptor; the controlling terminal's stdin by default.
    explicit TerminalKeySource(int fd = STDIN_FILENO): _fd(fd) {}
    ~TerminalKeySource();

    TerminalKeySource(TerminalKeySource const&) = delete;
    auto operator=(TerminalKeySource const&) -> TerminalKeySource& = delete;
    TerminalKeySource(TerminalKeySource&&) = delete;
    auto operator=(TerminalKeySource&&) -> TerminalKeySource& = delete;

    /// @brief Enables raw mode and the keyboard protocol.
    /// @return ErrorCode::IoError if stdin is not a terminal.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Restores the original terminal state.
    void shutdown();

    /// @brief Waits for key events.
    /// @param timeoutMs -1 = block indefinitely, 0 = non-blocking, >0 = timeout in milliseconds.
    [[nodiscard]] auto poll(int timeoutMs) -> std::vector<KeyEvent>;

    /// @brief True once the input reached end of file, hung up or failed. No more events follow.
    [[nodiscard]] auto closed() const noexcept -> bool { return _closed; }

  private:
    KeyEventParser _parser;
    int _fd;
    struct termios _origTermios {};
    bool _rawMode = false;
    bool _closed = false;
};

} // namespace dictum
