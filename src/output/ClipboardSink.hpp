// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <process/ProcessRunner.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace dictum
{

/// @brief Abstract interface for the clipboard output.
class ClipboardSink
{
  public:
    virtual ~ClipboardSink() = default;

    /// @brief Replaces the clipboard contents. One attempt, no retry.
    /// @return ErrorCode::ClipboardLocked if the clipboard could not be written.
    [[nodiscard]] virtual auto write(std::string_view text) -> VoidResult = 0;
};

/// @brief Writes the clipboard by piping the text into a clipboard tool (wl-copy, xclip, ...).
class CommandClipboard: public ClipboardSink
{
  public:
    /// @param command Program and arguments; the text is passed on stdin.
    CommandClipboard(std::vector<std::string> command, ProcessRunner& runner);

    [[nodiscard]] auto write(std::string_view text) -> VoidResult override;

    /// @brief Picks wl-copy under Wayland and xclip otherwise.
    [[nodiscard]] static auto detectCommand() -> std::vector<std::string>;

  private:
    std::vector<std::string> _command;
    ProcessRunner& _runner;
};

} // namespace dictum
