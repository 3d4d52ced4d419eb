// SPDX-License-Identifier: Apache-2.0
#include "ClipboardSink.hpp"

#include <core/Log.hpp>

#include <cstdlib>
#include <format>

namespace dictum
{

namespace
{
    constexpr auto ClipboardTimeout = std::chrono::milliseconds { 2000 };
}

CommandClipboard::CommandClipboard(std::vector<std::string> command, ProcessRunner& runner):
    _command(std::move(command)), _runner(runner)
{
}

auto CommandClipboard::detectCommand() -> std::vector<std::string>
{
    if (auto const* wayland = std::getenv("WAYLAND_DISPLAY"); wayland && *wayland)
        return { "wl-copy" };
    return { "xclip", "-selection", "clipboard" };
}

auto CommandClipboard::write(std::string_view text) -> VoidResult
{
    if (_command.empty())
        return makeError(ErrorCode::ClipboardLocked, "No clipboard command configured");

    auto spec = ProcessSpec {
        .command = _command.front(),
        .args = { _command.begin() + 1, _command.end() },
        .stdinData = std::string(text),
        .killDescendantsOnExit = false,
    };

    auto output = _runner.run(spec, ClipboardTimeout);
    if (!output)
        return makeError(ErrorCode::ClipboardLocked, std::format("Clipboard unavailable: {}", output.error().message));

    if (output->exitCode != 0)
        return makeProcessError(ErrorCode::ClipboardLocked,
                                std::format("{} exited with code {}", _command.front(), output->exitCode),
                                output->exitCode,
                                std::move(output->stderrText));

    log::debug("Clipboard written via {} ({} chars)", _command.front(), text.size());
    return {};
}

} // namespace dictum
