// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <string_view>

#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <hotkey/TerminalKeySource.hpp>

namespace dictum
{

namespace
{
    // Kitty keyboard protocol flags (CSI > flags u):
    //   1 = Disambiguate escape codes
    //   2 = Report event types (press, repeat, release)
    //   8 = Report all keys as escape codes
    constexpr auto PushKeyboardFlags = std::string_view { "\033[>11u" };
    constexpr auto PopKeyboardFlags = std::string_view { "\033[<u" };

    void writeSequence(std::string_view sequence)
    {
        if (::write(STDOUT_FILENO, sequence.data(), sequence.size()) < 0)
            log::debug("Cannot write terminal sequence: {}", std::strerror(errno));
    }
} // namespace

TerminalKeySource::~TerminalKeySource()
{
    shutdown();
}

auto TerminalKeySource::initialize() -> VoidResult
{
    if (!::isatty(_fd))
        return makeError(ErrorCode::IoError, "Standard input is not a terminal");

    if (::tcgetattr(_fd, &_origTermios) != 0)
        return makeError(ErrorCode::IoError, std::format("tcgetattr failed: {}", std::strerror(errno)));

    auto raw = _origTermios;
    raw.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO | ISIG);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (::tcsetattr(_fd, TCSAFLUSH, &raw) != 0)
        return makeError(ErrorCode::IoError, std::format("tcsetattr failed: {}", std::strerror(errno)));

    _rawMode = true;
    writeSequence(PushKeyboardFlags);
    return {};
}

void TerminalKeySource::shutdown()
{
    if (!_rawMode)
        return;

    writeSequence(PopKeyboardFlags);
    ::tcsetattr(_fd, TCSAFLUSH, &_origTermios);
    _rawMode = false;
}

auto TerminalKeySource::poll(int timeoutMs) -> std::vector<KeyEvent>
{
    if (_closed)
        return {};

    auto pfd = pollfd { .fd = _fd, .events = POLLIN, .revents = 0 };
    auto const pollResult = ::poll(&pfd, 1, timeoutMs);

    if (pollResult == 0)
        return _parser.timeout();
    if (pollResult < 0)
    {
        if (errno != EINTR)
        {
            log::error("Keyboard input poll failed: {}", std::strerror(errno));
            _closed = true;
        }
        return {};
    }

    // POLLHUP may arrive together with POLLIN while buffered bytes remain; read until EOF.
    if ((pfd.revents & POLLIN) == 0)
    {
        if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL))
        {
            log::info("Keyboard input closed");
            _closed = true;
        }
        return {};
    }

    auto buf = std::array<char, 512> {};
    auto const n = ::read(_fd, buf.data(), buf.size());
    if (n == 0)
    {
        log::info("Keyboard input reached end of file");
        _closed = true;
        return _parser.timeout();
    }
    if (n < 0)
    {
        if (errno != EINTR && errno != EAGAIN)
        {
            log::error("Keyboard input read failed: {}", std::strerror(errno));
            _closed = true;
        }
        return {};
    }

    return _parser.feed(std::string_view(buf.data(), static_cast<std::size_t>(n)));
}

} // namespace dictum
