// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <hotkey/HotkeyRegistry.hpp>

namespace dictum
{

namespace
{
    class LockFileRegistration: public HotkeyRegistration
    {
      public:
        LockFileRegistration(Chord chord, int fd, std::filesystem::path path):
            _chord(chord), _fd(fd), _path(std::move(path))
        {
        }

        ~LockFileRegistration() override
        {
            ::flock(_fd, LOCK_UN);
            ::close(_fd);
            log::debug("Released hotkey lock {}", _path.string());
        }

        LockFileRegistration(const LockFileRegistration&) = delete;
        LockFileRegistration& operator=(const LockFileRegistration&) = delete;

        [[nodiscard]] auto chord() const -> const Chord& override { return _chord; }

      private:
        Chord _chord;
        int _fd;
        std::filesystem::path _path;
    };
} // namespace

LockFileRegistry::LockFileRegistry(std::filesystem::path directory): _directory(std::move(directory))
{
}

auto LockFileRegistry::lockPath(const Chord& chord) const -> std::filesystem::path
{
    auto name = formatChord(chord);
    std::ranges::transform(name, name.begin(), [](unsigned char c) {
        return c == '+' ? '-' : static_cast<char>(std::tolower(c));
    });
    return _directory / std::format("hotkey-{}.lock", name);
}

auto LockFileRegistry::claim(const Chord& chord) -> Result<std::unique_ptr<HotkeyRegistration>>
{
    auto ec = std::error_code {};
    std::filesystem::create_directories(_directory, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Cannot create lock directory {}: {}", _directory.string(), ec.message()));

    auto const path = lockPath(chord);
    auto const fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0)
        return makeError(ErrorCode::IoError,
                         std::format("Cannot open lock file {}: {}", path.string(), std::strerror(errno)));

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0)
    {
        auto const err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK)
            return makeError(ErrorCode::Conflict,
                             std::format("Hotkey {} is already registered by another owner", formatChord(chord)));
        return makeError(ErrorCode::IoError, std::format("Cannot lock {}: {}", path.string(), std::strerror(err)));
    }

    log::info("Registered hotkey {}", formatChord(chord));
    return std::make_unique<LockFileRegistration>(chord, fd, path);
}

auto LockFileRegistry::defaultDirectory() -> std::filesystem::path
{
    if (auto const* runtimeDir = std::getenv("XDG_RUNTIME_DIR"); runtimeDir && *runtimeDir)
        return std::filesystem::path(runtimeDir) / "dictum";
    return std::filesystem::temp_directory_path() / "dictum";
}

} // namespace dictum
