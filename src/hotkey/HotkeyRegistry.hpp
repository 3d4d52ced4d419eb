// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <filesystem>
#include <memory>

#include <hotkey/Chord.hpp>

namespace dictum
{

/// @brief Ownership of a chord in the desktop environment. Releasing the object releases the chord.
class HotkeyRegistration
{
  public:
    virtual ~HotkeyRegistration() = default;

    /// @brief Returns the chord this registration owns.
    [[nodiscard]] virtual auto chord() const -> const Chord& = 0;
};

/// @brief Abstract interface for claiming a system-wide chord.
class HotkeyRegistry
{
  public:
    virtual ~HotkeyRegistry() = default;

    /// @brief Claims a chord for this process.
    /// @return The registration, or ErrorCode::Conflict if another owner holds the chord.
    [[nodiscard]] virtual auto claim(const Chord& chord) -> Result<std::unique_ptr<HotkeyRegistration>> = 0;
};

/// @brief Claims chords with an exclusive flock() on one lock file per chord.
///
/// Two processes (or two claims within one process) asking for the same chord conflict
/// until the first registration is destroyed.
class LockFileRegistry: public HotkeyRegistry
{
  public:
    /// @param directory Directory that holds the lock files, created on demand.
    explicit LockFileRegistry(std::filesystem::path directory);

    [[nodiscard]] auto claim(const Chord& chord) -> Result<std::unique_ptr<HotkeyRegistration>> override;

    /// @brief Returns the lock file path used for a chord, e.g. ".../hotkey-ctrl-shift-d.lock".
    [[nodiscard]] auto lockPath(const Chord& chord) const -> std::filesystem::path;

    /// @brief Returns $XDG_RUNTIME_DIR/dictum, falling back to the temp directory.
    [[nodiscard]] static auto defaultDirectory() -> std::filesystem::path;

  private:
    std::filesystem::path _directory;
};

} // namespace dictum
