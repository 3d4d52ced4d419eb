// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

#include <hotkey/Chord.hpp>
#include <hotkey/HotkeyRegistry.hpp>
#include <hotkey/KeyEvent.hpp>

namespace dictum
{

/// @brief Logical edge of a hotkey gesture.
enum class HotkeySignal : std::uint8_t
{
    Activate,
    Deactivate,
};

[[nodiscard]] constexpr auto hotkeySignalName(HotkeySignal signal) -> std::string_view
{
    switch (signal)
    {
        case HotkeySignal::Activate: return "Activate";
        case HotkeySignal::Deactivate: return "Deactivate";
    }
    return "Unknown";
}

/// @brief Receives logical edges. Called on the keyboard callback path, so it must only enqueue.
using HotkeySink = std::function<void(HotkeySignal signal)>;

/// @brief Turns "hotkey down" notifications plus a key-state feed into Activate/Deactivate edges.
///
/// One press-and-hold gesture yields exactly one Activate and at most one Deactivate. Deactivate
/// fires on whichever comes first: release of the main key or release of any required modifier.
/// A user who lets go of a modifier before the main key therefore ends the gesture early.
///
/// onHotkeyDown() and onKeyEvent() may be called from different threads. registerChord() and
/// unregister() must not race with them.
class HotkeyCorrelator
{
  public:
    explicit HotkeyCorrelator(HotkeySink sink);

    /// @brief Claims the chord through the registry and starts correlating events for it.
    /// @return ErrorCode::Conflict if the chord is owned elsewhere. The correlator then stays inactive.
    [[nodiscard]] auto registerChord(const Chord& chord, HotkeyRegistry& registry) -> VoidResult;

    /// @brief Releases the chord. Pending gestures are dropped without a Deactivate.
    void unregister();

    [[nodiscard]] auto isRegistered() const -> bool { return _registration != nullptr; }

    /// @brief Returns the registered chord, if any.
    [[nodiscard]] auto chord() const -> std::optional<Chord>;

    /// @brief True between Activate and Deactivate.
    [[nodiscard]] auto isArmed() const -> bool { return _armed.load(); }

    /// @brief Registration-level notification that the chord went down (possibly an OS auto-repeat).
    void onHotkeyDown();

    /// @brief Low-level key feed used to find the release edge.
    void onKeyEvent(const KeyEvent& event);

    /// @brief Feeds a single combined keyboard stream: chord presses go to onHotkeyDown(), the rest to onKeyEvent().
    void feed(const KeyEvent& event);

  private:
    HotkeySink _sink;
    std::unique_ptr<HotkeyRegistration> _registration;
    std::atomic<bool> _armed { false };
};

} // namespace dictum
