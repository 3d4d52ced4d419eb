// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string_view>
#include <vector>

namespace dictum
{

/// @brief Cause of a state transition.
enum class Trigger : std::uint8_t
{
    Activate,
    Deactivate,
    CaptureError,
    RefinementStarted,
    Completed,
    Failed,
};

/// @brief Converts a Trigger to its string representation.
[[nodiscard]] constexpr auto triggerName(Trigger trigger) -> std::string_view
{
    switch (trigger)
    {
        case Trigger::Activate: return "Activate";
        case Trigger::Deactivate: return "Deactivate";
        case Trigger::CaptureError: return "CaptureError";
        case Trigger::RefinementStarted: return "RefinementStarted";
        case Trigger::Completed: return "Completed";
        case Trigger::Failed: return "Failed";
    }
    return "Unknown";
}

/// @brief Record of one accepted state change.
struct Transition
{
    SessionState from = SessionState::Idle;
    SessionState to = SessionState::Idle;
    std::chrono::system_clock::time_point timestamp {};
    Trigger trigger = Trigger::Activate;
};

/// @brief Callback invoked synchronously for every accepted transition.
using TransitionCallback = std::function<void(const Transition& transition)>;

/// @brief The single source of truth for the dictation session phase.
///
/// Accepted transitions:
///   Idle           -> Recording
///   Recording      -> Processing | Idle
///   Processing     -> PostProcessing | Idle
///   PostProcessing -> Idle
///
/// Everything else is rejected with ErrorCode::InvalidTransition and leaves the state unchanged.
/// Transitions are serialized by one mutex; current() is lock-free.
class SessionStateMachine
{
  public:
    /// @brief Number of transitions retained by history().
    static constexpr std::size_t MaxHistory = 64;

    SessionStateMachine() = default;

    SessionStateMachine(const SessionStateMachine&) = delete;
    SessionStateMachine& operator=(const SessionStateMachine&) = delete;

    /// @brief Returns the current state.
    [[nodiscard]] auto current() const -> SessionState;

    /// @brief Moves to a new state if the transition table allows it.
    ///
    /// Subscribers are notified before this returns, while the lock is held; they must not
    /// call transition(), subscribe() or unsubscribe() from the callback.
    /// @param to The target state.
    /// @param trigger What caused the change (recorded, not validated).
    /// @return The new state, or ErrorCode::InvalidTransition.
    [[nodiscard]] auto transition(SessionState to, Trigger trigger) -> Result<SessionState>;

    /// @brief Returns true if the table contains from -> to.
    [[nodiscard]] static constexpr auto isValidTransition(SessionState from, SessionState to) -> bool
    {
        switch (from)
        {
            case SessionState::Idle: return to == SessionState::Recording;
            case SessionState::Recording: return to == SessionState::Processing || to == SessionState::Idle;
            case SessionState::Processing: return to == SessionState::PostProcessing || to == SessionState::Idle;
            case SessionState::PostProcessing: return to == SessionState::Idle;
        }
        return false;
    }

    /// @brief Registers a transition observer.
    /// @return An id for unsubscribe().
    auto subscribe(TransitionCallback callback) -> std::size_t;

    /// @brief Removes a transition observer.
    void unsubscribe(std::size_t id);

    /// @brief Returns the most recent transitions, oldest first.
    [[nodiscard]] auto history() const -> std::vector<Transition>;

  private:
    mutable std::mutex _mutex;
    std::atomic<SessionState> _state { SessionState::Idle };
    std::map<std::size_t, TransitionCallback> _subscribers;
    std::size_t _nextSubscriberId = 1;
    std::deque<Transition> _history;
};

} // namespace dictum
