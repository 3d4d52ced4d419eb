// SPDX-License-Identifier: Apache-2.0
#include "SessionStateMachine.hpp"

#include <core/Log.hpp>

#include <format>

namespace dictum
{

auto SessionStateMachine::current() const -> SessionState
{
    return _state.load(std::memory_order_acquire);
}

auto SessionStateMachine::transition(SessionState to, Trigger trigger) -> Result<SessionState>
{
    auto lock = std::lock_guard(_mutex);

    auto const from = _state.load(std::memory_order_relaxed);
    if (!isValidTransition(from, to))
    {
        log::error("INVALID STATE TRANSITION {} -> {} (trigger {}); state stays {}",
                   sessionStateName(from),
                   sessionStateName(to),
                   triggerName(trigger),
                   sessionStateName(from));
        return makeError(ErrorCode::InvalidTransition,
                         std::format("Invalid transition {} -> {} on {}",
                                     sessionStateName(from),
                                     sessionStateName(to),
                                     triggerName(trigger)));
    }

    auto const record = Transition {
        .from = from,
        .to = to,
        .timestamp = std::chrono::system_clock::now(),
        .trigger = trigger,
    };

    _state.store(to, std::memory_order_release);
    _history.push_back(record);
    if (_history.size() > MaxHistory)
        _history.pop_front();

    log::info("State transition {} -> {} ({})", sessionStateName(from), sessionStateName(to), triggerName(trigger));

    for (const auto& [id, callback]: _subscribers)
        callback(record);

    return to;
}

auto SessionStateMachine::subscribe(TransitionCallback callback) -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    auto const id = _nextSubscriberId++;
    _subscribers.emplace(id, std::move(callback));
    return id;
}

void SessionStateMachine::unsubscribe(std::size_t id)
{
    auto lock = std::lock_guard(_mutex);
    _subscribers.erase(id);
}

auto SessionStateMachine::history() const -> std::vector<Transition>
{
    auto lock = std::lock_guard(_mutex);
    return { _history.begin(), _history.end() };
}

} // namespace dictum
