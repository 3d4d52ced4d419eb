// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <hotkey/HotkeyCorrelator.hpp>

namespace dictum
{

HotkeyCorrelator::HotkeyCorrelator(HotkeySink sink): _sink(std::move(sink))
{
}

auto HotkeyCorrelator::registerChord(const Chord& chord, HotkeyRegistry& registry) -> VoidResult
{
    unregister();

    auto registration = registry.claim(chord);
    if (!registration)
    {
        log::warning("Hotkey {} not registered: {}", formatChord(chord), registration.error().message);
        return std::unexpected(registration.error());
    }

    _registration = std::move(*registration);
    return {};
}

void HotkeyCorrelator::unregister()
{
    _armed.store(false);
    _registration.reset();
}

auto HotkeyCorrelator::chord() const -> std::optional<Chord>
{
    if (!_registration)
        return std::nullopt;
    return _registration->chord();
}

void HotkeyCorrelator::onHotkeyDown()
{
    if (!_registration)
        return;

    auto expected = false;
    if (!_armed.compare_exchange_strong(expected, true))
    {
        log::trace("Hotkey repeat filtered");
        return;
    }

    log::debug("Hotkey {} down", formatChord(_registration->chord()));
    _sink(HotkeySignal::Activate);
}

void HotkeyCorrelator::onKeyEvent(const KeyEvent& event)
{
    if (!_registration || event.type != KeyEventType::Release)
        return;

    auto const& chord = _registration->chord();
    auto const releasedModifier = modifierForKey(event.key);
    auto const mainKeyUp = event.key == chord.key;
    auto const modifierUp = releasedModifier != Modifier::None && hasModifier(chord.modifiers, releasedModifier);
    if (!mainKeyUp && !modifierUp)
        return;

    auto expected = true;
    if (!_armed.compare_exchange_strong(expected, false))
        return;

    log::debug("Hotkey {} up ({})", formatChord(chord), mainKeyUp ? "main key" : "modifier");
    _sink(HotkeySignal::Deactivate);
}

void HotkeyCorrelator::feed(const KeyEvent& event)
{
    if (_registration && isChordPress(_registration->chord(), event))
        onHotkeyDown();
    else
        onKeyEvent(event);
}

} // namespace dictum
