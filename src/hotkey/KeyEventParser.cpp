// SPDX-License-Identifier: Apache-2.0
#include <charconv>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string_view>
#include <vector>

#include <hotkey/KeyEventParser.hpp>

namespace dictum
{

namespace
{
    /// @brief Parses "a:b;c:d" into {{a, b}, {c, d}}. Empty sub-fields become 0.
    auto parseCsiFields(std::string_view buf) -> std::vector<std::vector<int>>
    {
        auto result = std::vector<std::vector<int>> {};
        for (auto const field: buf | std::views::split(';'))
        {
            auto& values = result.emplace_back();
            for (auto const part: std::string_view(field.begin(), field.end()) | std::views::split(':'))
            {
                auto const sv = std::string_view(part.begin(), part.end());
                auto value = 0;
                if (auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value); ec != std::errc {})
                    value = 0;
                values.push_back(value);
            }
        }
        return result;
    }

    auto fieldValue(std::vector<std::vector<int>> const& fields, std::size_t field, std::size_t sub, int fallback)
        -> int
    {
        if (field >= fields.size() || sub >= fields[field].size() || fields[field][sub] == 0)
            return fallback;
        return fields[field][sub];
    }

    /// @brief Decodes the CSI modifier parameter: encoded = 1 + shift + 2*alt + 4*ctrl + 8*super.
    /// Hyper, meta, caps lock and num lock bits are ignored.
    constexpr auto decodeModifiers(int param) -> Modifier
    {
        if (param <= 1)
            return Modifier::None;
        return static_cast<Modifier>((param - 1) & 0x0F);
    }

    constexpr auto decodeEventType(int param) -> KeyEventType
    {
        switch (param)
        {
            case 2: return KeyEventType::Repeat;
            case 3: return KeyEventType::Release;
            default: return KeyEventType::Press;
        }
    }

    /// @brief Maps a kitty key number (the first CSI u field) to a KeyCode.
    auto mapKittyKey(int code) -> std::optional<KeyCode>
    {
        switch (code)
        {
            case 9: return KeyCode::Tab;
            case 13: return KeyCode::Enter;
            case 27: return KeyCode::Escape;
            case 8:
            case 127: return KeyCode::Backspace;
            case 57441: return KeyCode::LeftShift;
            case 57442: return KeyCode::LeftCtrl;
            case 57443: return KeyCode::LeftAlt;
            case 57444: return KeyCode::LeftSuper;
            case 57447: return KeyCode::RightShift;
            case 57448: return KeyCode::RightCtrl;
            case 57449: return KeyCode::RightAlt;
            case 57450: return KeyCode::RightSuper;
            default: break;
        }

        // Remaining functional keys live in the Unicode private use area.
        if (code >= 57344 && code <= 63743)
            return std::nullopt;
        if (code >= 32 && code <= 0x10FFFF)
            return keyCodeFromCodepoint(static_cast<char32_t>(code));
        return std::nullopt;
    }

    auto mapTildeKey(int code) -> std::optional<KeyCode>
    {
        switch (code)
        {
            case 11: return KeyCode::F1;
            case 12: return KeyCode::F2;
            case 13: return KeyCode::F3;
            case 14: return KeyCode::F4;
            case 15: return KeyCode::F5;
            case 17: return KeyCode::F6;
            case 18: return KeyCode::F7;
            case 19: return KeyCode::F8;
            case 20: return KeyCode::F9;
            case 21: return KeyCode::F10;
            case 23: return KeyCode::F11;
            case 24: return KeyCode::F12;
            default: return std::nullopt;
        }
    }

    void emitPress(char32_t cp, Modifier modifiers, std::vector<KeyEvent>& events)
    {
        if (cp >= U'A' && cp <= U'Z')
            modifiers |= Modifier::Shift;
        events.push_back(KeyEvent { .key = keyCodeFromCodepoint(cp), .modifiers = modifiers });
    }
} // namespace

auto KeyEventParser::feed(std::string_view data) -> std::vector<KeyEvent>
{
    auto events = std::vector<KeyEvent> {};
    for (auto const ch: data)
    {
        auto const byte = static_cast<std::uint8_t>(ch);
        switch (_state)
        {
            case State::Ground: processGround(byte, events); break;
            case State::Escape: processEscape(byte, events); break;
            case State::CsiParam: processCsi(byte, events); break;
            case State::Ss3: processSs3(byte, events); break;
            case State::Utf8Sequence: processUtf8(byte, events); break;
        }
    }
    return events;
}

auto KeyEventParser::timeout() -> std::vector<KeyEvent>
{
    auto events = std::vector<KeyEvent> {};
    if (_state == State::Escape)
    {
        events.push_back(KeyEvent { .key = KeyCode::Escape });
        _state = State::Ground;
    }
    return events;
}

void KeyEventParser::processGround(std::uint8_t byte, std::vector<KeyEvent>& events)
{
    if (byte == 0x1B)
    {
        _state = State::Escape;
        return;
    }

    if (byte < 0x20)
    {
        switch (byte)
        {
            case '\r':
            case '\n': events.push_back(KeyEvent { .key = KeyCode::Enter }); break;
            case '\t': events.push_back(KeyEvent { .key = KeyCode::Tab }); break;
            case 0x08: events.push_back(KeyEvent { .key = KeyCode::Backspace }); break;
            default:
                // Ctrl+letter: byte = letter - 'a' + 1
                events.push_back(KeyEvent { .key = keyCodeFromCodepoint(static_cast<char32_t>(byte + 'a' - 1)),
                                            .modifiers = Modifier::Ctrl });
                break;
        }
        return;
    }

    if (byte == 0x7F)
    {
        events.push_back(KeyEvent { .key = KeyCode::Backspace });
        return;
    }

    if ((byte & 0x80) != 0)
    {
        _utf8Buf.assign(1, static_cast<char>(byte));
        if ((byte & 0xE0) == 0xC0)
            _utf8Remaining = 1;
        else if ((byte & 0xF0) == 0xE0)
            _utf8Remaining = 2;
        else if ((byte & 0xF8) == 0xF0)
            _utf8Remaining = 3;
        else
            return;
        _state = State::Utf8Sequence;
        return;
    }

    emitPress(static_cast<char32_t>(byte), Modifier::None, events);
}

void KeyEventParser::processEscape(std::uint8_t byte, std::vector<KeyEvent>& events)
{
    if (byte == '[')
    {
        _paramBuf.clear();
        _state = State::CsiParam;
        return;
    }

    if (byte == 'O')
    {
        _state = State::Ss3;
        return;
    }

    if (byte >= 0x20 && byte < 0x7F)
    {
        emitPress(static_cast<char32_t>(byte), Modifier::Alt, events);
        _state = State::Ground;
        return;
    }

    // ESC ESC or ESC + control: emit ESC then reprocess
    events.push_back(KeyEvent { .key = KeyCode::Escape });
    _state = State::Ground;
    processGround(byte, events);
}

void KeyEventParser::processCsi(std::uint8_t byte, std::vector<KeyEvent>& events)
{
    if ((byte >= '0' && byte <= '?') || (byte >= 0x20 && byte <= 0x2F))
    {
        _paramBuf += static_cast<char>(byte);
        return;
    }

    if (byte >= 0x40 && byte <= 0x7E)
    {
        _state = State::Ground;
        dispatchCsi(static_cast<char>(byte), events);
        return;
    }

    // Unexpected byte, abort sequence
    _state = State::Ground;
}

void KeyEventParser::processSs3(std::uint8_t byte, std::vector<KeyEvent>& events)
{
    _state = State::Ground;
    switch (static_cast<char>(byte))
    {
        case 'P': events.push_back(KeyEvent { .key = KeyCode::F1 }); break;
        case 'Q': events.push_back(KeyEvent { .key = KeyCode::F2 }); break;
        case 'R': events.push_back(KeyEvent { .key = KeyCode::F3 }); break;
        case 'S': events.push_back(KeyEvent { .key = KeyCode::F4 }); break;
        default: break;
    }
}

void KeyEventParser::processUtf8(std::uint8_t byte, std::vector<KeyEvent>& events)
{
    if ((byte & 0xC0) != 0x80)
    {
        _utf8Buf.clear();
        _state = State::Ground;
        processGround(byte, events);
        return;
    }

    _utf8Buf += static_cast<char>(byte);
    if (--_utf8Remaining > 0)
        return;

    auto const* const bytes = reinterpret_cast<std::uint8_t const*>(_utf8Buf.data());
    auto cp = char32_t { 0 };
    switch (_utf8Buf.size())
    {
        case 2: cp = ((bytes[0] & 0x1F) << 6) | (bytes[1] & 0x3F); break;
        case 3: cp = ((bytes[0] & 0x0F) << 12) | ((bytes[1] & 0x3F) << 6) | (bytes[2] & 0x3F); break;
        case 4:
            cp = ((bytes[0] & 0x07) << 18) | ((bytes[1] & 0x3F) << 12) | ((bytes[2] & 0x3F) << 6)
                 | (bytes[3] & 0x3F);
            break;
        default: break;
    }
    if (cp != 0)
        events.push_back(KeyEvent { .key = keyCodeFromCodepoint(cp) });

    _utf8Buf.clear();
    _state = State::Ground;
}

void KeyEventParser::dispatchCsi(char finalByte, std::vector<KeyEvent>& events)
{
    // Replies to protocol queries and other private sequences carry a marker byte first.
    if (!_paramBuf.empty() && (_paramBuf[0] == '?' || _paramBuf[0] == '>' || _paramBuf[0] == '<' || _paramBuf[0] == '='))
        return;

    auto const fields = parseCsiFields(_paramBuf);
    auto const modifiers = decodeModifiers(fieldValue(fields, 1, 0, 1));
    auto const type = decodeEventType(fieldValue(fields, 1, 1, 1));

    auto key = std::optional<KeyCode> {};
    switch (finalByte)
    {
        case 'u': key = mapKittyKey(fieldValue(fields, 0, 0, 0)); break;
        case '~': key = mapTildeKey(fieldValue(fields, 0, 0, 0)); break;
        case 'P': key = KeyCode::F1; break;
        case 'Q': key = KeyCode::F2; break;
        case 'R': key = KeyCode::F3; break;
        case 'S': key = KeyCode::F4; break;
        default: break; // cursor keys and friends are not chord candidates
    }

    if (key)
        events.push_back(KeyEvent { .key = *key, .modifiers = modifiers, .type = type });
}

} // namespace dictum
