// SPDX-License-Identifier: Apache-2.0
#include <libunicode/convert.h>

#include <charconv>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string_view>
#include <vector>

#include <tui/VtParser.hpp>

namespace modelmatch::tui
{

namespace
{
    constexpr auto Esc = std::uint8_t { 0x1B };
    constexpr auto PasteStart = std::string_view { "200" };
    constexpr auto PasteEnd = std::string_view { "\033[201~" };

    auto parseCsiParams(std::string_view buf) -> std::vector<int>
    {
        auto result = std::vector<int> {};
        for (auto const part: buf | std::views::split(';'))
        {
            auto const sv = std::string_view(part.begin(), part.end());
            auto value = 0;
            auto const [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
            result.push_back(ec == std::errc {} ? value : 0);
        }
        return result;
    }

    auto keyEvent(KeyCode key, Modifier modifiers = Modifier::None) -> KeyEvent
    {
        return KeyEvent { .key = key, .modifiers = modifiers };
    }

    auto textEvent(char32_t cp, Modifier modifiers = Modifier::None) -> KeyEvent
    {
        return KeyEvent { .key = keyCodeFromCodepoint(cp), .modifiers = modifiers, .codepoint = cp };
    }

    /// Maps the numeric parameter of a `CSI n ~` sequence.
    constexpr auto tildeKey(int code) -> std::optional<KeyCode>
    {
        switch (code)
        {
            case 1:
            case 7: return KeyCode::Home;
            case 2: return KeyCode::Insert;
            case 3: return KeyCode::Delete;
            case 4:
            case 8: return KeyCode::End;
            case 5: return KeyCode::PageUp;
            case 6: return KeyCode::PageDown;
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

    /// Maps final bytes shared by CSI and SS3 cursor/function key sequences.
    constexpr auto letterKey(char finalByte) -> std::optional<KeyCode>
    {
        switch (finalByte)
        {
            case 'A': return KeyCode::Up;
            case 'B': return KeyCode::Down;
            case 'C': return KeyCode::Right;
            case 'D': return KeyCode::Left;
            case 'H': return KeyCode::Home;
            case 'F': return KeyCode::End;
            case 'P': return KeyCode::F1;
            case 'Q': return KeyCode::F2;
            case 'R': return KeyCode::F3;
            case 'S': return KeyCode::F4;
            default: return std::nullopt;
        }
    }
} // namespace

auto VtParser::feed(std::string_view data) -> std::vector<InputEvent>
{
    auto events = std::vector<InputEvent> {};
    for (auto const ch: data)
    {
        auto const byte = static_cast<std::uint8_t>(ch);
        switch (_state)
        {
            case State::Ground: processGround(byte, events); break;
            case State::Escape: processEscape(byte, events); break;
            case State::Csi: processCsi(byte, events); break;
            case State::Ss3: processSs3(byte, events); break;
            case State::PasteBody: processPaste(byte, events); break;
            case State::Utf8Sequence: processUtf8(byte, events); break;
        }
    }
    return events;
}

auto VtParser::timeout() -> std::vector<InputEvent>
{
    auto events = std::vector<InputEvent> {};
    if (_state == State::Escape)
    {
        events.emplace_back(keyEvent(KeyCode::Escape));
        _state = State::Ground;
    }
    return events;
}

void VtParser::processGround(std::uint8_t byte, std::vector<InputEvent>& events)
{
    if (byte == Esc)
    {
        _state = State::Escape;
        return;
    }

    switch (byte)
    {
        case '\r':
        case '\n': events.emplace_back(keyEvent(KeyCode::Enter)); return;
        case '\t': events.emplace_back(keyEvent(KeyCode::Tab)); return;
        case 0x08:
        case 0x7F: events.emplace_back(keyEvent(KeyCode::Backspace)); return;
        default: break;
    }

    if (byte == 0)
    {
        events.emplace_back(textEvent(U' ', Modifier::Ctrl));
        return;
    }

    if (byte < 0x20)
    {
        // Ctrl+letter arrives as letter - 'a' + 1
        events.emplace_back(textEvent(static_cast<char32_t>(byte + 'a' - 1), Modifier::Ctrl));
        return;
    }

    if ((byte & 0x80) != 0)
    {
        if ((byte & 0xE0) == 0xC0)
            _utf8Remaining = 1;
        else if ((byte & 0xF0) == 0xE0)
            _utf8Remaining = 2;
        else if ((byte & 0xF8) == 0xF0)
            _utf8Remaining = 3;
        else
            return; // stray continuation or invalid lead byte

        _utf8Buf.assign(1, static_cast<char>(byte));
        _state = State::Utf8Sequence;
        return;
    }

    events.emplace_back(textEvent(static_cast<char32_t>(byte)));
}

void VtParser::processEscape(std::uint8_t byte, std::vector<InputEvent>& events)
{
    switch (byte)
    {
        case '[':
            _paramBuf.clear();
            _state = State::Csi;
            return;
        case 'O': _state = State::Ss3; return;
        case '\r':
        case '\n':
            events.emplace_back(keyEvent(KeyCode::Enter, Modifier::Alt));
            _state = State::Ground;
            return;
        case 0x7F:
            events.emplace_back(keyEvent(KeyCode::Backspace, Modifier::Alt));
            _state = State::Ground;
            return;
        default: break;
    }

    if (byte >= 0x20 && byte < 0x7F)
    {
        events.emplace_back(textEvent(static_cast<char32_t>(byte), Modifier::Alt));
        _state = State::Ground;
        return;
    }

    // ESC followed by ESC or another control byte: the first ESC stood alone.
    events.emplace_back(keyEvent(KeyCode::Escape));
    _state = State::Ground;
    processGround(byte, events);
}

void VtParser::processCsi(std::uint8_t byte, std::vector<InputEvent>& events)
{
    if ((byte >= 0x30 && byte <= 0x3F) || (byte >= 0x20 && byte <= 0x2F))
    {
        _paramBuf += static_cast<char>(byte);
        return;
    }

    _state = State::Ground;
    if (byte >= 0x40 && byte <= 0x7E)
        dispatchCsi(static_cast<char>(byte), events);
}

void VtParser::processSs3(std::uint8_t byte, std::vector<InputEvent>& events)
{
    _state = State::Ground;
    if (auto const key = letterKey(static_cast<char>(byte)))
        events.emplace_back(keyEvent(*key));
}

void VtParser::processPaste(std::uint8_t byte, std::vector<InputEvent>& events)
{
    _pasteBuf += static_cast<char>(byte);
    if (!_pasteBuf.ends_with(PasteEnd))
        return;

    _pasteBuf.resize(_pasteBuf.size() - PasteEnd.size());
    events.emplace_back(PasteEvent { .text = std::move(_pasteBuf) });
    _pasteBuf.clear();
    _state = State::Ground;
}

void VtParser::processUtf8(std::uint8_t byte, std::vector<InputEvent>& events)
{
    if ((byte & 0xC0) != 0x80)
    {
        // Truncated sequence: drop it and treat the byte as fresh input.
        _utf8Buf.clear();
        _state = State::Ground;
        processGround(byte, events);
        return;
    }

    _utf8Buf += static_cast<char>(byte);
    if (--_utf8Remaining > 0)
        return;

    _state = State::Ground;
    auto const decoded = unicode::convert_to<char32_t>(std::string_view(_utf8Buf));
    for (auto const cp: decoded)
        events.emplace_back(textEvent(cp));
    _utf8Buf.clear();
}

void VtParser::dispatchCsi(char finalByte, std::vector<InputEvent>& events)
{
    if (finalByte == '~' && _paramBuf == PasteStart)
    {
        _pasteBuf.clear();
        _state = State::PasteBody;
        return;
    }

    // Private-marker replies (device attributes and the like) carry no keys.
    if (!_paramBuf.empty() && (_paramBuf.front() == '<' || _paramBuf.front() == '>' || _paramBuf.front() == '?'))
        return;

    auto const params = parseCsiParams(_paramBuf);
    auto const modifiers = params.size() >= 2 ? modifierFromXtermParam(params[1]) : Modifier::None;

    if (finalByte == 'Z')
    {
        events.emplace_back(keyEvent(KeyCode::Tab, modifiers | Modifier::Shift));
        return;
    }

    if (finalByte == '~')
    {
        if (auto const key = tildeKey(params.empty() ? 0 : params.front()))
            events.emplace_back(keyEvent(*key, modifiers));
        return;
    }

    if (auto const key = letterKey(finalByte))
        events.emplace_back(keyEvent(*key, modifiers));
}

} // namespace modelmatch::tui
