// SPDX-License-Identifier: Apache-2.0
#include <libunicode/convert.h>
#include <libunicode/width.h>

#include <algorithm>

#include <tui/TextEditBuffer.hpp>

namespace modelmatch::tui
{

void TextEditBuffer::insert(char32_t ch)
{
    _text.insert(_cursor, 1, ch);
    ++_cursor;
}

void TextEditBuffer::insert(std::string_view utf8)
{
    auto const decoded = unicode::convert_to<char32_t>(utf8);
    _text.insert(_cursor, decoded);
    _cursor += decoded.size();
}

void TextEditBuffer::append(char32_t ch)
{
    _text.push_back(ch);
    _cursor = _text.size();
}

void TextEditBuffer::append(std::string_view utf8)
{
    _text += unicode::convert_to<char32_t>(utf8);
    _cursor = _text.size();
}

void TextEditBuffer::deleteChar()
{
    if (_cursor < _text.size())
        _text.erase(_cursor, 1);
}

void TextEditBuffer::backspace()
{
    if (_cursor == 0)
        return;
    --_cursor;
    _text.erase(_cursor, 1);
}

void TextEditBuffer::left()
{
    if (_cursor > 0)
        --_cursor;
}

void TextEditBuffer::right()
{
    if (_cursor < _text.size())
        ++_cursor;
}

void TextEditBuffer::home()
{
    _cursor = 0;
}

void TextEditBuffer::end()
{
    _cursor = _text.size();
}

void TextEditBuffer::setText(std::string_view utf8)
{
    _text = unicode::convert_to<char32_t>(utf8);
    _cursor = _text.size();
}

void TextEditBuffer::setCursor(std::size_t position)
{
    _cursor = std::min(position, _text.size());
}

void TextEditBuffer::clear()
{
    _text.clear();
    _cursor = 0;
}

auto TextEditBuffer::processEvent(InputEvent const& event) -> TextEditAction
{
    if (auto const* key = std::get_if<KeyEvent>(&event))
        return handleKey(*key);

    if (auto const* paste = std::get_if<PasteEvent>(&event))
    {
        // A single-line field keeps pasted line breaks as spaces.
        auto text = paste->text;
        std::ranges::replace(text, '\n', ' ');
        std::erase(text, '\r');
        insert(text);
        return TextEditAction::Changed;
    }

    return TextEditAction::None;
}

auto TextEditBuffer::text() const -> std::string
{
    return unicode::convert_to<char>(std::u32string_view(_text));
}

auto TextEditBuffer::cursorColumn() const -> int
{
    auto columns = 0;
    for (auto const ch: std::u32string_view(_text).substr(0, _cursor))
        columns += std::max(0, static_cast<int>(unicode::width(ch)));
    return columns;
}

auto TextEditBuffer::handleKey(KeyEvent const& key) -> TextEditAction
{
    if (key.modifiers == Modifier::Ctrl)
    {
        switch (key.codepoint)
        {
            case U'a': home(); return TextEditAction::Changed;
            case U'e': end(); return TextEditAction::Changed;
            case U'b': left(); return TextEditAction::Changed;
            case U'f': right(); return TextEditAction::Changed;
            case U'd': deleteChar(); return TextEditAction::Changed;
            default: return TextEditAction::None;
        }
    }

    if (key.modifiers != Modifier::None && key.modifiers != Modifier::Shift)
        return TextEditAction::None;

    switch (key.key)
    {
        case KeyCode::Backspace: backspace(); return TextEditAction::Changed;
        case KeyCode::Delete: deleteChar(); return TextEditAction::Changed;
        case KeyCode::Left: left(); return TextEditAction::Changed;
        case KeyCode::Right: right(); return TextEditAction::Changed;
        case KeyCode::Home: home(); return TextEditAction::Changed;
        case KeyCode::End: end(); return TextEditAction::Changed;
        default: break;
    }

    if (isPrintable(key.key))
    {
        insert(codepointFromKeyCode(key.key));
        return TextEditAction::Changed;
    }

    return TextEditAction::None;
}

} // namespace modelmatch::tui
