// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <libunicode/convert.h>

#include <string>
#include <string_view>
#include <variant>

#include <tui/KeyCode.hpp>
#include <tui/Modifier.hpp>

namespace modelmatch::tui
{

/// @brief Keyboard input event.
struct KeyEvent
{
    KeyCode key {};                      ///< Codepoint for printable keys, named key otherwise.
    Modifier modifiers = Modifier::None; ///< Modifier keys held down.
    char32_t codepoint = 0;              ///< Text produced by the key (0 for named keys).
};

/// @brief Terminal resize event.
struct ResizeEvent
{
    int columns;
    int rows;
};

/// @brief Bracketed paste event.
struct PasteEvent
{
    std::string text; ///< Pasted text, UTF-8.
};

/// @brief A single decoded terminal input event.
using InputEvent = std::variant<KeyEvent, ResizeEvent, PasteEvent>;

/// @brief Tests for an unmodified printable key producing @p ch.
[[nodiscard]] constexpr auto isChar(KeyEvent const& event, char32_t ch) noexcept -> bool
{
    return event.modifiers == Modifier::None && event.key == keyCodeFromCodepoint(ch);
}

/// @brief Tests for a named key, ignoring Shift.
[[nodiscard]] constexpr auto isKey(KeyEvent const& event, KeyCode key) noexcept -> bool
{
    return event.key == key && (event.modifiers == Modifier::None || event.modifiers == Modifier::Shift);
}

/// @brief Renders a key event as a chord such as "Ctrl+x", "Alt+Enter" or "q".
[[nodiscard]] inline auto describeKey(KeyEvent const& event) -> std::string
{
    auto result = modifierPrefix(event.modifiers);
    if (auto const name = keyCodeName(event.key); !name.empty())
        result += name;
    else if (event.key == keyCodeFromCodepoint(U' '))
        result += "Space";
    else if (auto const cp = codepointFromKeyCode(event.key); cp != 0)
        result += unicode::convert_to<char>(std::u32string_view(&cp, 1));
    else
        result += "?";
    return result;
}

} // namespace modelmatch::tui
