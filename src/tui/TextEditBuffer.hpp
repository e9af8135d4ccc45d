// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <tui/InputEvent.hpp>

namespace modelmatch::tui
{

/// @brief Result of offering an input event to a TextEditBuffer.
enum class TextEditAction : std::uint8_t
{
    Changed, ///< The event was consumed; text or cursor may have changed.
    None,    ///< The event is not an editing key.
};

/// @brief Single-line text storage with a cursor, indexed by Unicode scalar value.
///
/// The cursor is always within [0, size()]; every operation clamps instead of failing.
/// UTF-8 is accepted and produced at the boundary, positions count codepoints.
class TextEditBuffer
{
  public:
    /// @brief Inserts a character at the cursor and advances past it.
    void insert(char32_t ch);

    /// @brief Inserts UTF-8 text at the cursor and advances past it.
    void insert(std::string_view utf8);

    /// @brief Appends a character at the end and moves the cursor to the end.
    void append(char32_t ch);

    /// @brief Appends UTF-8 text at the end and moves the cursor to the end.
    void append(std::string_view utf8);

    /// @brief Removes the character under the cursor, if any. The cursor stays put.
    void deleteChar();

    /// @brief Removes the character before the cursor, if any.
    void backspace();

    void left();
    void right();
    void home();
    void end();

    /// @brief Replaces the contents and places the cursor at the end.
    void setText(std::string_view utf8);

    /// @brief Places the cursor, clamped to [0, size()].
    void setCursor(std::size_t position);

    /// @brief Empties the buffer and moves the cursor to 0.
    void clear();

    /// @brief Applies an editing key (characters, Backspace, Delete, cursor movement).
    ///
    /// Paste events insert their text. Enter, Escape and other keys are left to the caller.
    [[nodiscard]] auto processEvent(InputEvent const& event) -> TextEditAction;

    /// @brief Returns the contents as UTF-8.
    [[nodiscard]] auto text() const -> std::string;

    [[nodiscard]] auto codepoints() const noexcept -> std::u32string_view { return _text; }
    [[nodiscard]] auto cursor() const noexcept -> std::size_t { return _cursor; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return _text.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return _text.empty(); }

    /// @brief Returns the number of terminal columns occupied by the text before the cursor.
    [[nodiscard]] auto cursorColumn() const -> int;

  private:
    std::u32string _text;
    std::size_t _cursor = 0;

    auto handleKey(KeyEvent const& key) -> TextEditAction;
};

} // namespace modelmatch::tui
