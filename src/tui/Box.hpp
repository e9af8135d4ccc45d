// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/TerminalOutput.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace modelmatch::tui
{

enum class BorderStyle : std::uint8_t
{
    Single,  ///< ─ │ ┌ ┐ └ ┘
    Rounded, ///< ─ │ ╭ ╮ ╰ ╯
};

/// @brief Border glyphs of one BorderStyle.
struct BorderChars
{
    std::string_view horizontal;
    std::string_view vertical;
    std::string_view topLeft;
    std::string_view topRight;
    std::string_view bottomLeft;
    std::string_view bottomRight;

    static auto fromStyle(BorderStyle style) noexcept -> BorderChars;
};

enum class TitleAlign : std::uint8_t
{
    Left,
    Center,
};

/// @brief Geometry and appearance of a bordered box.
struct BoxConfig
{
    int row = 1;    ///< Top-left row (1-based)
    int col = 1;    ///< Top-left column (1-based)
    int width = 0;  ///< Total width including borders
    int height = 0; ///< Total height including borders
    BorderStyle border = BorderStyle::Single;
    Style borderStyle;
    std::string title;
    TitleAlign titleAlign = TitleAlign::Left;
    Style titleStyle;
    bool fillBackground = false; ///< Blank the interior, for boxes drawn over other content.
};

/// @brief A rectangular frame with an optional title embedded in its top border.
///
/// Content is one column in from the left border.
class Box
{
  public:
    explicit Box(BoxConfig config);

    /// @brief Draws the frame (and blanks the interior if requested).
    void render(TerminalOutput& output) const;

    [[nodiscard]] auto innerWidth() const noexcept -> int;
    [[nodiscard]] auto innerHeight() const noexcept -> int;
    [[nodiscard]] auto contentRow() const noexcept -> int { return _config.row + 1; }
    [[nodiscard]] auto contentCol() const noexcept -> int { return _config.col + 2; }

  private:
    BoxConfig _config;
};

} // namespace modelmatch::tui
