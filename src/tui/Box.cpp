// SPDX-License-Identifier: Apache-2.0
#include <tui/Box.hpp>
#include <tui/TextWidth.hpp>

#include <algorithm>

namespace modelmatch::tui
{

namespace
{
    auto repeat(std::string_view glyph, int count) -> std::string
    {
        auto result = std::string {};
        for (auto i = 0; i < count; ++i)
            result += glyph;
        return result;
    }
} // namespace

auto BorderChars::fromStyle(BorderStyle style) noexcept -> BorderChars
{
    switch (style)
    {
        case BorderStyle::Single:
            return BorderChars {
                .horizontal = "─",
                .vertical = "│",
                .topLeft = "┌",
                .topRight = "┐",
                .bottomLeft = "└",
                .bottomRight = "┘",
            };
        case BorderStyle::Rounded:
            return BorderChars {
                .horizontal = "─",
                .vertical = "│",
                .topLeft = "╭",
                .topRight = "╮",
                .bottomLeft = "╰",
                .bottomRight = "╯",
            };
    }
    return fromStyle(BorderStyle::Single);
}

Box::Box(BoxConfig config): _config(std::move(config))
{
}

void Box::render(TerminalOutput& output) const
{
    if (_config.width < 2 || _config.height < 2)
        return;

    auto const chars = BorderChars::fromStyle(_config.border);
    auto const span = _config.width - 2;

    // Top border with the title cut to leave one border glyph on each side.
    auto const title = truncateToWidth(_config.title, std::max(0, span - 2));
    auto const titleWidth = displayWidth(title);
    auto leftPad = span;
    if (titleWidth > 0)
        leftPad = _config.titleAlign == TitleAlign::Center ? (span - titleWidth) / 2 : 1;
    auto const rightPad = span - leftPad - titleWidth;

    output.moveTo(_config.row, _config.col);
    output.write(std::string(chars.topLeft) + repeat(chars.horizontal, leftPad), _config.borderStyle);
    if (titleWidth > 0)
    {
        output.write(title, _config.titleStyle);
        output.write(repeat(chars.horizontal, rightPad), _config.borderStyle);
    }
    output.write(chars.topRight, _config.borderStyle);

    auto const blank = std::string(static_cast<std::size_t>(span), ' ');
    auto const bottomRow = _config.row + _config.height - 1;
    for (auto row = _config.row + 1; row < bottomRow; ++row)
    {
        output.moveTo(row, _config.col);
        output.write(chars.vertical, _config.borderStyle);
        if (_config.fillBackground)
            output.writeRaw(blank);
        else
            output.moveTo(row, _config.col + _config.width - 1);
        output.write(chars.vertical, _config.borderStyle);
    }

    output.moveTo(bottomRow, _config.col);
    output.write(std::string(chars.bottomLeft) + repeat(chars.horizontal, span) + std::string(chars.bottomRight),
                 _config.borderStyle);
}

auto Box::innerWidth() const noexcept -> int
{
    return std::max(0, _config.width - 4);
}

auto Box::innerHeight() const noexcept -> int
{
    return std::max(0, _config.height - 2);
}

} // namespace modelmatch::tui
