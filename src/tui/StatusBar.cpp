// SPDX-License-Identifier: Apache-2.0
#include <tui/StatusBar.hpp>
#include <tui/TextWidth.hpp>

#include <algorithm>
#include <format>

namespace modelmatch::tui
{

void StatusBar::setBadge(std::string text)
{
    _badge = std::move(text);
}

void StatusBar::setMessage(std::string text)
{
    _message = std::move(text);
}

void StatusBar::setRightText(std::string text)
{
    _rightText = std::move(text);
}

void StatusBar::setStyle(StatusBarStyle style)
{
    _style = style;
}

void StatusBar::render(TerminalOutput& output, int row, int col, int width) const
{
    if (width <= 0)
        return;

    output.moveTo(row, col);
    auto remaining = width;

    if (!_badge.empty())
    {
        auto const badge = truncateToWidth(std::format(" {} ", _badge), remaining);
        output.write(badge, _style.badge);
        remaining -= displayWidth(badge);
    }

    auto const rightWidth = displayWidth(_rightText);
    auto const showRight = rightWidth > 0 && rightWidth + 2 < remaining;
    auto const messageWidth = std::max(0, remaining - (showRight ? rightWidth + 1 : 0));

    output.write(fitToWidth(std::format(" {}", _message), messageWidth), _style.message);
    if (showRight)
    {
        output.writeRaw(" ");
        output.write(_rightText, _style.right);
    }
}

auto StatusBar::defaultStyle() -> StatusBarStyle
{
    return StatusBarStyle {
        .badge = Style { .fg = Color::Black, .bg = Color::Yellow, .bold = true },
        .message = Style { .fg = Color::Green },
        .right = Style { .fg = Color::Gray },
    };
}

} // namespace modelmatch::tui
