// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/TerminalOutput.hpp>

#include <string>

namespace modelmatch::tui
{

struct StatusBarStyle
{
    Style badge;   ///< Mode badge on the left.
    Style message; ///< Status message after the badge.
    Style right;   ///< Right-aligned text.
};

/// @brief One-line bar: a mode badge, a status message and right-aligned text.
///
/// The message is cut to the space left between badge and right text.
class StatusBar
{
  public:
    void setBadge(std::string text);
    void setMessage(std::string text);
    void setRightText(std::string text);
    void setStyle(StatusBarStyle style);

    /// @brief Draws the bar on @p row, from @p col over @p width columns.
    void render(TerminalOutput& output, int row, int col, int width) const;

  private:
    std::string _badge;
    std::string _message;
    std::string _rightText;
    StatusBarStyle _style = defaultStyle();

    static auto defaultStyle() -> StatusBarStyle;
};

} // namespace modelmatch::tui
