// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <string>
#include <string_view>

#include <unistd.h>

namespace modelmatch::tui
{

/// @brief The basic ANSI palette, rendered with SGR 30-37/90 and 40-47/100.
enum class Color : std::uint8_t
{
    Default,
    Black,
    Red,
    Green,
    Yellow,
    Blue,
    Magenta,
    Cyan,
    White,
    Gray,
};

/// @brief Text styling attributes for terminal output.
struct Style
{
    Color fg = Color::Default;
    Color bg = Color::Default;
    bool bold = false;
    bool dim = false;
    bool inverse = false;
};

/// @brief Buffered terminal output with cursor control and screen management.
///
/// Everything written is collected in memory and sent to the terminal by flush() as a
/// single synchronized update (CSI ?2026h ... CSI ?2026l).
class TerminalOutput
{
  public:
    explicit TerminalOutput(int fd = STDOUT_FILENO);

    /// @brief Queries the terminal dimensions.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Writes styled text at the current cursor position.
    void write(std::string_view text, Style const& style = {});

    /// @brief Appends text verbatim, without styling.
    void writeRaw(std::string_view text);

    /// @brief Moves the cursor to an absolute position (1-based).
    void moveTo(int row, int col);

    void clearScreen();
    void enterAltScreen();
    void leaveAltScreen();
    void showCursor();
    void hideCursor();

    /// @brief Writes all buffered output to the terminal.
    /// @return IoError if the terminal could not be written to.
    [[nodiscard]] auto flush() -> VoidResult;

    /// @brief Returns the output buffered since the last flush.
    [[nodiscard]] auto pending() const noexcept -> std::string_view { return _buffer; }

    /// @brief Drops buffered output without writing it.
    void discard() noexcept { _buffer.clear(); }

    [[nodiscard]] auto columns() const noexcept -> int { return _cols; }
    [[nodiscard]] auto rows() const noexcept -> int { return _rows; }

    /// @brief Re-reads the terminal dimensions from the output device.
    void updateDimensions();

    /// @brief Overrides the dimensions, for output that is not a terminal.
    void setDimensions(int columns, int rows) noexcept;

  private:
    int _fd;
    std::string _buffer;
    int _cols = 80;
    int _rows = 24;

    void appendSgr(Style const& style);
};

} // namespace modelmatch::tui
