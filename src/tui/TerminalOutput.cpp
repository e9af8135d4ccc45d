// SPDX-License-Identifier: Apache-2.0
#include <sys/ioctl.h>

#include <cerrno>
#include <cstring>
#include <format>

#include <unistd.h>

#include <tui/TerminalOutput.hpp>

namespace modelmatch::tui
{

namespace
{
    constexpr auto SyncBegin = std::string_view { "\033[?2026h" };
    constexpr auto SyncEnd = std::string_view { "\033[?2026l" };

    /// Offset of a palette color from the SGR base (30 for fg, 40 for bg).
    constexpr auto paletteOffset(Color color) -> int
    {
        switch (color)
        {
            case Color::Default: return -1;
            case Color::Black: return 0;
            case Color::Red: return 1;
            case Color::Green: return 2;
            case Color::Yellow: return 3;
            case Color::Blue: return 4;
            case Color::Magenta: return 5;
            case Color::Cyan: return 6;
            case Color::White: return 7;
            case Color::Gray: return 60; // bright black
        }
        return -1;
    }

    auto writeAll(int fd, std::string_view data) -> VoidResult
    {
        while (!data.empty())
        {
            auto const n = ::write(fd, data.data(), data.size());
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                return makeError(ErrorCode::IoError,
                                 std::format("Failed to write to terminal: {}", std::strerror(errno)));
            }
            data.remove_prefix(static_cast<std::size_t>(n));
        }
        return {};
    }
} // namespace

TerminalOutput::TerminalOutput(int fd): _fd(fd)
{
}

auto TerminalOutput::initialize() -> VoidResult
{
    if (isatty(_fd) == 0)
        return makeError(ErrorCode::IoError, "Standard output is not a terminal");
    updateDimensions();
    return {};
}

void TerminalOutput::write(std::string_view text, Style const& style)
{
    appendSgr(style);
    _buffer.append(text);
    _buffer += "\033[m";
}

void TerminalOutput::writeRaw(std::string_view text)
{
    _buffer.append(text);
}

void TerminalOutput::moveTo(int row, int col)
{
    _buffer += std::format("\033[{};{}H", row, col);
}

void TerminalOutput::clearScreen()
{
    _buffer += "\033[2J\033[H";
}

void TerminalOutput::enterAltScreen()
{
    _buffer += "\033[?1049h";
}

void TerminalOutput::leaveAltScreen()
{
    _buffer += "\033[?1049l";
}

void TerminalOutput::showCursor()
{
    _buffer += "\033[?25h";
}

void TerminalOutput::hideCursor()
{
    _buffer += "\033[?25l";
}

auto TerminalOutput::flush() -> VoidResult
{
    if (_buffer.empty())
        return {};

    auto frame = std::string {};
    frame.reserve(_buffer.size() + SyncBegin.size() + SyncEnd.size());
    frame += SyncBegin;
    frame += _buffer;
    frame += SyncEnd;
    _buffer.clear();
    return writeAll(_fd, frame);
}

void TerminalOutput::updateDimensions()
{
    auto ws = winsize {};
    if (ioctl(_fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0)
    {
        _cols = ws.ws_col;
        _rows = ws.ws_row;
    }
}

void TerminalOutput::setDimensions(int columns, int rows) noexcept
{
    _cols = columns;
    _rows = rows;
}

void TerminalOutput::appendSgr(Style const& style)
{
    auto params = std::string {};
    auto const append = [&](int value) {
        if (!params.empty())
            params += ';';
        params += std::to_string(value);
    };

    if (style.bold)
        append(1);
    if (style.dim)
        append(2);
    if (style.inverse)
        append(7);
    if (auto const offset = paletteOffset(style.fg); offset >= 0)
        append(30 + offset);
    if (auto const offset = paletteOffset(style.bg); offset >= 0)
        append(40 + offset);

    if (!params.empty())
        _buffer += std::format("\033[{}m", params);
}

} // namespace modelmatch::tui
