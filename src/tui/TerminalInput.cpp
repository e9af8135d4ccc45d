// SPDX-License-Identifier: Apache-2.0
#include <sys/ioctl.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <iterator>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <tui/TerminalInput.hpp>

namespace modelmatch::tui
{

namespace
{
    constexpr auto EnableBracketedPaste = std::string_view { "\033[?2004h" };
    constexpr auto DisableBracketedPaste = std::string_view { "\033[?2004l" };

    auto systemError(std::string_view what) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::IoError, std::format("{}: {}", what, std::strerror(errno)));
    }

    void writeControl(std::string_view sequence)
    {
        // Best effort: a terminal that ignores the mode still works without it.
        static_cast<void>(::write(STDOUT_FILENO, sequence.data(), sequence.size()));
    }
} // namespace

TerminalInput::~TerminalInput()
{
    shutdown();
}

auto TerminalInput::initialize() -> VoidResult
{
    if (tcgetattr(_fd, &_origTermios) == -1)
        return systemError("Failed to read terminal attributes");

    if (pipe(_resizePipe) == -1)
        return systemError("Failed to create resize notification pipe");
    for (auto const fd: _resizePipe)
        fcntl(fd, F_SETFL, fcntl(fd, F_GETFL, 0) | O_NONBLOCK);

    auto raw = _origTermios;
    raw.c_iflag &= ~static_cast<tcflag_t>(IXON | ICRNL);
    raw.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO | ISIG | IEXTEN);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(_fd, TCSAFLUSH, &raw) == -1)
        return systemError("Failed to enter raw mode");
    _rawMode = true;

    writeControl(EnableBracketedPaste);
    return {};
}

void TerminalInput::shutdown()
{
    if (_rawMode)
    {
        writeControl(DisableBracketedPaste);
        tcsetattr(_fd, TCSAFLUSH, &_origTermios);
        _rawMode = false;
    }

    if (_resizePipe[0] != -1)
    {
        close(_resizePipe[0]);
        close(_resizePipe[1]);
        _resizePipe[0] = -1;
        _resizePipe[1] = -1;
    }
}

auto TerminalInput::poll(int timeoutMs) -> Result<std::vector<InputEvent>>
{
    if (_parser.pending() && (timeoutMs < 0 || timeoutMs > EscapeTimeoutMs))
        timeoutMs = EscapeTimeoutMs;

    auto fds = std::array<struct pollfd, 2> {};
    fds[0] = { .fd = _fd, .events = POLLIN, .revents = 0 };
    fds[1] = { .fd = _resizePipe[0], .events = POLLIN, .revents = 0 };
    auto const nfds = (_resizePipe[0] != -1) ? 2 : 1;

    auto const pollResult = ::poll(fds.data(), static_cast<nfds_t>(nfds), timeoutMs);
    if (pollResult == 0)
        return _parser.timeout();
    if (pollResult < 0)
    {
        if (errno == EINTR)
            return std::vector<InputEvent> {};
        return systemError("Failed to wait for terminal input");
    }

    auto events = std::vector<InputEvent> {};

    if (nfds == 2 && (fds[1].revents & POLLIN) != 0)
    {
        auto drain = char {};
        while (read(_resizePipe[0], &drain, 1) > 0)
            ;
        auto ws = winsize {};
        if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0)
            events.emplace_back(ResizeEvent { .columns = ws.ws_col, .rows = ws.ws_row });
    }

    if ((fds[0].revents & (POLLHUP | POLLERR | POLLNVAL)) != 0 && (fds[0].revents & POLLIN) == 0)
        return makeError(ErrorCode::IoError, "Terminal input was closed");

    if ((fds[0].revents & POLLIN) != 0)
    {
        auto buf = std::array<char, 512> {};
        auto const n = read(_fd, buf.data(), buf.size());
        if (n == 0)
            return makeError(ErrorCode::IoError, "Terminal input reached end of file");
        if (n < 0 && errno != EINTR && errno != EAGAIN)
            return systemError("Failed to read terminal input");
        if (n > 0)
        {
            auto parsed = _parser.feed(std::string_view(buf.data(), static_cast<std::size_t>(n)));
            events.insert(
                events.end(), std::make_move_iterator(parsed.begin()), std::make_move_iterator(parsed.end()));
        }
    }

    return events;
}

void TerminalInput::notifyResize() noexcept
{
    if (_resizePipe[1] != -1)
    {
        auto const byte = char { 1 };
        static_cast<void>(::write(_resizePipe[1], &byte, 1));
    }
}

} // namespace modelmatch::tui
