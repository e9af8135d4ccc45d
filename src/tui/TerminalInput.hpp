// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <vector>

#include <termios.h>
#include <unistd.h>

#include <tui/InputEvent.hpp>
#include <tui/VtParser.hpp>

namespace modelmatch::tui
{

/// @brief Raw-mode keyboard input from the controlling terminal.
///
/// Puts stdin into raw mode, enables bracketed paste and turns the byte stream into
/// InputEvents. Window size changes arrive through a self-pipe written from the
/// SIGWINCH handler and are reported as ResizeEvents.
class TerminalInput
{
  public:
    /// @brief Milliseconds to wait for the rest of an escape sequence after a lone ESC.
    static constexpr auto EscapeTimeoutMs = 50;

    TerminalInput() = default;
    ~TerminalInput();

    TerminalInput(TerminalInput const&) = delete;
    auto operator=(TerminalInput const&) -> TerminalInput& = delete;
    TerminalInput(TerminalInput&&) = delete;
    auto operator=(TerminalInput&&) -> TerminalInput& = delete;

    /// @brief Enables raw mode and bracketed paste.
    /// @return IoError if stdin is not a terminal or its attributes cannot be changed.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Restores the original terminal attributes.
    void shutdown();

    /// @brief Waits for input and returns the events it produced.
    ///
    /// With @p timeoutMs = -1 this blocks until at least one event is available, except
    /// that a pending lone ESC is resolved after EscapeTimeoutMs.
    /// @return The events (possibly empty after a timeout or an interrupted wait), or an
    ///         IoError when stdin fails or reaches end of file.
    [[nodiscard]] auto poll(int timeoutMs = -1) -> Result<std::vector<InputEvent>>;

    /// @brief Wakes poll() to report a resize. Async-signal-safe.
    void notifyResize() noexcept;

  private:
    VtParser _parser;
    int _fd = STDIN_FILENO;
    struct termios _origTermios {};
    bool _rawMode = false;
    int _resizePipe[2] = { -1, -1 };
};

} // namespace modelmatch::tui
