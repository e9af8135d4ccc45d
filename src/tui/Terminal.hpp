// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <vector>

#include <tui/InputEvent.hpp>
#include <tui/TerminalInput.hpp>
#include <tui/TerminalOutput.hpp>

namespace modelmatch::tui
{

/// @brief Owns the full-screen terminal session.
///
/// initialize() switches to raw mode and the alternate screen and installs the
/// SIGWINCH handler; shutdown() (also run by the destructor) undoes all of it.
class Terminal
{
  public:
    Terminal() = default;
    ~Terminal();

    Terminal(Terminal const&) = delete;
    auto operator=(Terminal const&) -> Terminal& = delete;
    Terminal(Terminal&&) = delete;
    auto operator=(Terminal&&) -> Terminal& = delete;

    [[nodiscard]] auto initialize() -> VoidResult;
    void shutdown();

    [[nodiscard]] auto output() noexcept -> TerminalOutput& { return _output; }

    /// @brief Waits for the next batch of input events.
    [[nodiscard]] auto poll(int timeoutMs = -1) -> Result<std::vector<InputEvent>>;

  private:
    TerminalInput _input;
    TerminalOutput _output;
    bool _initialized = false;
};

} // namespace modelmatch::tui
