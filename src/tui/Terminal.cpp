// SPDX-License-Identifier: Apache-2.0
#include <csignal>
#include <print>

#include <tui/Terminal.hpp>

namespace modelmatch::tui
{

namespace
{
    // Only one Terminal is active at a time.
    TerminalInput* gActiveInput = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
    struct sigaction gPrevSigwinch {};     // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void sigwinchHandler(int /*sig*/)
    {
        if (gActiveInput != nullptr)
            gActiveInput->notifyResize();
    }
} // namespace

Terminal::~Terminal()
{
    shutdown();
}

auto Terminal::initialize() -> VoidResult
{
    if (_initialized)
        return {};

    if (auto result = _output.initialize(); !result)
        return result;
    if (auto result = _input.initialize(); !result)
        return result;

    gActiveInput = &_input;
    struct sigaction sa {};
    sa.sa_handler = sigwinchHandler;
    sa.sa_flags = SA_RESTART;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGWINCH, &sa, &gPrevSigwinch);
    _initialized = true;

    _output.enterAltScreen();
    _output.hideCursor();
    _output.clearScreen();
    return _output.flush();
}

void Terminal::shutdown()
{
    if (!_initialized)
        return;

    sigaction(SIGWINCH, &gPrevSigwinch, nullptr);
    gActiveInput = nullptr;

    _output.discard();
    _output.showCursor();
    _output.leaveAltScreen();
    if (auto result = _output.flush(); !result)
        std::println(stderr, "Failed to restore the terminal screen: {}", result.error());

    _input.shutdown();
    _initialized = false;
}

auto Terminal::poll(int timeoutMs) -> Result<std::vector<InputEvent>>
{
    return _input.poll(timeoutMs);
}

} // namespace modelmatch::tui
