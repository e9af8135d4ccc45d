// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <tui/InputEvent.hpp>

namespace modelmatch::tui
{

/// @brief Incremental parser turning raw terminal input bytes into InputEvents.
///
/// Understands CSI and SS3 cursor/function key sequences with xterm modifiers,
/// Alt+key as ESC prefix, bracketed paste and UTF-8 text. A lone ESC stays pending
/// until timeout() is called, since it may start a longer sequence.
class VtParser
{
  public:
    /// @brief Feeds raw bytes and returns the events they complete.
    [[nodiscard]] auto feed(std::string_view data) -> std::vector<InputEvent>;

    /// @brief Resolves a pending lone ESC after no further input arrived.
    [[nodiscard]] auto timeout() -> std::vector<InputEvent>;

    /// @brief Returns true while an escape sequence is incomplete.
    [[nodiscard]] auto pending() const noexcept -> bool { return _state == State::Escape; }

  private:
    enum class State : std::uint8_t
    {
        Ground,
        Escape,
        Csi,
        Ss3,
        PasteBody,
        Utf8Sequence,
    };

    State _state = State::Ground;
    std::string _paramBuf;
    std::string _utf8Buf;
    std::string _pasteBuf;
    int _utf8Remaining = 0;

    void processGround(std::uint8_t byte, std::vector<InputEvent>& events);
    void processEscape(std::uint8_t byte, std::vector<InputEvent>& events);
    void processCsi(std::uint8_t byte, std::vector<InputEvent>& events);
    void processSs3(std::uint8_t byte, std::vector<InputEvent>& events);
    void processPaste(std::uint8_t byte, std::vector<InputEvent>& events);
    void processUtf8(std::uint8_t byte, std::vector<InputEvent>& events);
    void dispatchCsi(char finalByte, std::vector<InputEvent>& events);
};

} // namespace modelmatch::tui
