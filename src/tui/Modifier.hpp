// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>

namespace modelmatch::tui
{

/// @brief Bitmask of keyboard modifier keys held during a key event.
enum class Modifier : std::uint8_t
{
    None = 0,
    Shift = 1 << 0,
    Alt = 1 << 1,
    Ctrl = 1 << 2,
    Super = 1 << 3,
};

[[nodiscard]] constexpr auto operator|(Modifier lhs, Modifier rhs) noexcept -> Modifier
{
    return static_cast<Modifier>(static_cast<std::uint8_t>(lhs) | static_cast<std::uint8_t>(rhs));
}

[[nodiscard]] constexpr auto operator&(Modifier lhs, Modifier rhs) noexcept -> Modifier
{
    return static_cast<Modifier>(static_cast<std::uint8_t>(lhs) & static_cast<std::uint8_t>(rhs));
}

constexpr auto operator|=(Modifier& lhs, Modifier rhs) noexcept -> Modifier&
{
    lhs = lhs | rhs;
    return lhs;
}

[[nodiscard]] constexpr auto hasModifier(Modifier mods, Modifier flag) noexcept -> bool
{
    return (mods & flag) != Modifier::None;
}

/// @brief Decodes the xterm modifier parameter (1 + shift + 2*alt + 4*ctrl + 8*super).
[[nodiscard]] constexpr auto modifierFromXtermParam(int param) noexcept -> Modifier
{
    if (param <= 1)
        return Modifier::None;
    auto const bits = param - 1;
    auto mods = Modifier::None;
    if (bits & 1)
        mods |= Modifier::Shift;
    if (bits & 2)
        mods |= Modifier::Alt;
    if (bits & 4)
        mods |= Modifier::Ctrl;
    if (bits & 8)
        mods |= Modifier::Super;
    return mods;
}

/// @brief Renders a modifier set as a chord prefix, e.g. "Ctrl+Alt+".
[[nodiscard]] inline auto modifierPrefix(Modifier mods) -> std::string
{
    auto result = std::string {};
    if (hasModifier(mods, Modifier::Ctrl))
        result += "Ctrl+";
    if (hasModifier(mods, Modifier::Alt))
        result += "Alt+";
    if (hasModifier(mods, Modifier::Shift))
        result += "Shift+";
    if (hasModifier(mods, Modifier::Super))
        result += "Super+";
    return result;
}

} // namespace modelmatch::tui
