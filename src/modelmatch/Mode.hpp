// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <format>
#include <string_view>

namespace modelmatch
{

/// @brief Interaction modes; each one owns the meaning of the keyboard.
enum class Mode : std::uint8_t
{
    Normal,
    Search,
    Folder,
    Model,
    Match,
    Help,
    Tenant,
};

/// @brief Returns the display name of a mode, as shown in the status bar badge.
[[nodiscard]] constexpr auto modeName(Mode mode) noexcept -> std::string_view
{
    switch (mode)
    {
        case Mode::Normal: return "Normal";
        case Mode::Search: return "Search";
        case Mode::Folder: return "Folder";
        case Mode::Model: return "Model";
        case Mode::Match: return "Match";
        case Mode::Help: return "Help";
        case Mode::Tenant: return "Tenant";
    }
    return "Unknown";
}

} // namespace modelmatch

template <>
struct std::formatter<modelmatch::Mode>: std::formatter<std::string_view>
{
    auto format(modelmatch::Mode mode, auto& ctx) const
    {
        return std::formatter<std::string_view>::format(modelmatch::modeName(mode), ctx);
    }
};
