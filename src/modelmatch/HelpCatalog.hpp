// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <modelmatch/Mode.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace modelmatch
{

/// @brief The help pages, one per mode that can open help.
enum class HelpTopic : std::uint8_t
{
    Normal,
    Search,
    Folder,
    Model,
    Match,
    Tenant,
};

/// @brief Returns the help page describing the keys of @p mode.
/// @return std::nullopt for Mode::Help, which has no page of its own.
[[nodiscard]] constexpr auto helpTopicFor(Mode mode) noexcept -> std::optional<HelpTopic>
{
    switch (mode)
    {
        case Mode::Normal: return HelpTopic::Normal;
        case Mode::Search: return HelpTopic::Search;
        case Mode::Folder: return HelpTopic::Folder;
        case Mode::Model: return HelpTopic::Model;
        case Mode::Match: return HelpTopic::Match;
        case Mode::Tenant: return HelpTopic::Tenant;
        case Mode::Help: return std::nullopt;
    }
    return std::nullopt;
}

/// @brief Returns the body of a help page; lines are separated by '\n'.
[[nodiscard]] auto helpText(HelpTopic topic) noexcept -> std::string_view;

} // namespace modelmatch
