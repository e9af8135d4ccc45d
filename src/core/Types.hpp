// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace modelmatch
{

/// @brief Processing state of a model on the backend.
enum class ModelState
{
    Received,
    Indexing,
    Ready,
};

/// @brief Converts a ModelState to its wire representation.
[[nodiscard]] constexpr auto modelStateToString(ModelState state) -> std::string_view
{
    switch (state)
    {
        case ModelState::Received: return "received";
        case ModelState::Indexing: return "indexing";
        case ModelState::Ready: return "ready";
    }
    return "unknown";
}

/// @brief Parses the wire representation of a ModelState (case-insensitive for the first letter).
/// @return The state, or std::nullopt for unknown names.
[[nodiscard]] constexpr auto modelStateFromString(std::string_view str) -> std::optional<ModelState>
{
    if (str == "received" || str == "Received")
        return ModelState::Received;
    if (str == "indexing" || str == "Indexing")
        return ModelState::Indexing;
    if (str == "ready" || str == "Ready")
        return ModelState::Ready;
    return std::nullopt;
}

/// @brief A folder grouping models on the backend.
struct Folder
{
    std::int64_t id = 0;
    std::string name;

    auto operator==(Folder const&) const -> bool = default;
};

/// @brief A model as listed by the backend.
struct Model
{
    std::string uuid;
    std::string name;
    ModelState state = ModelState::Received;

    auto operator==(Model const&) const -> bool = default;
};

} // namespace modelmatch
