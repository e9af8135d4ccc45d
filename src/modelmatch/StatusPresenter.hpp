// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <modelmatch/Mode.hpp>

#include <string_view>

namespace modelmatch
{

/// @brief Returns the status line shown right after entering @p mode.
[[nodiscard]] auto hintFor(Mode mode) noexcept -> std::string_view;

/// @brief Returns the status line shown for keys that mean nothing in Normal mode.
[[nodiscard]] auto genericHint() noexcept -> std::string_view;

} // namespace modelmatch
