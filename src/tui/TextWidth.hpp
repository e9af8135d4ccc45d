// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>

namespace modelmatch::tui
{

/// @brief Returns the number of terminal columns @p utf8 occupies.
///
/// East Asian wide characters count two columns, combining marks none.
[[nodiscard]] auto displayWidth(std::string_view utf8) -> int;

/// @brief Cuts @p utf8 so that it occupies at most @p columns columns.
/// @return The longest prefix that fits, never splitting a character.
[[nodiscard]] auto truncateToWidth(std::string_view utf8, int columns) -> std::string;

/// @brief Drops leading characters until at least @p columns columns are removed.
[[nodiscard]] auto skipColumns(std::string_view utf8, int columns) -> std::string;

/// @brief Truncates or right-pads @p utf8 with spaces to exactly @p columns columns.
[[nodiscard]] auto fitToWidth(std::string_view utf8, int columns) -> std::string;

} // namespace modelmatch::tui
