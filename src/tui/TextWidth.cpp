// SPDX-License-Identifier: Apache-2.0
#include <libunicode/convert.h>
#include <libunicode/width.h>

#include <algorithm>

#include <tui/TextWidth.hpp>

namespace modelmatch::tui
{

namespace
{
    auto columnsOf(char32_t codepoint) -> int
    {
        return std::max(0, static_cast<int>(unicode::width(codepoint)));
    }
} // namespace

auto displayWidth(std::string_view utf8) -> int
{
    auto total = 0;
    for (auto const codepoint: unicode::convert_to<char32_t>(utf8))
        total += columnsOf(codepoint);
    return total;
}

auto truncateToWidth(std::string_view utf8, int columns) -> std::string
{
    auto const codepoints = unicode::convert_to<char32_t>(utf8);
    auto used = 0;
    auto count = std::size_t { 0 };
    for (auto const codepoint: codepoints)
    {
        auto const width = columnsOf(codepoint);
        if (used + width > columns)
            break;
        used += width;
        ++count;
    }
    if (count == codepoints.size())
        return std::string(utf8);
    return unicode::convert_to<char>(std::u32string_view(codepoints).substr(0, count));
}

auto skipColumns(std::string_view utf8, int columns) -> std::string
{
    if (columns <= 0)
        return std::string(utf8);

    auto const codepoints = unicode::convert_to<char32_t>(utf8);
    auto skipped = 0;
    auto count = std::size_t { 0 };
    while (count < codepoints.size() && skipped < columns)
        skipped += columnsOf(codepoints[count++]);
    return unicode::convert_to<char>(std::u32string_view(codepoints).substr(count));
}

auto fitToWidth(std::string_view utf8, int columns) -> std::string
{
    auto result = truncateToWidth(utf8, columns);
    auto const padding = columns - displayWidth(result);
    if (padding > 0)
        result.append(static_cast<std::size_t>(padding), ' ');
    return result;
}

} // namespace modelmatch::tui
