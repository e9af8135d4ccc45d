// SPDX-License-Identifier: Apache-2.0
#include <algorithm>
#include <format>
#include <string>

#include <tui/Box.hpp>
#include <tui/LogPanel.hpp>
#include <tui/TextWidth.hpp>

namespace modelmatch::tui
{

namespace
{
    constexpr auto levelTag(LogLevel level) -> std::string_view
    {
        switch (level)
        {
            case LogLevel::Error: return "ERROR";
            case LogLevel::Warning: return "WARN ";
            case LogLevel::Info: return "INFO ";
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Trace: return "TRACE";
        }
        return "?????";
    }

    constexpr auto levelColor(LogLevel level) -> Color
    {
        switch (level)
        {
            case LogLevel::Error: return Color::Red;
            case LogLevel::Warning: return Color::Yellow;
            case LogLevel::Info: return Color::Blue;
            case LogLevel::Debug: return Color::Cyan;
            case LogLevel::Trace: return Color::Gray;
        }
        return Color::Default;
    }
} // namespace

void LogPanel::addLog(LogLevel level, std::string message)
{
    addEntry(LogEntry { .timestamp = std::chrono::system_clock::now(), .level = level, .message = std::move(message) });
}

void LogPanel::addEntry(LogEntry entry)
{
    _entries.push_back(std::move(entry));
    while (_entries.size() > MaxEntries)
        _entries.pop_front();
}

auto LogPanel::formatEntry(LogEntry const& entry) -> std::string
{
    auto const stamp = std::chrono::floor<std::chrono::milliseconds>(entry.timestamp);
    return std::format("{:%F %T} {} {}", stamp, levelTag(entry.level), entry.message);
}

void LogPanel::render(TerminalOutput& output, int row, int col, int width, int height) const
{
    auto const box = Box(BoxConfig {
        .row = row,
        .col = col,
        .width = width,
        .height = height,
        .title = std::format(" Log ({}) ", _entries.size()),
    });
    box.render(output);

    auto const visible = std::min(static_cast<std::size_t>(box.innerHeight()), _entries.size());
    auto const first = _entries.size() - visible;
    for (auto i = std::size_t { 0 }; i < visible; ++i)
    {
        auto const& entry = _entries[first + i];
        auto const text = fitToWidth(formatEntry(entry), box.innerWidth());
        output.moveTo(box.contentRow() + static_cast<int>(i), box.contentCol());
        output.write(text, Style { .fg = levelColor(entry.level) });
    }
}

} // namespace modelmatch::tui
