// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

#include <tui/TerminalOutput.hpp>

namespace modelmatch::tui
{

enum class LogLevel : std::uint8_t
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

struct LogEntry
{
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string message;
};

/// @brief Bordered panel showing the most recent log entries, newest at the bottom.
class LogPanel
{
  public:
    /// @brief Maximum number of entries retained; older ones are dropped.
    static constexpr std::size_t MaxEntries = 100;

    /// @brief Records a message stamped with the current time.
    void addLog(LogLevel level, std::string message);

    /// @brief Records an entry with a given timestamp.
    void addEntry(LogEntry entry);

    [[nodiscard]] auto entries() const noexcept -> std::deque<LogEntry> const& { return _entries; }

    /// @brief Draws the panel as a box of @p height rows, showing as many entries as fit.
    void render(TerminalOutput& output, int row, int col, int width, int height) const;

    /// @brief Formats one entry as shown in the panel, e.g. "2024-03-01 12:00:00.250 WARN  message".
    [[nodiscard]] static auto formatEntry(LogEntry const& entry) -> std::string;

  private:
    std::deque<LogEntry> _entries;
};

} // namespace modelmatch::tui
