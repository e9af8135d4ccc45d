// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <array>
#include <print>
#include <utility>

namespace modelmatch::log
{

namespace
{
    auto globalLevel = Level::Info;
    auto globalCallback = LogCallback {};

    constexpr auto LevelNames = std::array<std::pair<Level, std::string_view>, 5> { {
        { Level::Error, "error" },
        { Level::Warning, "warning" },
        { Level::Info, "info" },
        { Level::Debug, "debug" },
        { Level::Trace, "trace" },
    } };

    constexpr auto stderrPrefix(Level level) -> std::string_view
    {
        switch (level)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    }
} // namespace

void setCallback(LogCallback callback)
{
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

auto levelName(Level level) -> std::string_view
{
    for (auto const& [value, name]: LevelNames)
        if (value == level)
            return name;
    return "unknown";
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    if (name == "warn")
        return Level::Warning;
    for (auto const& [value, levelText]: LevelNames)
        if (levelText == name)
            return value;
    return std::nullopt;
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    std::println(stderr, "[{}] {}", stderrPrefix(level), message);
}

} // namespace modelmatch::log
