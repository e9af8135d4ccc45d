// SPDX-License-Identifier: Apache-2.0
#include <modelmatch/Screen.hpp>

#include <tui/Box.hpp>
#include <tui/StatusBar.hpp>
#include <tui/TextWidth.hpp>

#include <algorithm>
#include <format>
#include <ranges>

namespace modelmatch
{

using tui::Box;
using tui::BoxConfig;
using tui::Color;
using tui::Style;

namespace
{
    constexpr auto SelectionMarker = std::string_view { "-> " };
    constexpr auto NoMarker = std::string_view { "   " };
    constexpr auto UuidColumns = 36;
    constexpr auto StateColumns = 9;

    auto borderFor(bool focused) -> Style
    {
        return focused ? Style { .fg = Color::Yellow } : Style {};
    }

    auto rowStyle(bool selected, bool active) -> Style
    {
        return Style { .fg = selected ? Color::Yellow : Color::Default, .bold = active, .inverse = selected };
    }

    /// First item index to show so that @p selected stays within @p visibleRows rows.
    auto scrollOffset(std::optional<std::size_t> selected, int visibleRows) -> std::size_t
    {
        auto const rows = static_cast<std::size_t>(std::max(1, visibleRows));
        if (!selected || *selected < rows)
            return 0;
        return *selected - rows + 1;
    }

    auto splitLines(std::string_view text) -> std::vector<std::string_view>
    {
        auto lines = std::vector<std::string_view> {};
        for (auto const line: text | std::views::split('\n'))
            lines.emplace_back(line.begin(), line.end());
        return lines;
    }

    /// Centers a box of at least @p minWidth x @p minHeight on a @p cols x @p rows screen.
    auto centeredBox(int cols, int rows, int minWidth, int minHeight, std::string title) -> BoxConfig
    {
        auto const width = std::min(cols - 2, std::max(cols / 2, minWidth));
        auto const height = std::min(rows - 2, std::max(rows / 2, minHeight));
        return BoxConfig {
            .row = (rows - height) / 2 + 1,
            .col = (cols - width) / 2 + 1,
            .width = width,
            .height = height,
            .border = tui::BorderStyle::Rounded,
            .borderStyle = Style { .fg = Color::Cyan },
            .title = std::move(title),
            .titleAlign = tui::TitleAlign::Center,
            .titleStyle = Style { .fg = Color::Cyan, .bold = true },
            .fillBackground = true,
        };
    }
} // namespace

Screen::Screen(tui::TerminalOutput& output, int logHeight): _output(output), _logHeight(logHeight)
{
}

auto Screen::render(ModeController const& state, tui::LogPanel const& log) -> VoidResult
{
    draw(state, log);
    return _output.flush();
}

void Screen::draw(ModeController const& state, tui::LogPanel const& log)
{
    _output.hideCursor();
    _output.clearScreen();

    if (_output.columns() < MinColumns || _output.rows() < MinRows)
    {
        _output.moveTo(1, 1);
        _output.write(tui::truncateToWidth(std::format("Terminal too small (need {}x{})", MinColumns, MinRows),
                                           _output.columns()),
                      Style { .fg = Color::Red });
        return;
    }

    computeGeometry();
    drawFrame(state);
    drawSearchBox(state);
    drawFolders(state);
    drawModels(state);
    if (_geo.logHeight > 0)
        log.render(_output, _geo.logRow, _geo.left, _geo.width, _geo.logHeight);
    drawStatusLine(state);
    if (state.tenantPickerVisible())
        drawTenantPicker(state);
    if (state.helpVisible())
        drawHelp(state);
    placeCursor(state);
}

void Screen::computeGeometry()
{
    auto const rows = _output.rows();
    auto const cols = _output.columns();

    _geo.left = 2;
    _geo.width = cols - 2;
    _geo.searchRow = 2;
    _geo.listsRow = _geo.searchRow + 3;
    _geo.statusRow = rows - 1;

    // The lists keep at least 5 rows; the log panel gives way first.
    auto const available = _geo.statusRow - _geo.listsRow;
    _geo.logHeight = std::clamp(_logHeight, 0, std::max(0, available - 5));
    if (_geo.logHeight < 3)
        _geo.logHeight = 0;
    _geo.listsHeight = available - _geo.logHeight;
    _geo.logRow = _geo.listsRow + _geo.listsHeight;
    _geo.foldersWidth = std::max(16, _geo.width / 5);
}

void Screen::drawFrame(ModeController const& state)
{
    auto title = std::string { " modelmatch " };
    if (auto const& tenant = state.activeTenant())
        title = std::format(" modelmatch - {} ", *tenant);

    Box(BoxConfig {
            .row = 1,
            .col = 1,
            .width = _output.columns(),
            .height = _output.rows(),
            .border = tui::BorderStyle::Rounded,
            .title = std::move(title),
            .titleAlign = tui::TitleAlign::Center,
            .titleStyle = Style { .bold = true },
        })
        .render(_output);
}

void Screen::drawSearchBox(ModeController const& state)
{
    auto const focused = state.mode() == Mode::Search;
    auto const box = Box(BoxConfig {
        .row = _geo.searchRow,
        .col = _geo.left,
        .width = _geo.width,
        .height = 3,
        .borderStyle = borderFor(focused),
        .title = " Search ",
    });
    box.render(_output);

    auto const& buffer = state.searchBuffer();
    auto const overflow = std::max(0, buffer.cursorColumn() - (box.innerWidth() - 1));
    _output.moveTo(box.contentRow(), box.contentCol());
    _output.write(tui::truncateToWidth(tui::skipColumns(buffer.text(), overflow), box.innerWidth()));
}

void Screen::drawFolders(ModeController const& state)
{
    auto const& folders = state.folders();
    auto const box = Box(BoxConfig {
        .row = _geo.listsRow,
        .col = _geo.left,
        .width = _geo.foldersWidth,
        .height = _geo.listsHeight,
        .borderStyle = borderFor(state.mode() == Mode::Folder),
        .title = std::format(" Folders ({}) ", folders.size()),
    });
    box.render(_output);

    auto const& active = state.activeFolder();
    auto const first = scrollOffset(folders.selectedIndex(), box.innerHeight());
    auto const last = std::min(folders.size(), first + static_cast<std::size_t>(box.innerHeight()));
    for (auto i = first; i < last; ++i)
    {
        auto const& folder = folders.items()[i];
        auto const selected = folders.selectedIndex() == i;
        auto const line = std::format("{}{}: {}", selected ? SelectionMarker : NoMarker, folder.id, folder.name);
        _output.moveTo(box.contentRow() + static_cast<int>(i - first), box.contentCol());
        _output.write(tui::fitToWidth(line, box.innerWidth()), rowStyle(selected, active && active->id == folder.id));
    }
}

void Screen::drawModels(ModeController const& state)
{
    auto const& models = state.models();
    auto title = std::string { " Models " };
    if (auto const& folder = state.activeFolder())
        title = std::format(" Models in {} ({}) ", folder->name, models.size());

    auto const box = Box(BoxConfig {
        .row = _geo.listsRow,
        .col = _geo.left + _geo.foldersWidth,
        .width = _geo.width - _geo.foldersWidth,
        .height = _geo.listsHeight,
        .borderStyle = borderFor(state.mode() == Mode::Model),
        .title = std::move(title),
    });
    box.render(_output);

    auto const markerWidth = static_cast<int>(SelectionMarker.size());
    auto const uuidWidth = std::min(UuidColumns, std::max(8, box.innerWidth() / 3));
    auto const nameWidth = std::max(0, box.innerWidth() - markerWidth - uuidWidth - StateColumns - 2);
    auto const formatRow = [&](std::string_view marker, std::string_view uuid, std::string_view name, std::string_view st) {
        return std::format("{}{} {} {}",
                           marker,
                           tui::fitToWidth(uuid, uuidWidth),
                           tui::fitToWidth(name, nameWidth),
                           tui::fitToWidth(st, StateColumns));
    };

    _output.moveTo(box.contentRow(), box.contentCol());
    _output.write(tui::truncateToWidth(formatRow(NoMarker, "UUID", "Name", "State"), box.innerWidth()),
                  Style { .bold = true });

    auto const& active = state.activeModel();
    auto const visibleRows = box.innerHeight() - 1;
    auto const first = scrollOffset(models.selectedIndex(), visibleRows);
    auto const last = std::min(models.size(), first + static_cast<std::size_t>(std::max(0, visibleRows)));
    for (auto i = first; i < last; ++i)
    {
        auto const& model = models.items()[i];
        auto const selected = models.selectedIndex() == i;
        auto const line =
            formatRow(selected ? SelectionMarker : NoMarker, model.uuid, model.name, modelStateToString(model.state));
        _output.moveTo(box.contentRow() + 1 + static_cast<int>(i - first), box.contentCol());
        _output.write(tui::truncateToWidth(line, box.innerWidth()),
                      rowStyle(selected, active && active->uuid == model.uuid));
    }
}

void Screen::drawStatusLine(ModeController const& state)
{
    auto bar = tui::StatusBar {};
    bar.setBadge(std::string(modeName(state.mode())));
    bar.setMessage(std::string(state.statusLine()));
    if (auto const& model = state.activeModel())
        bar.setRightText(std::format("model: {}", model->name));
    bar.render(_output, _geo.statusRow, _geo.left, _geo.width);
}

void Screen::drawHelp(ModeController const& state)
{
    auto const lines = splitLines(state.helpText());
    auto longest = 0;
    for (auto const line: lines)
        longest = std::max(longest, tui::displayWidth(line));

    auto const box = Box(centeredBox(_output.columns(),
                                     _output.rows(),
                                     longest + 4,
                                     static_cast<int>(lines.size()) + 2,
                                     " Help "));
    box.render(_output);

    auto const count = std::min(static_cast<int>(lines.size()), box.innerHeight());
    for (auto i = 0; i < count; ++i)
    {
        _output.moveTo(box.contentRow() + i, box.contentCol());
        _output.write(tui::truncateToWidth(lines[static_cast<std::size_t>(i)], box.innerWidth()));
    }
}

void Screen::drawTenantPicker(ModeController const& state)
{
    auto const& tenants = state.tenants();
    auto longest = 20;
    for (auto const& name: tenants.items())
        longest = std::max(longest, tui::displayWidth(name) + static_cast<int>(SelectionMarker.size()));

    auto const box = Box(centeredBox(_output.columns(),
                                     _output.rows(),
                                     longest + 4,
                                     static_cast<int>(tenants.size()) + 2,
                                     " Tenants "));
    box.render(_output);

    if (tenants.empty())
    {
        _output.moveTo(box.contentRow(), box.contentCol());
        _output.write(tui::truncateToWidth("No tenants configured", box.innerWidth()), Style { .dim = true });
        return;
    }

    auto const& active = state.activeTenant();
    auto const first = scrollOffset(tenants.selectedIndex(), box.innerHeight());
    auto const last = std::min(tenants.size(), first + static_cast<std::size_t>(box.innerHeight()));
    for (auto i = first; i < last; ++i)
    {
        auto const& name = tenants.items()[i];
        auto const selected = tenants.selectedIndex() == i;
        auto const line = std::format("{}{}", selected ? SelectionMarker : NoMarker, name);
        _output.moveTo(box.contentRow() + static_cast<int>(i - first), box.contentCol());
        _output.write(tui::fitToWidth(line, box.innerWidth()), rowStyle(selected, active && *active == name));
    }
}

void Screen::placeCursor(ModeController const& state)
{
    if (state.mode() != Mode::Search)
        return;

    auto const innerWidth = std::max(0, _geo.width - 4);
    auto const column = std::min(state.searchBuffer().cursorColumn(), std::max(0, innerWidth - 1));
    _output.moveTo(_geo.searchRow + 1, _geo.left + 2 + column);
    _output.showCursor();
}

} // namespace modelmatch
