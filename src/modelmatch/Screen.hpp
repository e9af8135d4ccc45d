// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <modelmatch/ModeController.hpp>
#include <tui/LogPanel.hpp>
#include <tui/TerminalOutput.hpp>

namespace modelmatch
{

/// @brief Draws the whole user interface from a read-only view of the controller.
///
/// Layout, top to bottom inside a rounded frame: the search box, the folder list
/// beside the model table, the log panel and the status line. The help page and
/// the tenant picker are drawn as centered overlays.
class Screen
{
  public:
    static constexpr auto DefaultLogHeight = 10;
    static constexpr auto MinColumns = 40;
    static constexpr auto MinRows = 12;

    explicit Screen(tui::TerminalOutput& output, int logHeight = DefaultLogHeight);

    /// @brief Draws a complete frame into the output buffer without sending it.
    void draw(ModeController const& state, tui::LogPanel const& log);

    /// @brief Draws a complete frame and writes it to the terminal.
    /// @return IoError if the frame could not be written.
    [[nodiscard]] auto render(ModeController const& state, tui::LogPanel const& log) -> VoidResult;

  private:
    struct Geometry
    {
        int left = 0;
        int width = 0;
        int searchRow = 0;
        int listsRow = 0;
        int listsHeight = 0;
        int foldersWidth = 0;
        int logRow = 0;
        int logHeight = 0;
        int statusRow = 0;
    };

    tui::TerminalOutput& _output;
    int _logHeight;
    Geometry _geo;

    void computeGeometry();
    void drawFrame(ModeController const& state);
    void drawSearchBox(ModeController const& state);
    void drawFolders(ModeController const& state);
    void drawModels(ModeController const& state);
    void drawStatusLine(ModeController const& state);
    void drawHelp(ModeController const& state);
    void drawTenantPicker(ModeController const& state);
    void placeCursor(ModeController const& state);
};

} // namespace modelmatch
