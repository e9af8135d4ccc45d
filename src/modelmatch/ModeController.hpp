// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <backend/BackendService.hpp>
#include <core/Types.hpp>
#include <modelmatch/HelpCatalog.hpp>
#include <modelmatch/Mode.hpp>
#include <tui/InputEvent.hpp>
#include <tui/SelectableCollection.hpp>
#include <tui/TextEditBuffer.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace modelmatch
{

/// @brief What the event loop should do after an event was handled.
enum class ControllerAction : std::uint8_t
{
    Continue,
    Quit,
};

/// @brief The modal state machine behind the user interface.
///
/// Owns everything the screen shows: the current and previous mode, the status line,
/// the help overlay, the tenant picker, the search text and the folder, model and
/// tenant lists. handle() applies one input event; the accessors give the renderer a
/// read-only view in between.
///
/// Backend failures never end the program. They are logged, shown on the status line,
/// the affected list is emptied and the mode stays as it was.
class ModeController
{
  public:
    /// @param backend Service used for sessions, listings and searches; must outlive the controller.
    /// @param tenants Names offered by the tenant picker.
    /// @param initialMode Mode::Tenant opens with the tenant picker shown.
    explicit ModeController(BackendService& backend,
                            std::vector<std::string> tenants = {},
                            Mode initialMode = Mode::Normal);

    /// @brief Applies one input event to the state.
    /// @return ControllerAction::Quit once the user asked to exit.
    [[nodiscard]] auto handle(tui::InputEvent const& event) -> ControllerAction;

    /// @brief Opens a session for @p tenant and loads its folders.
    /// @return False if the session could not be established.
    auto openSession(std::string_view tenant) -> bool;

    /// @brief Replaces the folder list with a fresh one from the backend.
    ///
    /// Models and the active folder are cleared either way.
    /// @return False if the backend failed; the folder list is then empty.
    auto reloadFolders() -> bool;

    [[nodiscard]] auto mode() const noexcept -> Mode { return _mode; }
    [[nodiscard]] auto previousMode() const noexcept -> Mode { return _previousMode; }
    [[nodiscard]] auto statusLine() const noexcept -> std::string_view { return _status; }
    [[nodiscard]] auto helpVisible() const noexcept -> bool { return _helpVisible; }
    [[nodiscard]] auto helpText() const noexcept -> std::string_view { return _helpText; }
    [[nodiscard]] auto tenantPickerVisible() const noexcept -> bool { return _tenantPickerVisible; }

    [[nodiscard]] auto searchBuffer() const noexcept -> tui::TextEditBuffer const& { return _search; }
    [[nodiscard]] auto folders() const noexcept -> tui::SelectableCollection<Folder> const& { return _folders; }
    [[nodiscard]] auto models() const noexcept -> tui::SelectableCollection<Model> const& { return _models; }
    [[nodiscard]] auto tenants() const noexcept -> tui::SelectableCollection<std::string> const& { return _tenants; }

    [[nodiscard]] auto activeTenant() const noexcept -> std::optional<std::string> const& { return _activeTenant; }
    [[nodiscard]] auto activeFolder() const noexcept -> std::optional<Folder> const& { return _activeFolder; }
    [[nodiscard]] auto activeModel() const noexcept -> std::optional<Model> const& { return _activeModel; }

  private:
    BackendService& _backend;

    Mode _mode;
    Mode _previousMode;
    std::string _status;
    bool _helpVisible = false;
    std::string_view _helpText;
    bool _tenantPickerVisible = false;

    tui::TextEditBuffer _search;
    tui::SelectableCollection<Folder> _folders;
    tui::SelectableCollection<Model> _models;
    tui::SelectableCollection<std::string> _tenants;

    std::optional<std::string> _activeTenant;
    std::optional<Folder> _activeFolder;
    std::optional<Model> _activeModel;

    void changeMode(Mode next);
    void showHelp();
    void closeHelp();
    void clearModels();

    auto handleNormal(tui::KeyEvent const& key) -> ControllerAction;
    void handleSearch(tui::InputEvent const& event, tui::KeyEvent const* key);
    void handleFolder(tui::KeyEvent const& key);
    void handleModel(tui::KeyEvent const& key);
    void handleMatch(tui::KeyEvent const& key);
    void handleTenant(tui::KeyEvent const& key);

    void submitSearch();
    void openSelectedFolder();
    void pickSelectedModel();
    void openSelectedTenant();
};

} // namespace modelmatch
