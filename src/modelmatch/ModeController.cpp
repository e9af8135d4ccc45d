// SPDX-License-Identifier: Apache-2.0
#include <modelmatch/ModeController.hpp>
#include <modelmatch/StatusPresenter.hpp>

#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace modelmatch
{

using tui::KeyCode;
using tui::KeyEvent;

namespace
{
    auto isHelpKey(KeyEvent const& key) -> bool
    {
        return tui::isChar(key, U'h') || tui::isKey(key, KeyCode::F1);
    }

    /// Plain `h` types text in Search mode, so help needs a chord there.
    auto isSearchHelpKey(KeyEvent const& key) -> bool
    {
        return (key.key == tui::keyCodeFromCodepoint(U'h') && key.modifiers == tui::Modifier::Alt)
               || tui::isKey(key, KeyCode::F1);
    }
} // namespace

ModeController::ModeController(BackendService& backend, std::vector<std::string> tenants, Mode initialMode):
    _backend(backend),
    _mode(initialMode == Mode::Help ? Mode::Normal : initialMode),
    _previousMode(_mode),
    _status(hintFor(_mode)),
    _tenantPickerVisible(_mode == Mode::Tenant),
    _tenants(std::move(tenants))
{
}

auto ModeController::handle(tui::InputEvent const& event) -> ControllerAction
{
    auto const* key = std::get_if<KeyEvent>(&event);

    if (_mode == Mode::Search)
    {
        handleSearch(event, key);
        return ControllerAction::Continue;
    }

    // Everything below reacts to keys only.
    if (key == nullptr)
        return ControllerAction::Continue;

    switch (_mode)
    {
        case Mode::Normal: return handleNormal(*key);
        case Mode::Folder: handleFolder(*key); break;
        case Mode::Model: handleModel(*key); break;
        case Mode::Match: handleMatch(*key); break;
        case Mode::Tenant: handleTenant(*key); break;
        case Mode::Help: closeHelp(); break;
        case Mode::Search: break;
    }
    return ControllerAction::Continue;
}

auto ModeController::openSession(std::string_view tenant) -> bool
{
    if (auto session = _backend.establishSession(tenant); !session)
    {
        _activeTenant.reset();
        _folders.clear();
        clearModels();
        log::error("Failed to open a session for tenant '{}': {}", tenant, session.error());
        _status = std::format("Failed to open a session for tenant '{}': {}", tenant, session.error().message);
        return false;
    }

    _activeTenant = std::string(tenant);
    if (reloadFolders())
        _status = std::format("Connected to tenant '{}' ({} folders)", tenant, _folders.size());
    return true;
}

auto ModeController::reloadFolders() -> bool
{
    clearModels();

    auto folders = _backend.listFolders();
    if (!folders)
    {
        _folders.clear();
        log::error("Failed to list folders: {}", folders.error());
        _status = std::format("Failed to list folders: {}", folders.error().message);
        return false;
    }

    log::info("Loaded {} folders", folders->size());
    _status = std::format("Loaded {} folders", folders->size());
    _folders.replaceAll(std::move(*folders));
    return true;
}

void ModeController::changeMode(Mode next)
{
    log::debug("Change mode from {} to {}", _mode, next);
    _previousMode = _mode;
    _mode = next;
    _status = hintFor(next);
}

/// Opens the help page of the current mode.
void ModeController::showHelp()
{
    auto const topic = helpTopicFor(_mode);
    if (!topic)
        return;

    _helpText = modelmatch::helpText(*topic);
    _helpVisible = true;
    changeMode(Mode::Help);
}

void ModeController::closeHelp()
{
    log::debug("Change mode from {} to {}", _mode, _previousMode);
    _helpVisible = false;
    _helpText = {};
    _mode = _previousMode;
    _status = hintFor(_mode);
}

void ModeController::clearModels()
{
    _models.clear();
    _activeFolder.reset();
    _activeModel.reset();
}

auto ModeController::handleNormal(KeyEvent const& key) -> ControllerAction
{
    if (tui::isChar(key, U'q'))
    {
        log::debug("Exit requested");
        return ControllerAction::Quit;
    }

    if (tui::isChar(key, U'f') || tui::isKey(key, KeyCode::Tab))
        changeMode(Mode::Folder);
    else if (tui::isChar(key, U's'))
        changeMode(Mode::Search);
    else if (tui::isChar(key, U'm'))
        changeMode(Mode::Model);
    else if (tui::isChar(key, U'c'))
        changeMode(Mode::Match);
    else if (isHelpKey(key))
        showHelp();
    else if (tui::isChar(key, U't'))
    {
        if (auto const& active = _activeTenant; active && !_tenants.selectedIndex())
        {
            auto const& names = _tenants.items();
            if (auto const it = std::ranges::find(names, *active); it != names.end())
                _tenants.select(static_cast<std::size_t>(it - names.begin()));
        }
        _tenantPickerVisible = true;
        changeMode(Mode::Tenant);
    }
    else
    {
        log::debug("Unsupported key binding in Normal mode: {}", tui::describeKey(key));
        _status = genericHint();
    }
    return ControllerAction::Continue;
}

void ModeController::handleSearch(tui::InputEvent const& event, KeyEvent const* key)
{
    if (key != nullptr)
    {
        if (tui::isKey(*key, KeyCode::Escape))
        {
            changeMode(Mode::Normal);
            return;
        }
        if (tui::isKey(*key, KeyCode::Enter))
        {
            submitSearch();
            return;
        }
        if (isSearchHelpKey(*key))
        {
            showHelp();
            return;
        }
    }

    static_cast<void>(_search.processEvent(event));
}

void ModeController::handleFolder(KeyEvent const& key)
{
    if (tui::isKey(key, KeyCode::Escape))
        changeMode(Mode::Normal);
    else if (tui::isKey(key, KeyCode::Tab))
        changeMode(Mode::Model);
    else if (isHelpKey(key))
        showHelp();
    else if (tui::isChar(key, U'r'))
        reloadFolders();
    else if (tui::isKey(key, KeyCode::Enter))
        openSelectedFolder();
    else
        static_cast<void>(_folders.processEvent(key));
}

void ModeController::handleModel(KeyEvent const& key)
{
    if (tui::isKey(key, KeyCode::Escape))
        changeMode(Mode::Normal);
    else if (tui::isKey(key, KeyCode::Tab))
        changeMode(Mode::Folder);
    else if (isHelpKey(key))
        showHelp();
    else if (tui::isKey(key, KeyCode::Enter))
        pickSelectedModel();
    else
        static_cast<void>(_models.processEvent(key));
}

void ModeController::handleMatch(KeyEvent const& key)
{
    if (tui::isKey(key, KeyCode::Escape))
        changeMode(Mode::Normal);
    else if (isHelpKey(key))
        showHelp();
}

void ModeController::handleTenant(KeyEvent const& key)
{
    if (tui::isKey(key, KeyCode::Escape))
    {
        _tenantPickerVisible = false;
        changeMode(Mode::Normal);
    }
    else if (isHelpKey(key))
        showHelp();
    else if (tui::isKey(key, KeyCode::Enter))
        openSelectedTenant();
    else
        static_cast<void>(_tenants.processEvent(key));
}

void ModeController::submitSearch()
{
    auto const query = _search.text();
    if (auto submitted = _backend.submitSearch(query); !submitted)
    {
        log::error("Search for \"{}\" failed: {}", query, submitted.error());
        _status = std::format("Search failed: {}", submitted.error().message);
        return;
    }

    changeMode(Mode::Normal);
    log::debug("Execute search on \"{}\"", query);
    _status = std::format("Execute search on \"{}\"", query);
}

void ModeController::openSelectedFolder()
{
    auto const selected = _folders.selectedItem();
    if (!selected)
    {
        clearModels();
        log::warning("No folder selected");
        _status = "No folder selected";
        return;
    }

    auto const folder = **selected;
    auto models = _backend.listModels({ folder.id });
    if (!models)
    {
        clearModels();
        log::error("Failed to list models of folder {}: {}", folder.id, models.error());
        _status = std::format("Failed to list models of folder '{}': {}", folder.name, models.error().message);
        return;
    }

    log::info("Loaded {} models from folder {}: {}", models->size(), folder.id, folder.name);
    _status = std::format("{} models in folder '{}'", models->size(), folder.name);
    _models.replaceAll(std::move(*models));
    _activeFolder = folder;
    _activeModel.reset();
}

void ModeController::pickSelectedModel()
{
    auto const selected = _models.selectedItem();
    if (!selected)
    {
        log::warning("No model selected");
        _status = "No model selected";
        return;
    }

    _activeModel = **selected;
    log::info("Selected model {} ({})", _activeModel->name, _activeModel->uuid);
    _status = std::format("Selected model '{}'", _activeModel->name);
}

void ModeController::openSelectedTenant()
{
    auto const selected = _tenants.selectedItem();
    if (!selected)
    {
        log::warning("No tenant selected");
        _status = "No tenant selected";
        return;
    }

    auto const tenant = **selected;
    if (!openSession(tenant))
        return;

    auto report = std::move(_status);
    _tenantPickerVisible = false;
    changeMode(Mode::Normal);
    _status = std::move(report);
}

} // namespace modelmatch
