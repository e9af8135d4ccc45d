// SPDX-License-Identifier: Apache-2.0
#include <backend/RpcBackend.hpp>
#include <modelmatch/HelpCatalog.hpp>
#include <modelmatch/ModeController.hpp>
#include <modelmatch/StatusPresenter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <map>
#include <memory>
#include <optional>
#include <queue>
#include <set>
#include <string>
#include <vector>

using namespace modelmatch;
using tui::InputEvent;
using tui::KeyCode;
using tui::KeyEvent;
using tui::Modifier;

namespace
{

/// @brief In-memory BackendService recording every call.
class FakeBackend: public BackendService
{
  public:
    std::vector<Folder> folders;
    std::map<std::int64_t, std::vector<Model>> modelsByFolder;

    std::optional<Error> folderError;
    std::optional<Error> modelError;
    std::optional<Error> sessionError;
    std::optional<Error> searchError;

    int folderRequests = 0;
    std::vector<std::set<std::int64_t>> modelRequests;
    std::vector<std::string> sessions;
    std::vector<std::string> searches;

    auto listFolders() -> Result<std::vector<Folder>> override
    {
        ++folderRequests;
        if (folderError)
            return std::unexpected(*folderError);
        return folders;
    }

    auto listModels(std::set<std::int64_t> const& folderIds) -> Result<std::vector<Model>> override
    {
        modelRequests.push_back(folderIds);
        if (modelError)
            return std::unexpected(*modelError);
        auto result = std::vector<Model> {};
        for (auto const id: folderIds)
            if (auto const it = modelsByFolder.find(id); it != modelsByFolder.end())
                result.insert(result.end(), it->second.begin(), it->second.end());
        return result;
    }

    auto establishSession(std::string_view tenant) -> VoidResult override
    {
        sessions.emplace_back(tenant);
        if (sessionError)
            return std::unexpected(*sessionError);
        return {};
    }

    auto submitSearch(std::string_view query) -> VoidResult override
    {
        searches.emplace_back(query);
        if (searchError)
            return std::unexpected(*searchError);
        return {};
    }
};

/// @brief Transport replaying canned replies, for driving a real RpcBackend.
class ReplayTransport: public Transport
{
  public:
    std::queue<nlohmann::json> replies;

    auto send(const nlohmann::json& /*message*/) -> VoidResult override { return {}; }

    auto receive() -> Result<nlohmann::json> override
    {
        if (replies.empty())
            return makeError(ErrorCode::TransportError, "No more replies");
        auto reply = replies.front();
        replies.pop();
        return reply;
    }

    void close() override {}
    auto isConnected() const -> bool override { return true; }
};

auto charKey(char32_t ch, Modifier mods = Modifier::None) -> InputEvent
{
    return KeyEvent { .key = tui::keyCodeFromCodepoint(ch), .modifiers = mods, .codepoint = ch };
}

auto namedKey(KeyCode key, Modifier mods = Modifier::None) -> InputEvent
{
    return KeyEvent { .key = key, .modifiers = mods };
}

void press(ModeController& controller, InputEvent const& event)
{
    REQUIRE(controller.handle(event) == ControllerAction::Continue);
}

void type(ModeController& controller, std::u32string_view text)
{
    for (auto const ch: text)
        press(controller, charKey(ch));
}

auto sampleBackend() -> FakeBackend
{
    auto backend = FakeBackend {};
    backend.folders = { { .id = 1, .name = "Engines" }, { .id = 2, .name = "Gearboxes" } };
    backend.modelsByFolder[1] = {
        { .uuid = "0b7e-1", .name = "Piston", .state = ModelState::Ready },
        { .uuid = "0b7e-2", .name = "Crankshaft", .state = ModelState::Indexing },
    };
    backend.modelsByFolder[2] = { { .uuid = "9f00-1", .name = "Clutch", .state = ModelState::Received } };
    return backend;
}

auto backendError(std::string message) -> Error
{
    return Error { .code = ErrorCode::BackendError, .message = std::move(message) };
}

} // namespace

TEST_CASE("ModeController starts in Normal mode", "[controller]")
{
    auto backend = FakeBackend {};
    auto const controller = ModeController(backend);

    CHECK(controller.mode() == Mode::Normal);
    CHECK(controller.previousMode() == Mode::Normal);
    CHECK(controller.statusLine() == hintFor(Mode::Normal));
    CHECK(!controller.helpVisible());
    CHECK(!controller.tenantPickerVisible());
    CHECK(controller.searchBuffer().empty());
    CHECK(controller.folders().empty());
    CHECK(controller.models().empty());
    CHECK(!controller.activeTenant());
}

TEST_CASE("ModeController initial mode", "[controller]")
{
    auto backend = FakeBackend {};

    SECTION("Tenant shows the picker")
    {
        auto const controller = ModeController(backend, { "acme" }, Mode::Tenant);
        CHECK(controller.mode() == Mode::Tenant);
        CHECK(controller.tenantPickerVisible());
        CHECK(controller.statusLine() == hintFor(Mode::Tenant));
    }

    SECTION("Help falls back to Normal")
    {
        auto const controller = ModeController(backend, {}, Mode::Help);
        CHECK(controller.mode() == Mode::Normal);
        CHECK(!controller.helpVisible());
    }
}

TEST_CASE("ModeController quits on q in Normal mode", "[controller]")
{
    auto backend = FakeBackend {};
    auto controller = ModeController(backend);

    CHECK(controller.handle(charKey(U'q')) == ControllerAction::Quit);
}

TEST_CASE("ModeController Normal mode transitions", "[controller]")
{
    auto backend = FakeBackend {};
    auto controller = ModeController(backend);

    auto const expectTransition = [&](InputEvent const& key, Mode expected) {
        press(controller, key);
        CHECK(controller.mode() == expected);
        CHECK(controller.previousMode() == Mode::Normal);
        CHECK(controller.statusLine() == hintFor(expected));
    };

    SECTION("f") { expectTransition(charKey(U'f'), Mode::Folder); }
    SECTION("Tab") { expectTransition(namedKey(KeyCode::Tab), Mode::Folder); }
    SECTION("s") { expectTransition(charKey(U's'), Mode::Search); }
    SECTION("m") { expectTransition(charKey(U'm'), Mode::Model); }
    SECTION("c") { expectTransition(charKey(U'c'), Mode::Match); }
    SECTION("t")
    {
        expectTransition(charKey(U't'), Mode::Tenant);
        CHECK(controller.tenantPickerVisible());
    }
    SECTION("h")
    {
        expectTransition(charKey(U'h'), Mode::Help);
        CHECK(controller.helpVisible());
        CHECK(controller.helpText() == helpText(HelpTopic::Normal));
    }
    SECTION("F1")
    {
        expectTransition(namedKey(KeyCode::F1), Mode::Help);
        CHECK(controller.helpText() == helpText(HelpTopic::Normal));
    }
}

TEST_CASE("ModeController shows the generic hint for unbound keys", "[controller]")
{
    auto backend = FakeBackend {};
    auto controller = ModeController(backend);

    SECTION("unbound letter") { press(controller, charKey(U'x')); }
    SECTION("modified quit key") { press(controller, charKey(U'q', Modifier::Ctrl)); }
    SECTION("Enter") { press(controller, namedKey(KeyCode::Enter)); }

    CHECK(controller.mode() == Mode::Normal);
    CHECK(controller.statusLine() == genericHint());
}

TEST_CASE("ModeController Folder help round trip", "[controller]")
{
    auto backend = FakeBackend {};
    auto controller = ModeController(backend);

    press(controller, charKey(U'f'));
    CHECK(controller.mode() == Mode::Folder);
    CHECK(controller.previousMode() == Mode::Normal);
    CHECK(controller.statusLine() == hintFor(Mode::Folder));

    press(controller, charKey(U'h'));
    CHECK(controller.mode() == Mode::Help);
    CHECK(controller.previousMode() == Mode::Folder);
    CHECK(controller.helpVisible());
    CHECK(controller.helpText() == helpText(HelpTopic::Folder));

    press(controller, charKey(U'z'));
    CHECK(controller.mode() == Mode::Folder);
    CHECK(!controller.helpVisible());
    CHECK(controller.statusLine() == hintFor(Mode::Folder));
}

TEST_CASE("ModeController help restores every mode it was opened from", "[controller]")
{
    auto backend = FakeBackend {};
    auto controller = ModeController(backend, { "acme" });

    struct Case
    {
        InputEvent enter;
        Mode mode;
        InputEvent help;
        HelpTopic topic;
    };

    auto const cases = std::vector<Case> {
        { charKey(U'x'), Mode::Normal, charKey(U'h'), HelpTopic::Normal },
        { charKey(U's'), Mode::Search, charKey(U'h', Modifier::Alt), HelpTopic::Search },
        { charKey(U'f'), Mode::Folder, namedKey(KeyCode::F1), HelpTopic::Folder },
        { charKey(U'm'), Mode::Model, charKey(U'h'), HelpTopic::Model },
        { charKey(U'c'), Mode::Match, charKey(U'h'), HelpTopic::Match },
        { charKey(U't'), Mode::Tenant, charKey(U'h'), HelpTopic::Tenant },
    };

    for (auto const& c: cases)
    {
        press(controller, c.enter);
        REQUIRE(controller.mode() == c.mode);

        press(controller, c.help);
        CHECK(controller.mode() == Mode::Help);
        CHECK(controller.previousMode() == c.mode);
        CHECK(controller.helpText() == helpText(c.topic));
        CHECK(helpTopicFor(c.mode) == c.topic);

        press(controller, namedKey(KeyCode::Enter));
        CHECK(controller.mode() == c.mode);
        CHECK(!controller.helpVisible());

        if (c.mode != Mode::Normal)
            press(controller, namedKey(KeyCode::Escape));
        REQUIRE(controller.mode() == Mode::Normal);
    }
}

TEST_CASE("ModeController Help ignores paste and resize events", "[controller]")
{
    auto backend = FakeBackend {};
    auto controller = ModeController(backend);

    press(controller, charKey(U'h'));
    press(controller, tui::PasteEvent { .text = "clipboard" });
    press(controller, tui::ResizeEvent { .columns = 100, .rows = 40 });
    CHECK(controller.mode() == Mode::Help);
    CHECK(controller.helpVisible());
}

TEST_CASE("ModeController Search mode edits the buffer", "[controller]")
{
    auto backend = FakeBackend {};
    auto controller = ModeController(backend);
    press(controller, charKey(U's'));

    SECTION("letters that are bindings elsewhere are text here")
    {
        type(controller, U"qhfs");
        CHECK(controller.mode() == Mode::Search);
        CHECK(controller.searchBuffer().text() == "qhfs");
    }

    SECTION("editing keys")
    {
        type(controller, U"pumq");
        press(controller, namedKey(KeyCode::Backspace));
        press(controller, namedKey(KeyCode::Left));
        press(controller, namedKey(KeyCode::Left));
        press(controller, charKey(U'x'));
        press(controller, namedKey(KeyCode::Delete));
        press(controller, namedKey(KeyCode::End));
        press(controller, charKey(U'p'));
        CHECK(controller.searchBuffer().text() == "pxmp");
        CHECK(controller.searchBuffer().cursor() == 4);
    }

    SECTION("paste")
    {
        press(controller, tui::PasteEvent { .text = "gear box" });
        CHECK(controller.searchBuffer().text() == "gear box");
    }

    SECTION("Escape keeps the text")
    {
        type(controller, U"valve");
        press(controller, namedKey(KeyCode::Escape));
        CHECK(controller.mode() == Mode::Normal);
        CHECK(controller.searchBuffer().text() == "valve");
        CHECK(backend.searches.empty());
    }
}

TEST_CASE("ModeController submits searches", "[controller]")
{
    auto backend = FakeBackend {};
    auto controller = ModeController(backend);
    press(controller, charKey(U's'));
    type(controller, U"pump");

    SECTION("success returns to Normal")
    {
        press(controller, namedKey(KeyCode::Enter));
        REQUIRE(backend.searches == std::vector<std::string> { "pump" });
        CHECK(controller.mode() == Mode::Normal);
        CHECK(controller.previousMode() == Mode::Search);
        CHECK(controller.statusLine() == "Execute search on \"pump\"");
    }

    SECTION("failure stays in Search")
    {
        backend.searchError = backendError("Index offline");
        press(controller, namedKey(KeyCode::Enter));
        CHECK(controller.mode() == Mode::Search);
        CHECK(controller.statusLine() == "Search failed: Index offline");
        CHECK(controller.searchBuffer().text() == "pump");
    }
}

TEST_CASE("ModeController ignores paste outside Search mode", "[controller]")
{
    auto backend = FakeBackend {};
    auto controller = ModeController(backend);

    press(controller, tui::PasteEvent { .text = "q" });
    CHECK(controller.mode() == Mode::Normal);
    CHECK(controller.searchBuffer().empty());
    CHECK(controller.statusLine() == hintFor(Mode::Normal));
}

TEST_CASE("ModeController reloadFolders", "[controller]")
{
    auto backend = sampleBackend();
    auto controller = ModeController(backend);

    SECTION("success")
    {
        CHECK(controller.reloadFolders());
        CHECK(controller.folders().items() == backend.folders);
        CHECK(!controller.folders().selectedIndex());
        CHECK(controller.statusLine() == "Loaded 2 folders");
    }

    SECTION("failure empties the list")
    {
        REQUIRE(controller.reloadFolders());
        backend.folderError = backendError("Session expired");
        CHECK(!controller.reloadFolders());
        CHECK(controller.folders().empty());
        CHECK(controller.statusLine() == "Failed to list folders: Session expired");
        CHECK(controller.mode() == Mode::Normal);
    }
}

TEST_CASE("ModeController Folder mode", "[controller]")
{
    auto backend = sampleBackend();
    auto controller = ModeController(backend);
    REQUIRE(controller.reloadFolders());
    press(controller, charKey(U'f'));

    SECTION("Enter without a selection")
    {
        press(controller, namedKey(KeyCode::Enter));
        CHECK(controller.statusLine() == "No folder selected");
        CHECK(controller.models().empty());
        CHECK(!controller.activeFolder());
        CHECK(controller.mode() == Mode::Folder);
        CHECK(backend.modelRequests.empty());
    }

    SECTION("navigation and Enter load the models")
    {
        press(controller, namedKey(KeyCode::Down));
        press(controller, namedKey(KeyCode::Down));
        REQUIRE(controller.folders().selectedIndex() == 1u);
        press(controller, namedKey(KeyCode::Up));
        REQUIRE(controller.folders().selectedIndex() == 0u);

        press(controller, namedKey(KeyCode::Enter));
        REQUIRE(backend.modelRequests.size() == 1);
        CHECK(backend.modelRequests.front() == std::set<std::int64_t> { 1 });
        CHECK(controller.models().size() == 2);
        CHECK(!controller.models().selectedIndex());
        REQUIRE(controller.activeFolder());
        CHECK(controller.activeFolder()->name == "Engines");
        CHECK(controller.statusLine() == "2 models in folder 'Engines'");
        CHECK(controller.mode() == Mode::Folder);
    }

    SECTION("End wraps navigation")
    {
        press(controller, namedKey(KeyCode::End));
        CHECK(controller.folders().selectedIndex() == 1u);
        press(controller, namedKey(KeyCode::Down));
        CHECK(controller.folders().selectedIndex() == 0u);
        press(controller, namedKey(KeyCode::Home));
        CHECK(controller.folders().selectedIndex() == 0u);
    }

    SECTION("backend error clears the models")
    {
        press(controller, namedKey(KeyCode::Down));
        press(controller, namedKey(KeyCode::Enter));
        REQUIRE(controller.models().size() == 2);

        backend.modelError = backendError("Folder locked");
        press(controller, namedKey(KeyCode::Enter));
        CHECK(controller.models().empty());
        CHECK(!controller.activeFolder());
        CHECK(controller.statusLine() == "Failed to list models of folder 'Engines': Folder locked");
        CHECK(controller.mode() == Mode::Folder);
    }

    SECTION("r reloads the folders and drops the models")
    {
        press(controller, namedKey(KeyCode::Down));
        press(controller, namedKey(KeyCode::Enter));
        REQUIRE(!controller.models().empty());

        backend.folders.push_back({ .id = 3, .name = "Pumps" });
        press(controller, charKey(U'r'));
        CHECK(backend.folderRequests == 2);
        CHECK(controller.folders().size() == 3);
        CHECK(controller.models().empty());
        CHECK(!controller.activeFolder());
        CHECK(controller.mode() == Mode::Folder);
    }

    SECTION("Tab switches to Model and back")
    {
        press(controller, namedKey(KeyCode::Tab));
        CHECK(controller.mode() == Mode::Model);
        CHECK(controller.previousMode() == Mode::Folder);
        press(controller, namedKey(KeyCode::Tab));
        CHECK(controller.mode() == Mode::Folder);
    }

    SECTION("Escape returns to Normal")
    {
        press(controller, namedKey(KeyCode::Escape));
        CHECK(controller.mode() == Mode::Normal);
        CHECK(controller.statusLine() == hintFor(Mode::Normal));
    }
}

TEST_CASE("ModeController Folder mode with an empty model list", "[controller]")
{
    auto backend = FakeBackend {};
    auto controller = ModeController(backend);
    press(controller, charKey(U'f'));

    press(controller, namedKey(KeyCode::Enter));
    CHECK(controller.statusLine() == "No folder selected");
    CHECK(controller.models().empty());
    CHECK(controller.mode() == Mode::Folder);
}

TEST_CASE("ModeController Model mode", "[controller]")
{
    auto backend = sampleBackend();
    auto controller = ModeController(backend);
    REQUIRE(controller.reloadFolders());
    press(controller, charKey(U'f'));
    press(controller, namedKey(KeyCode::Down));
    press(controller, namedKey(KeyCode::Enter));
    press(controller, namedKey(KeyCode::Tab));
    REQUIRE(controller.mode() == Mode::Model);

    SECTION("Enter without a selection")
    {
        press(controller, namedKey(KeyCode::Enter));
        CHECK(controller.statusLine() == "No model selected");
        CHECK(!controller.activeModel());
        CHECK(controller.mode() == Mode::Model);
    }

    SECTION("Enter picks the selected model")
    {
        press(controller, namedKey(KeyCode::Up));
        REQUIRE(controller.models().selectedIndex() == 0u);
        press(controller, namedKey(KeyCode::Down));
        press(controller, namedKey(KeyCode::Enter));
        REQUIRE(controller.activeModel());
        CHECK(controller.activeModel()->name == "Crankshaft");
        CHECK(controller.statusLine() == "Selected model 'Crankshaft'");
    }

    SECTION("unbound keys change nothing")
    {
        press(controller, charKey(U'q'));
        CHECK(controller.mode() == Mode::Model);
        CHECK(controller.statusLine() == hintFor(Mode::Model));
    }
}

TEST_CASE("ModeController Match mode", "[controller]")
{
    auto backend = FakeBackend {};
    auto controller = ModeController(backend);
    press(controller, charKey(U'c'));

    press(controller, charKey(U'q'));
    press(controller, namedKey(KeyCode::Enter));
    CHECK(controller.mode() == Mode::Match);

    press(controller, namedKey(KeyCode::Escape));
    CHECK(controller.mode() == Mode::Normal);
    CHECK(controller.previousMode() == Mode::Match);
}

TEST_CASE("ModeController Tenant mode", "[controller]")
{
    auto backend = sampleBackend();
    auto controller = ModeController(backend, { "acme", "globex" });
    press(controller, charKey(U't'));
    REQUIRE(controller.mode() == Mode::Tenant);
    REQUIRE(controller.tenantPickerVisible());

    SECTION("Enter without a selection")
    {
        press(controller, namedKey(KeyCode::Enter));
        CHECK(controller.statusLine() == "No tenant selected");
        CHECK(controller.mode() == Mode::Tenant);
        CHECK(controller.tenantPickerVisible());
        CHECK(backend.sessions.empty());
    }

    SECTION("Enter opens a session and loads the folders")
    {
        press(controller, namedKey(KeyCode::Down));
        press(controller, namedKey(KeyCode::Down));
        press(controller, namedKey(KeyCode::Enter));

        CHECK(backend.sessions == std::vector<std::string> { "globex" });
        CHECK(backend.folderRequests == 1);
        CHECK(controller.mode() == Mode::Normal);
        CHECK(!controller.tenantPickerVisible());
        REQUIRE(controller.activeTenant());
        CHECK(*controller.activeTenant() == "globex");
        CHECK(controller.folders().size() == 2);
        CHECK(controller.models().empty());
        CHECK(controller.statusLine() == "Connected to tenant 'globex' (2 folders)");
    }

    SECTION("session error keeps the picker open")
    {
        backend.sessionError = backendError("Unknown tenant");
        press(controller, namedKey(KeyCode::Down));
        press(controller, namedKey(KeyCode::Enter));

        CHECK(controller.mode() == Mode::Tenant);
        CHECK(controller.tenantPickerVisible());
        CHECK(!controller.activeTenant());
        CHECK(controller.folders().empty());
        CHECK(controller.statusLine() == "Failed to open a session for tenant 'acme': Unknown tenant");
        CHECK(backend.folderRequests == 0);
    }

    SECTION("Escape hides the picker")
    {
        press(controller, namedKey(KeyCode::Escape));
        CHECK(controller.mode() == Mode::Normal);
        CHECK(!controller.tenantPickerVisible());
        CHECK(backend.sessions.empty());
    }
}

TEST_CASE("ModeController preselects the active tenant", "[controller]")
{
    auto backend = sampleBackend();
    auto controller = ModeController(backend, { "acme", "globex", "initech" });
    REQUIRE(controller.openSession("initech"));
    CHECK(controller.statusLine() == "Connected to tenant 'initech' (2 folders)");

    press(controller, charKey(U't'));
    CHECK(controller.tenants().selectedIndex() == 2u);
}

TEST_CASE("ModeController openSession reports folder errors after connecting", "[controller]")
{
    auto backend = sampleBackend();
    backend.folderError = backendError("Quota exceeded");
    auto controller = ModeController(backend, { "acme" }, Mode::Tenant);

    press(controller, namedKey(KeyCode::Down));
    press(controller, namedKey(KeyCode::Enter));

    CHECK(controller.mode() == Mode::Normal);
    REQUIRE(controller.activeTenant());
    CHECK(controller.folders().empty());
    CHECK(controller.statusLine() == "Failed to list folders: Quota exceeded");
}

TEST_CASE("ModeController ignores resize events", "[controller]")
{
    auto backend = sampleBackend();
    auto controller = ModeController(backend);
    REQUIRE(controller.reloadFolders());
    press(controller, charKey(U'f'));
    press(controller, namedKey(KeyCode::Down));

    press(controller, tui::ResizeEvent { .columns = 120, .rows = 50 });
    CHECK(controller.mode() == Mode::Folder);
    CHECK(controller.folders().selectedIndex() == 0u);
    CHECK(controller.statusLine() == hintFor(Mode::Folder));
}

TEST_CASE("ModeController survives a malformed backend reply", "[controller]")
{
    auto transport = std::make_unique<ReplayTransport>();
    auto& replies = transport->replies;
    replies.push({ { "jsonrpc", "2.0" }, { "id", 1 }, { "result", nlohmann::json::object() } });
    replies.push({ { "jsonrpc", "2.0" },
                   { "id", 2 },
                   { "result", { { "folders", nlohmann::json::array({ { { "id", 1 }, { "name", "Engines" } } }) } } } });
    replies.push({ { "jsonrpc", "2.0" }, { "id", 3 }, { "error", { { "code", "E42" }, { "message", nullptr } } } });

    auto backend = RpcBackend(std::move(transport));
    REQUIRE(backend.initialize().has_value());

    auto controller = ModeController(backend);
    REQUIRE(controller.reloadFolders());
    REQUIRE(controller.folders().size() == 1);

    press(controller, charKey(U'f'));
    press(controller, charKey(U'r'));

    CHECK(controller.mode() == Mode::Folder);
    CHECK(controller.folders().empty());
    CHECK(controller.statusLine().starts_with("Failed to list folders: "));
}
