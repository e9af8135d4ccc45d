// SPDX-License-Identifier: Apache-2.0
#include <modelmatch/Screen.hpp>

#include <catch2/catch_test_macros.hpp>

#include <map>
#include <set>
#include <string>
#include <vector>

using namespace modelmatch;
using tui::InputEvent;
using tui::KeyCode;
using tui::KeyEvent;

namespace
{

class FakeBackend: public BackendService
{
  public:
    std::vector<Folder> folders = { { .id = 1, .name = "Engines" }, { .id = 2, .name = "Gearboxes" } };
    std::map<std::int64_t, std::vector<Model>> modelsByFolder = {
        { 1,
          {
              { .uuid = "0b7e-1", .name = "Piston", .state = ModelState::Ready },
              { .uuid = "0b7e-2", .name = "Crankshaft", .state = ModelState::Indexing },
          } },
    };

    auto listFolders() -> Result<std::vector<Folder>> override { return folders; }

    auto listModels(std::set<std::int64_t> const& folderIds) -> Result<std::vector<Model>> override
    {
        auto result = std::vector<Model> {};
        for (auto const id: folderIds)
            if (auto const it = modelsByFolder.find(id); it != modelsByFolder.end())
                result.insert(result.end(), it->second.begin(), it->second.end());
        return result;
    }

    auto establishSession(std::string_view /*tenant*/) -> VoidResult override { return {}; }
    auto submitSearch(std::string_view /*query*/) -> VoidResult override { return {}; }
};

auto charKey(char32_t ch) -> InputEvent
{
    return KeyEvent { .key = tui::keyCodeFromCodepoint(ch), .codepoint = ch };
}

auto namedKey(KeyCode key) -> InputEvent
{
    return KeyEvent { .key = key };
}

void press(ModeController& controller, InputEvent const& event)
{
    REQUIRE(controller.handle(event) == ControllerAction::Continue);
}

auto contains(std::string_view haystack, std::string_view needle) -> bool
{
    return haystack.find(needle) != std::string_view::npos;
}

/// @brief Renders one frame of a 100x40 terminal into a string.
struct ScreenFixture
{
    FakeBackend backend;
    tui::TerminalOutput output;
    tui::LogPanel log;

    ScreenFixture() { output.setDimensions(100, 40); }

    auto draw(ModeController const& controller, int logHeight = Screen::DefaultLogHeight) -> std::string
    {
        output.discard();
        auto screen = Screen(output, logHeight);
        screen.draw(controller, log);
        return std::string(output.pending());
    }
};

} // namespace

TEST_CASE("Screen draws the main layout", "[screen]")
{
    auto fixture = ScreenFixture {};
    auto controller = ModeController(fixture.backend);
    REQUIRE(controller.reloadFolders());

    auto const frame = fixture.draw(controller);
    CHECK(frame.starts_with("\033[?25l\033[2J\033[H"));
    CHECK(contains(frame, " modelmatch "));
    CHECK(contains(frame, " Search "));
    CHECK(contains(frame, " Folders (2) "));
    CHECK(contains(frame, "   1: Engines"));
    CHECK(contains(frame, "   2: Gearboxes"));
    CHECK(contains(frame, " Models "));
    CHECK(contains(frame, "UUID"));
    CHECK(contains(frame, " Normal "));
    CHECK(contains(frame, "Loaded 2 folders"));
    CHECK(!contains(frame, "\033[?25h"));
}

TEST_CASE("Screen marks the selected folder", "[screen]")
{
    auto fixture = ScreenFixture {};
    auto controller = ModeController(fixture.backend);
    REQUIRE(controller.reloadFolders());
    press(controller, charKey(U'f'));
    press(controller, namedKey(KeyCode::Down));

    auto const frame = fixture.draw(controller);
    CHECK(contains(frame, "-> 1: Engines"));
    CHECK(contains(frame, "   2: Gearboxes"));
    CHECK(contains(frame, " Folder "));
}

TEST_CASE("Screen lists the models of the opened folder", "[screen]")
{
    auto fixture = ScreenFixture {};
    auto controller = ModeController(fixture.backend);
    REQUIRE(controller.reloadFolders());
    press(controller, charKey(U'f'));
    press(controller, namedKey(KeyCode::Down));
    press(controller, namedKey(KeyCode::Enter));

    auto frame = fixture.draw(controller);
    CHECK(contains(frame, " Models in Engines (2) "));
    CHECK(contains(frame, "Piston"));
    CHECK(contains(frame, "Crankshaft"));
    CHECK(contains(frame, "ready"));
    CHECK(contains(frame, "indexing"));
    CHECK(!contains(frame, "model: "));

    SECTION("the picked model shows on the status line")
    {
        press(controller, namedKey(KeyCode::Tab));
        press(controller, namedKey(KeyCode::Down));
        press(controller, namedKey(KeyCode::Enter));

        frame = fixture.draw(controller);
        CHECK(contains(frame, "model: Piston"));
        CHECK(contains(frame, "Selected model 'Piston'"));
    }
}

TEST_CASE("Screen shows the active tenant in the frame title", "[screen]")
{
    auto fixture = ScreenFixture {};
    auto controller = ModeController(fixture.backend, { "acme" });
    REQUIRE(controller.openSession("acme"));

    auto const frame = fixture.draw(controller);
    CHECK(contains(frame, " modelmatch - acme "));
}

TEST_CASE("Screen refuses to lay out a tiny terminal", "[screen]")
{
    auto fixture = ScreenFixture {};
    fixture.output.setDimensions(39, 20);
    auto const controller = ModeController(fixture.backend);

    auto const frame = fixture.draw(controller);
    CHECK(contains(frame, "Terminal too small (need 40x12)"));
    CHECK(!contains(frame, " Search "));
}

TEST_CASE("Screen draws overlays", "[screen]")
{
    auto fixture = ScreenFixture {};

    SECTION("help")
    {
        auto controller = ModeController(fixture.backend);
        press(controller, charKey(U'h'));

        auto const frame = fixture.draw(controller);
        CHECK(contains(frame, " Help "));
        CHECK(contains(frame, "Press any key to close this help."));
    }

    SECTION("tenant picker without tenants")
    {
        auto controller = ModeController(fixture.backend);
        press(controller, charKey(U't'));

        auto const frame = fixture.draw(controller);
        CHECK(contains(frame, " Tenants "));
        CHECK(contains(frame, "No tenants configured"));
    }

    SECTION("tenant picker with tenants")
    {
        auto controller = ModeController(fixture.backend, { "acme", "globex" }, Mode::Tenant);
        press(controller, namedKey(KeyCode::Down));

        auto const frame = fixture.draw(controller);
        CHECK(contains(frame, " Tenants "));
        CHECK(contains(frame, "-> acme"));
        CHECK(contains(frame, "   globex"));
        CHECK(!contains(frame, "No tenants configured"));
    }
}

TEST_CASE("Screen shows the cursor only while searching", "[screen]")
{
    auto fixture = ScreenFixture {};
    auto controller = ModeController(fixture.backend);
    press(controller, charKey(U's'));
    press(controller, charKey(U'a'));
    press(controller, charKey(U'b'));

    auto frame = fixture.draw(controller);
    CHECK(contains(frame, "ab"));
    CHECK(frame.ends_with("\033[3;6H\033[?25h"));

    press(controller, namedKey(KeyCode::Escape));
    frame = fixture.draw(controller);
    CHECK(!contains(frame, "\033[?25h"));
    CHECK(contains(frame, "ab")); // the query survives leaving Search
}

TEST_CASE("Screen log panel", "[screen]")
{
    auto fixture = ScreenFixture {};
    auto const controller = ModeController(fixture.backend);
    fixture.log.addLog(tui::LogLevel::Info, "backend ready");

    SECTION("shown by default")
    {
        auto const frame = fixture.draw(controller);
        CHECK(contains(frame, " Log (1) "));
        CHECK(contains(frame, "INFO  backend ready"));
    }

    SECTION("hidden with zero height")
    {
        auto const frame = fixture.draw(controller, 0);
        CHECK(!contains(frame, " Log ("));
    }
}

TEST_CASE("Screen render reports write failures", "[screen]")
{
    auto output = tui::TerminalOutput(-1);
    auto backend = FakeBackend {};
    auto const controller = ModeController(backend);
    auto screen = Screen(output);

    auto const result = screen.render(controller, tui::LogPanel {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::IoError);
}
