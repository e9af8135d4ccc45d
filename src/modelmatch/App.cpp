// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <backend/RpcBackend.hpp>
#include <backend/StdioTransport.hpp>
#include <core/Log.hpp>
#include <modelmatch/ModeController.hpp>
#include <modelmatch/Screen.hpp>

#include <chrono>
#include <csignal>
#include <format>
#include <iostream>
#include <optional>
#include <print>
#include <string>
#include <utility>
#include <vector>

#include <tui/LogPanel.hpp>
#include <tui/Terminal.hpp>

namespace modelmatch
{

namespace
{
    constexpr auto toPanelLevel(log::Level level) noexcept -> tui::LogLevel
    {
        switch (level)
        {
            case log::Level::Error: return tui::LogLevel::Error;
            case log::Level::Warning: return tui::LogLevel::Warning;
            case log::Level::Info: return tui::LogLevel::Info;
            case log::Level::Debug: return tui::LogLevel::Debug;
            case log::Level::Trace: return tui::LogLevel::Trace;
        }
        return tui::LogLevel::Info;
    }
} // namespace

struct App::Impl
{
    AppConfig config;
    std::unique_ptr<RpcBackend> backend;
    std::unique_ptr<ModeController> controller;
    tui::Terminal terminal;
    tui::LogPanel logPanel;
    Screen screen;
    bool tuiActive = false;

    /// @brief Messages logged before the terminal is up, replayed into the log panel on start.
    std::vector<std::pair<log::Level, tui::LogEntry>> pendingLogs;

    explicit Impl(AppConfig cfg):
        config(std::move(cfg)), screen(terminal.output(), clampLogPanelHeight(config.logPanelHeight))
    {
    }

    void addLog(log::Level level, std::string_view message)
    {
        auto entry = tui::LogEntry {
            .timestamp = std::chrono::system_clock::now(),
            .level = toPanelLevel(level),
            .message = std::string(message),
        };
        if (tuiActive)
            logPanel.addEntry(std::move(entry));
        else
            pendingLogs.emplace_back(level, std::move(entry));
    }

    /// @brief Replays all pending log messages into the log panel. Called once after terminal init.
    void replayPendingLogs()
    {
        for (auto& [level, entry]: pendingLogs)
            logPanel.addEntry(std::move(entry));
        pendingLogs.clear();
    }

    /// @brief Sends logging back to stderr, together with everything queued so far.
    void releaseLogs()
    {
        log::setCallback(nullptr);
        for (auto const& [level, entry]: pendingLogs)
            log::write(level, entry.message);
        pendingLogs.clear();
    }

    /// @brief Chooses the first screen: a configured tenant is opened right away, a list of
    /// tenants brings up the picker, and without tenants the folders are listed directly.
    void prepareInitialState()
    {
        if (!config.tenant.empty())
        {
            controller = std::make_unique<ModeController>(*backend, config.tenants);
            controller->openSession(config.tenant);
            return;
        }

        if (!config.tenants.empty())
        {
            controller = std::make_unique<ModeController>(*backend, config.tenants, Mode::Tenant);
            return;
        }

        controller = std::make_unique<ModeController>(*backend);
        controller->reloadFolders();
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
    // Installed right away so that messages from backend startup are kept for the log panel.
    log::setCallback([impl = _impl.get()](log::Level level, std::string_view message) {
        impl->addLog(level, message);
    });
}

App::~App()
{
    log::setCallback(nullptr);
}

auto App::initialize() -> VoidResult
{
    // Writes to a backend that went away must fail with EPIPE rather than kill us.
    std::signal(SIGPIPE, SIG_IGN);

    auto transport = std::make_unique<StdioTransport>();
    auto startResult = transport->start(StdioTransportConfig {
        .command = _impl->config.backend.command,
        .args = _impl->config.backend.args,
        .env = _impl->config.backend.env,
    });
    if (!startResult)
    {
        _impl->releaseLogs();
        return std::unexpected(startResult.error());
    }

    _impl->backend = std::make_unique<RpcBackend>(std::move(transport));
    auto info = _impl->backend->initialize();
    if (!info)
    {
        _impl->releaseLogs();
        return std::unexpected(info.error());
    }

    log::info("Connected to {} {}", info->name, info->version);

    _impl->prepareInitialState();
    return {};
}

auto App::run() -> int
{
    if (!_impl->controller)
    {
        std::println(stderr, "Application not initialized");
        return 1;
    }

    // Flush any pending stdout before entering raw mode
    std::cout.flush();

    auto termResult = _impl->terminal.initialize();
    if (!termResult)
    {
        _impl->releaseLogs();
        std::println(stderr, "Failed to initialize terminal: {}", termResult.error().message);
        return 1;
    }

    _impl->tuiActive = true;
    _impl->replayPendingLogs();

    auto& output = _impl->terminal.output();
    auto& controller = *_impl->controller;
    auto fatal = std::optional<Error> {};

    if (auto rendered = _impl->screen.render(controller, _impl->logPanel); !rendered)
        fatal = rendered.error();

    auto running = !fatal.has_value();
    while (running)
    {
        auto events = _impl->terminal.poll();
        if (!events)
        {
            fatal = events.error();
            break;
        }

        for (auto const& event: *events)
        {
            if (auto const* resize = std::get_if<tui::ResizeEvent>(&event))
            {
                log::debug("Terminal resized to {}x{}", resize->columns, resize->rows);
                output.updateDimensions();
                continue;
            }

            if (controller.handle(event) == ControllerAction::Quit)
            {
                running = false;
                break;
            }
        }

        if (!running)
            break;

        if (auto rendered = _impl->screen.render(controller, _impl->logPanel); !rendered)
        {
            fatal = rendered.error();
            break;
        }
    }

    // Revert log output to stderr before tearing down the terminal
    log::setCallback(nullptr);
    _impl->tuiActive = false;
    _impl->terminal.shutdown();

    if (fatal)
    {
        std::println(stderr, "Terminal failure: {}", *fatal);
        return 1;
    }
    return 0;
}

} // namespace modelmatch
