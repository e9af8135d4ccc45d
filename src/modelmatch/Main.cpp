// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <modelmatch/App.hpp>
#include <modelmatch/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>
#include <string>
#include <utility>

int main(int argc, char** argv)
{
    auto app = CLI::App { "modelmatch - keyboard-driven browser for folders, models and matches" };

    auto configPath = std::string {};
    auto backendCommand = std::string {};
    auto tenant = std::string {};
    auto logHeight = 0;
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--backend", backendCommand, "Command that starts the backend bridge");
    app.add_option("-t,--tenant", tenant, "Tenant to open a session for at startup");
    app.add_option("--log-height", logHeight, "Rows of the log panel (3-30)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? modelmatch::loadConfig() : modelmatch::loadConfigFromFile(configPath);

    if (!configResult)
    {
        modelmatch::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!backendCommand.empty())
    {
        config.backend.command = backendCommand;
        config.backend.args.clear();
    }
    if (!tenant.empty())
        config.tenant = tenant;
    if (logHeight > 0)
        config.logPanelHeight = modelmatch::clampLogPanelHeight(logHeight);
    if (verbose)
        config.logLevel = modelmatch::log::Level::Debug;

    modelmatch::log::setLevel(config.logLevel);

    auto application = modelmatch::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        modelmatch::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
