// SPDX-License-Identifier: Apache-2.0
#include <modelmatch/Config.hpp>

#include <core/JsonUtils.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace modelmatch
{

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/modelmatch";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/modelmatch";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} must contain a JSON object", path));

    auto config = AppConfig {};

    // Backend section
    if (auto const it = root.find("backend"); it != root.end() && it->is_object())
    {
        auto const& backend = *it;
        config.backend.command = json::getStringOr(backend, "command", "");
        config.backend.args = json::getStringList(backend, "args");

        if (auto const env = backend.find("env"); env != backend.end() && env->is_object())
        {
            for (auto const& [key, value]: env->items())
            {
                if (value.is_string())
                    config.backend.env[key] = value.get<std::string>();
            }
        }
    }

    config.tenants = json::getStringList(root, "tenants");
    config.tenant = json::getStringOr(root, "tenant", "");

    auto const levelName = json::getStringOr(root, "logLevel", "info");
    auto const level = log::parseLevel(levelName);
    if (!level)
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level '{}' in {}", levelName, path));
    config.logLevel = *level;

    config.logPanelHeight = clampLogPanelHeight(json::getIntOr(root, "logPanelHeight", config.logPanelHeight));

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    auto backend = nlohmann::json::object();
    backend["command"] = config.backend.command;
    if (!config.backend.args.empty())
        backend["args"] = config.backend.args;
    if (!config.backend.env.empty())
    {
        auto env = nlohmann::json::object();
        for (auto const& [key, value]: config.backend.env)
            env[key] = value;
        backend["env"] = std::move(env);
    }
    root["backend"] = std::move(backend);

    if (!config.tenants.empty())
        root["tenants"] = config.tenants;
    if (!config.tenant.empty())
        root["tenant"] = config.tenant;
    root["logLevel"] = log::levelName(config.logLevel);
    root["logPanelHeight"] = config.logPanelHeight;

    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace modelmatch
