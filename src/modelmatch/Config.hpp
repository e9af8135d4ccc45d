// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace modelmatch
{

/// @brief How to launch the backend bridge process.
struct BackendConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    static constexpr auto MinLogPanelHeight = 3;
    static constexpr auto MaxLogPanelHeight = 30;

    BackendConfig backend;

    /// @brief Tenants offered by the tenant picker.
    std::vector<std::string> tenants;

    /// @brief Tenant to open a session for at startup; empty to ask or skip.
    std::string tenant;

    log::Level logLevel = log::Level::Info;

    /// @brief Rows of the log panel, kept within MinLogPanelHeight..MaxLogPanelHeight.
    int logPanelHeight = 10;
};

/// @brief Loads the application configuration from the default config path.
///
/// A missing file is not an error; the defaults are returned instead.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or a ConfigError/ProtocolError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating its directory.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns $XDG_CONFIG_HOME/modelmatch, or ~/.config/modelmatch.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Clamps a log panel height into the supported range.
[[nodiscard]] constexpr auto clampLogPanelHeight(int rows) noexcept -> int
{
    if (rows < AppConfig::MinLogPanelHeight)
        return AppConfig::MinLogPanelHeight;
    if (rows > AppConfig::MaxLogPanelHeight)
        return AppConfig::MaxLogPanelHeight;
    return rows;
}

} // namespace modelmatch
