// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <mcp/EnvironmentPolicy.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace mcpman
{

/// @brief Top-level application configuration.
struct AppConfig
{
    /// @brief The coding-assistant executable whose "mcp" subcommands are driven.
    std::string claudeBinary = "claude";

    /// @brief Project directory holding .mcp.json. Empty means the current directory.
    std::string projectPath;

    /// @brief Environment forwarded to the external tool.
    EnvironmentPolicy environment = defaultEnvironmentPolicy();

    log::Level logLevel = log::Level::Warning;
};

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration, defaults if no file exists, or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Serializes the configuration into its file representation.
[[nodiscard]] auto configToJson(const AppConfig& config) -> nlohmann::json;

/// @brief Returns the default config directory path for the current platform.
/// On Linux: $XDG_CONFIG_HOME/mcpman or ~/.config/mcpman
/// On macOS: ~/Library/Application Support/mcpman
/// On Windows: %APPDATA%\mcpman
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace mcpman
