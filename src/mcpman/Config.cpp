// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace mcpman
{

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\mcpman";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/mcpman";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/mcpman";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcpman";
    return ".";
#endif
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

    auto parseResult = json::parse(ss.str(), ErrorCode::ConfigError);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} must contain a JSON object", path));

    auto config = AppConfig {};
    config.claudeBinary = json::getStringOr(root, "claudeBinary", config.claudeBinary);
    config.projectPath = json::getStringOr(root, "projectPath", "");

    // Environment section; each list replaces its default only when present.
    if (root.contains("environment") && root["environment"].is_object())
    {
        auto const& environment = root["environment"];
        if (environment.contains("forward"))
            config.environment.forward = json::getStringArray(environment, "forward");
        if (environment.contains("forwardPrefixes"))
            config.environment.forwardPrefixes = json::getStringArray(environment, "forwardPrefixes");
        config.environment.set = json::getStringMap(environment, "set");
    }

    auto const levelStr = json::getStringOr(root, "logLevel", log::levelName(config.logLevel));
    auto const level = log::levelFromString(levelStr);
    if (!level)
        return makeError(ErrorCode::ConfigError, std::format("Unknown logLevel '{}' in {}", levelStr, path));
    config.logLevel = *level;

    return config;
}

auto configToJson(const AppConfig& config) -> nlohmann::json
{
    auto root = nlohmann::json::object();
    root["claudeBinary"] = config.claudeBinary;
    if (!config.projectPath.empty())
        root["projectPath"] = config.projectPath;

    auto environment = nlohmann::json::object();
    environment["forward"] = config.environment.forward;
    environment["forwardPrefixes"] = config.environment.forwardPrefixes;
    environment["set"] = config.environment.set;
    root["environment"] = std::move(environment);

    root["logLevel"] = std::string(log::levelName(config.logLevel));
    return root;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    // Create parent directory if needed
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

    file << configToJson(config).dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::debug("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace mcpman
