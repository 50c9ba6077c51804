// SPDX-License-Identifier: Apache-2.0
#include "ForeignConfigImport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace mcpman
{

namespace
{
    constexpr auto ForeignConfigFileName = std::string_view { "claude_desktop_config.json" };
} // namespace

auto defaultForeignConfigPath() -> Result<std::string>
{
#if defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (!home)
        return makeError(ErrorCode::NotFound, "Could not find home directory");
    return std::format("{}/Library/Application Support/Claude/{}", home, ForeignConfigFileName);
#elif defined(__linux__)
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::format("{}/Claude/{}", xdgConfig, ForeignConfigFileName);
    auto const* const home = std::getenv("HOME");
    if (!home)
        return makeError(ErrorCode::NotFound, "Could not find config directory");
    return std::format("{}/.config/Claude/{}", home, ForeignConfigFileName);
#else
    return makeError(ErrorCode::Unsupported, "Import from Claude Desktop is only supported on macOS and Linux/WSL");
#endif
}

auto loadForeignConfig(std::string_view path) -> Result<nlohmann::ordered_json>
{
    auto ec = std::error_code {};
    if (!std::filesystem::exists(path, ec))
        return makeError(ErrorCode::NotFound,
                         std::format("Claude Desktop configuration not found at {}. "
                                     "Make sure Claude Desktop is installed.",
                                     path));

    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Failed to read Claude Desktop config: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parsed = json::parse<nlohmann::ordered_json>(ss.str(), ErrorCode::ConfigParseError);
    if (!parsed)
        return makeError(ErrorCode::ConfigParseError,
                         std::format("Failed to parse Claude Desktop config: {}", parsed.error().message));
    return parsed;
}

auto foreignServerToAddJson(const nlohmann::ordered_json& serverJson) -> Result<nlohmann::ordered_json>
{
    auto command = json::getString(serverJson, "command");
    if (!command)
        return makeError(ErrorCode::ValidationError, "Missing command field");

    auto payload = nlohmann::ordered_json::object();
    payload["type"] = "stdio";
    payload["command"] = std::move(*command);

    if (serverJson.contains("args") && serverJson["args"].is_array())
        payload["args"] = serverJson["args"];
    else
        payload["args"] = nlohmann::ordered_json::array();

    if (serverJson.contains("env") && serverJson["env"].is_object())
        payload["env"] = serverJson["env"];
    else
        payload["env"] = nlohmann::ordered_json::object();

    return payload;
}

} // namespace mcpman
