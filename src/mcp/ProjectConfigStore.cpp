// SPDX-License-Identifier: Apache-2.0
#include "ProjectConfigStore.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace mcpman
{

namespace
{

    constexpr auto ServersKey = std::string_view { "mcpServers" };

    auto schemaError(std::string_view what) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::ConfigParseError, std::format("Failed to parse .mcp.json: {}", what));
    }

    auto entryFromJson(std::string_view name, const nlohmann::json& serverJson) -> Result<ServerConfigEntry>
    {
        if (!serverJson.is_object())
            return schemaError(std::format("server '{}' is not an object", name));

        auto entry = ServerConfigEntry {};
        for (const auto& [key, value]: serverJson.items())
        {
            if (key == "command")
            {
                if (!value.is_string())
                    return schemaError(std::format("server '{}': command must be a string", name));
                entry.command = value.get<std::string>();
            }
            else if (key == "args")
            {
                if (!value.is_array())
                    return schemaError(std::format("server '{}': args must be an array", name));
                for (const auto& arg: value)
                {
                    if (!arg.is_string())
                        return schemaError(std::format("server '{}': args must contain strings", name));
                    entry.args.push_back(arg.get<std::string>());
                }
            }
            else if (key == "env")
            {
                if (!value.is_object())
                    return schemaError(std::format("server '{}': env must be an object", name));
                for (const auto& [envKey, envValue]: value.items())
                {
                    if (!envValue.is_string())
                        return schemaError(std::format("server '{}': env value '{}' must be a string", name, envKey));
                    entry.env[envKey] = envValue.get<std::string>();
                }
            }
            else if (key == "disabled")
            {
                if (!value.is_boolean())
                    return schemaError(std::format("server '{}': disabled must be a boolean", name));
                entry.disabled = value.get<bool>();
            }
            else
            {
                entry.extra[key] = value;
            }
        }
        return entry;
    }

} // namespace

auto projectConfigPath(std::string_view projectPath) -> std::string
{
    return (std::filesystem::path(projectPath) / ProjectConfigFileName).string();
}

auto projectConfigFromJson(const nlohmann::json& root) -> Result<ProjectConfig>
{
    if (!root.is_object())
        return schemaError("top-level value must be an object");

    auto config = ProjectConfig {};
    for (const auto& [key, value]: root.items())
    {
        if (key != ServersKey)
        {
            config.extra[key] = value;
            continue;
        }

        if (!value.is_object())
            return schemaError("mcpServers must be an object");

        for (const auto& [name, serverJson]: value.items())
        {
            auto entry = entryFromJson(name, serverJson);
            if (!entry)
                return std::unexpected(entry.error());
            config.servers[name] = std::move(*entry);
        }
    }
    return config;
}

auto projectConfigToJson(const ProjectConfig& config) -> nlohmann::json
{
    auto root = config.extra.is_object() ? config.extra : nlohmann::json::object();

    auto servers = nlohmann::json::object();
    for (const auto& [name, entry]: config.servers)
    {
        auto server = entry.extra.is_object() ? entry.extra : nlohmann::json::object();
        server["command"] = entry.command;
        server["args"] = entry.args;
        server["env"] = entry.env;
        server["disabled"] = entry.disabled;
        servers[name] = std::move(server);
    }
    root[std::string(ServersKey)] = std::move(servers);
    return root;
}

auto readProjectConfigFile(std::string_view path) -> Result<ProjectConfig>
{
    auto ec = std::error_code {};
    if (!std::filesystem::exists(path, ec))
    {
        if (ec)
            return makeError(ErrorCode::ConfigIoError,
                             std::format("Failed to read .mcp.json '{}': {}", path, ec.message()));
        log::debug("No sidecar file at {}, using an empty configuration", path);
        return ProjectConfig {};
    }

    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigIoError, std::format("Failed to read .mcp.json: cannot open {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    if (file.bad())
        return makeError(ErrorCode::ConfigIoError, std::format("Failed to read .mcp.json: I/O error on {}", path));

    auto parseResult = json::parse(ss.str(), ErrorCode::ConfigParseError);
    if (!parseResult)
    {
        log::error("Failed to parse {}: {}", path, parseResult.error().message);
        return std::unexpected(parseResult.error());
    }

    return projectConfigFromJson(*parseResult);
}

auto writeProjectConfigFile(std::string_view path, const ProjectConfig& config) -> VoidResult
{
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::ConfigIoError,
                             std::format("Failed to create directory '{}': {}", dir.string(), ec.message()));
    }

    // The document goes to a sibling file first so a failed write never truncates the existing one.
    auto const tempPath = std::string(path) + ".tmp";
    {
        auto file = std::ofstream(tempPath, std::ios::trunc);
        if (!file.is_open())
            return makeError(ErrorCode::ConfigIoError,
                             std::format("Failed to write .mcp.json: cannot open {}", tempPath));

        file << projectConfigToJson(config).dump(2) << '\n';
        file.close();
        if (!file)
        {
            auto ec = std::error_code {};
            std::filesystem::remove(tempPath, ec);
            return makeError(ErrorCode::ConfigIoError,
                             std::format("Failed to write .mcp.json: I/O error on {}", tempPath));
        }
    }

    auto ec = std::error_code {};
    std::filesystem::rename(tempPath, std::string(path), ec);
    if (ec)
    {
        auto ignored = std::error_code {};
        std::filesystem::remove(tempPath, ignored);
        return makeError(ErrorCode::ConfigIoError,
                         std::format("Failed to write .mcp.json: cannot replace {}: {}", path, ec.message()));
    }

    log::debug("Wrote {} server entries to {}", config.servers.size(), path);
    return {};
}

} // namespace mcpman
