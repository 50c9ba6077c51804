// SPDX-License-Identifier: Apache-2.0
#include "ServerRegistry.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/StringUtils.hpp>
#include <mcp/DetailOutputParser.hpp>
#include <mcp/ForeignConfigImport.hpp>
#include <mcp/ListOutputParser.hpp>
#include <mcp/ProjectConfigStore.hpp>
#include <mcp/Reconcile.hpp>

#include <format>

namespace mcpman
{

auto buildAddArguments(const AddRequest& request) -> Result<std::vector<std::string>>
{
    if (strings::trim(request.name).empty())
        return makeError(ErrorCode::ValidationError, "Server name is required");

    auto args = std::vector<std::string> { "add", "-s", std::string(scopeToString(request.scope)) };

    if (request.transport == TransportKind::Sse)
    {
        args.emplace_back("--transport");
        args.emplace_back("sse");
    }

    for (const auto& [key, value]: request.env)
    {
        args.emplace_back("-e");
        args.push_back(std::format("{}={}", key, value));
    }

    args.push_back(request.name);

    switch (request.transport)
    {
        case TransportKind::Stdio:
            if (!request.command || strings::trim(*request.command).empty())
                return makeError(ErrorCode::ValidationError, "Command is required for stdio transport");
            // "--" keeps the external tool from reading the server's own flags as its options.
            args.emplace_back("--");
            args.push_back(*request.command);
            args.insert(args.end(), request.args.begin(), request.args.end());
            break;
        case TransportKind::Sse:
            if (!request.url || strings::trim(*request.url).empty())
                return makeError(ErrorCode::ValidationError, "URL is required for SSE transport");
            args.push_back(*request.url);
            break;
    }

    return args;
}

ServerRegistry::ServerRegistry(std::unique_ptr<CommandRunner> runner, std::string projectPath):
    _runner(std::move(runner)), _projectPath(std::move(projectPath))
{
}

ServerRegistry::~ServerRegistry() = default;

auto ServerRegistry::projectPath() const -> const std::string&
{
    return _projectPath;
}

auto ServerRegistry::execute(const std::vector<std::string>& args, const std::optional<std::string>& workingDirectory)
    -> Result<std::string>
{
    auto output = _runner->run(args, workingDirectory);
    if (!output)
        return std::unexpected(output.error());

    if (!output->succeeded())
    {
        auto const combined = output->stderrText.empty()
                                  ? output->stdoutText
                                  : std::format("{}\n{}", output->stdoutText, output->stderrText);
        return makeError(ErrorCode::ProcessError, std::format("Command failed: {}", strings::trim(combined)));
    }

    return std::move(output->stdoutText);
}

auto ServerRegistry::overlayOrEmpty() -> ProjectConfig
{
    auto config = readProjectConfigFile(projectConfigPath(_projectPath));
    if (!config)
    {
        log::warning("Ignoring unreadable project config in {}: {}", _projectPath, config.error());
        return ProjectConfig {};
    }
    return std::move(*config);
}

auto ServerRegistry::add(const AddRequest& request) -> AddResult
{
    log::info("Adding MCP server: {} with transport: {}", request.name, transportToString(request.transport));

    auto args = buildAddArguments(request);
    if (!args)
    {
        log::warning("Rejected add of '{}': {}", request.name, args.error().message);
        return AddResult { .success = false, .message = args.error().message };
    }

    auto output = execute(*args);
    if (!output)
    {
        log::error("Failed to add MCP server: {}", output.error().message);
        return AddResult { .success = false, .message = output.error().message };
    }

    log::info("Successfully added MCP server: {}", request.name);
    return AddResult {
        .success = true,
        .message = std::string(strings::trim(*output)),
        .serverName = request.name,
    };
}

auto ServerRegistry::addFromJson(std::string_view name, std::string_view jsonConfig, Scope scope) -> AddResult
{
    log::info("Adding MCP server from JSON: {} with scope: {}", name, scopeToString(scope));

    if (strings::trim(name).empty())
        return AddResult { .success = false, .message = "Server name is required" };

    auto parsed = json::parse(jsonConfig);
    if (!parsed || !parsed->is_object())
    {
        auto const reason = parsed ? std::string("expected a JSON object") : parsed.error().message;
        log::warning("Rejected add-json of '{}': {}", name, reason);
        return AddResult { .success = false, .message = std::format("Invalid JSON configuration: {}", reason) };
    }

    auto output = execute({
        "add-json",
        std::string(name),
        std::string(jsonConfig),
        "-s",
        std::string(scopeToString(scope)),
    });
    if (!output)
    {
        log::error("Failed to add MCP server from JSON: {}", output.error().message);
        return AddResult { .success = false, .message = output.error().message };
    }

    log::info("Successfully added MCP server from JSON: {}", name);
    return AddResult {
        .success = true,
        .message = std::string(strings::trim(*output)),
        .serverName = std::string(name),
    };
}

auto ServerRegistry::list() -> Result<std::vector<ServerRecord>>
{
    log::info("Listing MCP servers");

    auto output = execute({ "list" });
    if (!output)
    {
        log::error("Failed to list MCP servers: {}", output.error().message);
        return std::unexpected(output.error());
    }

    auto servers = parseServerList(*output);
    if (servers.empty())
        return servers;

    auto const overlay = overlayOrEmpty();
    for (auto& server: servers)
        server = applyOverlay(std::move(server), overlay);

    log::info("Found {} MCP servers", servers.size());
    return servers;
}

auto ServerRegistry::get(std::string_view name) -> Result<ServerRecord>
{
    log::info("Getting MCP server details for: {}", name);

    auto output = execute({ "get", std::string(name) });
    if (!output)
    {
        log::error("Failed to get MCP server: {}", output.error().message);
        return std::unexpected(output.error());
    }

    return applyOverlay(parseServerDetail(name, *output), overlayOrEmpty());
}

auto ServerRegistry::remove(std::string_view name) -> Result<std::string>
{
    log::info("Removing MCP server: {}", name);

    auto output = execute({ "remove", std::string(name) });
    if (!output)
    {
        log::error("Failed to remove MCP server: {}", output.error().message);
        return std::unexpected(output.error());
    }

    log::info("Successfully removed MCP server: {}", name);
    return std::string(strings::trim(*output));
}

auto ServerRegistry::toggleDisabled(std::string_view name, bool disabled, std::optional<std::string> projectPath)
    -> Result<std::string>
{
    log::info("Toggling MCP server '{}' disabled status to: {}", name, disabled);

    if (strings::trim(name).empty())
        return makeError(ErrorCode::ValidationError, "Server name is required");

    auto const project = projectPath.value_or(_projectPath);
    auto const path = projectConfigPath(project);

    auto const lock = std::lock_guard(_configMutex);

    auto config = readProjectConfigFile(path);
    if (!config)
    {
        log::error("Failed to read MCP configuration: {}", config.error().message);
        return std::unexpected(config.error());
    }

    auto detail = std::optional<ServerRecord> {};
    if (!config->servers.contains(std::string(name)))
    {
        log::info("Server '{}' not found in {}, attempting to create config entry", name, path);
        // An explicit project resolves its project-scoped servers from its own directory.
        if (auto output = execute({ "get", std::string(name) }, projectPath))
            detail = parseServerDetail(name, *output);
        else
            log::info("Could not get server details for '{}': {}, creating minimal config entry",
                      name,
                      output.error().message);
    }

    switch (setServerDisabled(*config, name, disabled, detail))
    {
        case ToggleEffect::Updated: break;
        case ToggleEffect::CreatedFromDetail: log::info("Created new config entry for server '{}'", name); break;
        case ToggleEffect::CreatedMinimal: log::info("Created minimal config entry for server '{}'", name); break;
    }

    if (auto written = writeProjectConfigFile(path, *config); !written)
    {
        log::error("Failed to save MCP configuration: {}", written.error().message);
        return std::unexpected(written.error());
    }

    auto const state = disabled ? "disabled" : "enabled";
    log::info("Successfully {} MCP server: {}", state, name);
    return std::format("Server '{}' has been {}", name, state);
}

auto ServerRegistry::testConnection(std::string_view name) -> Result<std::string>
{
    log::info("Testing connection to MCP server: {}", name);

    auto output = execute({ "get", std::string(name) });
    if (!output)
        return std::unexpected(output.error());
    return std::format("Connection to {} successful", name);
}

auto ServerRegistry::resetProjectChoices() -> Result<std::string>
{
    log::info("Resetting MCP project choices");

    auto output = execute({ "reset-project-choices" });
    if (!output)
    {
        log::error("Failed to reset project choices: {}", output.error().message);
        return std::unexpected(output.error());
    }
    return std::string(strings::trim(*output));
}

auto ServerRegistry::serve() -> Result<std::string>
{
    log::info("Starting the external tool as MCP server");

    if (auto started = _runner->spawnDetached({ "serve" }); !started)
    {
        log::error("Failed to start MCP server: {}", started.error().message);
        return std::unexpected(started.error());
    }
    return std::string("MCP server started");
}

auto ServerRegistry::importServers(const nlohmann::ordered_json& foreignConfig, Scope scope) -> Result<ImportOutcome>
{
    if (!foreignConfig.is_object() || !foreignConfig.contains("mcpServers")
        || !foreignConfig["mcpServers"].is_object())
        return makeError(ErrorCode::ParseError, "No MCP servers found in Claude Desktop config");

    auto outcome = ImportOutcome {};
    auto const record = [&](const std::string& name, std::optional<std::string> error) {
        if (error)
        {
            ++outcome.failedCount;
            log::error("Failed to import server {}: {}", name, *error);
        }
        else
        {
            ++outcome.importedCount;
            log::info("Successfully imported server: {}", name);
        }
        outcome.servers.push_back(ImportServerResult {
            .name = name,
            .success = !error.has_value(),
            .error = std::move(error),
        });
    };

    for (const auto& [name, serverJson]: foreignConfig["mcpServers"].items())
    {
        log::info("Importing server: {}", name);

        auto payload = foreignServerToAddJson(serverJson);
        if (!payload)
        {
            record(name, payload.error().message);
            continue;
        }

        auto const result = addFromJson(name, payload->dump(), scope);
        record(name, result.success ? std::nullopt : std::optional<std::string>(result.message));
    }

    log::info("Import complete: {} imported, {} failed", outcome.importedCount, outcome.failedCount);
    return outcome;
}

auto ServerRegistry::importFromForeignConfig(Scope scope, std::optional<std::string> path) -> Result<ImportOutcome>
{
    log::info("Importing MCP servers from Claude Desktop with scope: {}", scopeToString(scope));

    if (!path)
    {
        auto defaultPath = defaultForeignConfigPath();
        if (!defaultPath)
            return std::unexpected(defaultPath.error());
        path = std::move(*defaultPath);
    }

    auto document = loadForeignConfig(*path);
    if (!document)
    {
        log::error("{}", document.error().message);
        return std::unexpected(document.error());
    }

    return importServers(*document, scope);
}

auto ServerRegistry::readProjectConfig(std::string_view projectPath) -> Result<ProjectConfig>
{
    log::info("Reading {} from project: {}", ProjectConfigFileName, projectPath);
    return readProjectConfigFile(projectConfigPath(projectPath));
}

auto ServerRegistry::saveProjectConfig(std::string_view projectPath, const ProjectConfig& config)
    -> Result<std::string>
{
    log::info("Saving {} to project: {}", ProjectConfigFileName, projectPath);

    auto const lock = std::lock_guard(_configMutex);
    if (auto written = writeProjectConfigFile(projectConfigPath(projectPath), config); !written)
    {
        log::error("Failed to save MCP configuration: {}", written.error().message);
        return std::unexpected(written.error());
    }
    return std::string("Project MCP configuration saved");
}

} // namespace mcpman
