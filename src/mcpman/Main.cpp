// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <mcp/EnvironmentPolicy.hpp>
#include <mcp/ProcessCommandRunner.hpp>
#include <mcp/ServerRegistry.hpp>
#include <mcpman/AddCommand.hpp>
#include <mcpman/Config.hpp>
#include <mcpman/Output.hpp>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <format>
#include <print>

namespace
{

auto reportError(const mcpman::Error& error, bool json = false) -> int
{
    if (json)
    {
        auto const document = nlohmann::json {
            { "error", { { "code", std::string(mcpman::errorCodeName(error.code)) }, { "message", error.message } } },
        };
        std::println("{}", document.dump(2));
    }
    else
        mcpman::log::error("{}", error.message);
    return 1;
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcpman: manage the MCP servers of the Claude CLI" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto claudeBinary = std::string {};
    auto projectPath = std::string {};
    auto verbosity = 0;
    auto jsonOutput = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--claude", claudeBinary, "Claude CLI executable");
    app.add_option("--project", projectPath, "Project directory holding .mcp.json");
    app.add_flag("-v,--verbose", verbosity, "Increase logging verbosity (repeatable)");
    app.add_flag("--json", jsonOutput, "Print results as JSON");

    auto const scopeNames = std::vector<std::string> { "local", "project", "user" };

    auto addOptions = mcpman::AddCommandOptions {};
    auto* addCmd = mcpman::registerAddCommand(app, addOptions);

    // add-json
    auto* addJsonCmd = app.add_subcommand("add-json", "Register a server from a JSON definition");
    auto addJsonName = std::string {};
    auto addJsonConfig = std::string {};
    auto addJsonScope = std::string { "local" };
    addJsonCmd->add_option("name", addJsonName, "Server name")->required();
    addJsonCmd->add_option("json", addJsonConfig, "JSON definition")->required();
    addJsonCmd->add_option("-s,--scope", addJsonScope, "Scope")->check(CLI::IsMember(scopeNames));

    auto* listCmd = app.add_subcommand("list", "List servers");

    auto serverName = std::string {};
    auto* getCmd = app.add_subcommand("get", "Show server details");
    getCmd->add_option("name", serverName, "Server name")->required();
    auto* removeCmd = app.add_subcommand("remove", "Unregister a server");
    removeCmd->add_option("name", serverName, "Server name")->required();
    auto* enableCmd = app.add_subcommand("enable", "Mark a server enabled in .mcp.json");
    enableCmd->add_option("name", serverName, "Server name")->required();
    auto* disableCmd = app.add_subcommand("disable", "Mark a server disabled in .mcp.json");
    disableCmd->add_option("name", serverName, "Server name")->required();
    auto* testCmd = app.add_subcommand("test", "Check that a server can be resolved");
    testCmd->add_option("name", serverName, "Server name")->required();

    // import
    auto* importCmd = app.add_subcommand("import", "Import servers from Claude Desktop");
    auto importScope = std::string { "local" };
    auto importFrom = std::string {};
    importCmd->add_option("-s,--scope", importScope, "Scope")->check(CLI::IsMember(scopeNames));
    importCmd->add_option("--from", importFrom, "Desktop configuration file");

    auto* resetCmd = app.add_subcommand("reset-project-choices", "Reset approvals of project-scoped servers");
    auto* serveCmd = app.add_subcommand("serve", "Run the Claude CLI as an MCP server");

    auto* configCmd = app.add_subcommand("config", "Inspect the mcpman configuration");
    configCmd->require_subcommand(1);
    auto* configShowCmd = configCmd->add_subcommand("show", "Print the effective configuration");
    auto* configInitCmd = configCmd->add_subcommand("init", "Write the default configuration file");

    CLI11_PARSE(app, argc, argv);

    auto configResult = configPath.empty() ? mcpman::loadConfig() : mcpman::loadConfigFromFile(configPath);
    if (!configResult)
        return reportError(configResult.error());

    auto& config = *configResult;

    // Apply CLI overrides
    if (!claudeBinary.empty())
        config.claudeBinary = claudeBinary;
    if (!projectPath.empty())
        config.projectPath = projectPath;
    if (verbosity == 1)
        config.logLevel = mcpman::log::Level::Debug;
    else if (verbosity > 1)
        config.logLevel = mcpman::log::Level::Trace;

    mcpman::log::setLevel(config.logLevel);

    if (*configShowCmd)
    {
        std::println("{}", mcpman::configToJson(config).dump(4));
        return 0;
    }
    if (*configInitCmd)
    {
        auto const path = configPath.empty() ? mcpman::defaultConfigPath() : configPath;
        if (auto saved = mcpman::saveConfigToFile(path, mcpman::AppConfig {}); !saved)
            return reportError(saved.error());
        std::println("Wrote {}", path);
        return 0;
    }

    if (config.projectPath.empty())
    {
        auto ec = std::error_code {};
        config.projectPath = std::filesystem::current_path(ec).string();
        if (ec)
            config.projectPath = ".";
    }

    auto runner = std::make_unique<mcpman::ProcessCommandRunner>(mcpman::ProcessCommandRunnerConfig {
        .binary = config.claudeBinary,
        .baseArgs = { "mcp" },
        .env = mcpman::filterEnvironment(mcpman::captureProcessEnvironment(), config.environment),
        .workingDirectory = config.projectPath,
    });
    auto registry = mcpman::ServerRegistry(std::move(runner), config.projectPath);

    auto const scopeOf = [](const std::string& name) {
        return mcpman::scopeFromString(name).value_or(mcpman::Scope::Local);
    };

    auto const printAddResult = [&](const mcpman::AddResult& result) {
        if (jsonOutput)
            std::println("{}", mcpman::toJson(result).dump(2));
        else if (result.success)
            std::println("{}", result.message);
        else
            mcpman::log::error("{}", result.message);
        return result.success ? 0 : 1;
    };

    auto const printMessage = [&](const mcpman::Result<std::string>& result) {
        if (!result)
            return reportError(result.error(), jsonOutput);
        if (jsonOutput)
            std::println("{}", nlohmann::json { { "message", *result } }.dump(2));
        else
            std::println("{}", *result);
        return 0;
    };

    if (*addCmd)
    {
        auto request = mcpman::makeAddRequest(addOptions);
        if (!request)
            return reportError(request.error(), jsonOutput);
        return printAddResult(registry.add(*request));
    }

    if (*addJsonCmd)
        return printAddResult(registry.addFromJson(addJsonName, addJsonConfig, scopeOf(addJsonScope)));

    if (*listCmd)
    {
        auto servers = registry.list();
        if (!servers)
            return reportError(servers.error(), jsonOutput);
        if (jsonOutput)
            std::println("{}", mcpman::toJson(*servers).dump(2));
        else
            std::print("{}", mcpman::formatServerList(*servers));
        return 0;
    }

    if (*getCmd)
    {
        auto server = registry.get(serverName);
        if (!server)
            return reportError(server.error(), jsonOutput);
        if (jsonOutput)
            std::println("{}", mcpman::toJson(*server).dump(2));
        else
            std::print("{}", mcpman::formatServerDetail(*server));
        return 0;
    }

    if (*removeCmd)
        return printMessage(registry.remove(serverName));
    if (*enableCmd)
        return printMessage(registry.toggleDisabled(serverName, false));
    if (*disableCmd)
        return printMessage(registry.toggleDisabled(serverName, true));
    if (*testCmd)
        return printMessage(registry.testConnection(serverName));
    if (*resetCmd)
        return printMessage(registry.resetProjectChoices());
    if (*serveCmd)
        return printMessage(registry.serve());

    if (*importCmd)
    {
        auto outcome = registry.importFromForeignConfig(
            scopeOf(importScope), importFrom.empty() ? std::nullopt : std::optional<std::string>(importFrom));
        if (!outcome)
            return reportError(outcome.error(), jsonOutput);
        if (jsonOutput)
            std::println("{}", mcpman::toJson(*outcome).dump(2));
        else
            std::print("{}", mcpman::formatImportOutcome(*outcome));
        return outcome->failedCount == 0 ? 0 : 1;
    }

    return 0;
}
