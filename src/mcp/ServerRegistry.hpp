// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/CommandRunner.hpp>
#include <mcp/Types.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpman
{

/// @brief Manages the external tool's MCP server registrations together with
///        the project's .mcp.json overlay.
///
/// The external tool is authoritative for which servers exist and how they
/// are invoked; the sidecar file is authoritative for the disabled flag.
/// Every operation runs at most one external command and blocks until it
/// completes. Toggle and save serialize their read-modify-write cycle on a
/// per-instance mutex; other processes writing the same file can still race.
class ServerRegistry
{
  public:
    /// @brief Constructs a registry.
    /// @param runner Runs the external tool's "mcp" subcommands.
    /// @param projectPath The project directory whose .mcp.json supplies the overlay.
    ServerRegistry(std::unique_ptr<CommandRunner> runner, std::string projectPath);
    ~ServerRegistry();

    ServerRegistry(const ServerRegistry&) = delete;
    ServerRegistry& operator=(const ServerRegistry&) = delete;

    /// @brief Registers a server with the external tool.
    /// @return The outcome. Validation and command failures yield success == false.
    [[nodiscard]] auto add(const AddRequest& request) -> AddResult;

    /// @brief Registers a server from a JSON definition ("add-json").
    [[nodiscard]] auto addFromJson(std::string_view name, std::string_view jsonConfig, Scope scope) -> AddResult;

    /// @brief Lists all servers known to the external tool, merged with the overlay.
    [[nodiscard]] auto list() -> Result<std::vector<ServerRecord>>;

    /// @brief Returns the details of one server, merged with the overlay.
    [[nodiscard]] auto get(std::string_view name) -> Result<ServerRecord>;

    /// @brief Unregisters a server from the external tool. The sidecar file is not touched.
    /// @return The external tool's trimmed output.
    [[nodiscard]] auto remove(std::string_view name) -> Result<std::string>;

    /// @brief Records whether a server is disabled in the project's .mcp.json.
    ///
    /// Never asks the external tool to remove or hide anything. A server that
    /// has no entry yet gets one, built from its details when the lookup
    /// succeeds and empty otherwise.
    /// @param projectPath Project directory; defaults to the registry's project. When given, the
    ///                    detail lookup also runs in that directory.
    /// @return "Server '<name>' has been enabled|disabled".
    [[nodiscard]] auto toggleDisabled(std::string_view name,
                                      bool disabled,
                                      std::optional<std::string> projectPath = std::nullopt)
        -> Result<std::string>;

    /// @brief Checks that the external tool can resolve a server.
    [[nodiscard]] auto testConnection(std::string_view name) -> Result<std::string>;

    /// @brief Resets the external tool's approvals of project-scoped servers.
    [[nodiscard]] auto resetProjectChoices() -> Result<std::string>;

    /// @brief Starts the external tool itself as an MCP server, without waiting.
    [[nodiscard]] auto serve() -> Result<std::string>;

    /// @brief Imports every server of a desktop app configuration document.
    ///
    /// Each entry is added on its own; a failing entry does not stop the rest.
    /// @param foreignConfig Parsed document with a top-level "mcpServers" object.
    /// @param scope Scope to register the servers in.
    /// @return Per-server outcomes in document order, or ParseError if the
    ///         document has no "mcpServers" object.
    [[nodiscard]] auto importServers(const nlohmann::ordered_json& foreignConfig, Scope scope) -> Result<ImportOutcome>;

    /// @brief Imports servers from the desktop app's configuration file.
    /// @param scope Scope to register the servers in.
    /// @param path Configuration file; defaults to the platform location.
    [[nodiscard]] auto importFromForeignConfig(Scope scope, std::optional<std::string> path = std::nullopt)
        -> Result<ImportOutcome>;

    /// @brief Reads <projectPath>/.mcp.json. A missing file is an empty config.
    [[nodiscard]] auto readProjectConfig(std::string_view projectPath) -> Result<ProjectConfig>;

    /// @brief Writes <projectPath>/.mcp.json.
    /// @return "Project MCP configuration saved".
    [[nodiscard]] auto saveProjectConfig(std::string_view projectPath, const ProjectConfig& config)
        -> Result<std::string>;

    /// @brief Returns the default project directory.
    [[nodiscard]] auto projectPath() const -> const std::string&;

  private:
    /// Runs a subcommand and turns a non-zero exit into ProcessError.
    [[nodiscard]] auto execute(const std::vector<std::string>& args,
                               const std::optional<std::string>& workingDirectory = std::nullopt)
        -> Result<std::string>;

    /// Reads the default project's overlay, treating an unreadable file as empty.
    [[nodiscard]] auto overlayOrEmpty() -> ProjectConfig;

    std::unique_ptr<CommandRunner> _runner;
    std::string _projectPath;
    std::mutex _configMutex;
};

/// @brief Builds the argument list of an "add" invocation.
/// @return The arguments, or ValidationError when the request is incomplete.
[[nodiscard]] auto buildAddArguments(const AddRequest& request) -> Result<std::vector<std::string>>;

} // namespace mcpman
