// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpman
{

/// @brief How an MCP server is invoked.
enum class TransportKind : std::uint8_t
{
    Stdio,
    Sse,
};

/// @brief Visibility tier of a server registration.
enum class Scope : std::uint8_t
{
    Local,
    Project,
    User,
};

[[nodiscard]] constexpr auto transportToString(TransportKind transport) -> std::string_view
{
    switch (transport)
    {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Sse: return "sse";
    }
    return "stdio";
}

/// @brief Parses a transport name.
/// @return The transport, or std::nullopt if the name is neither "stdio" nor "sse".
[[nodiscard]] constexpr auto transportFromString(std::string_view str) -> std::optional<TransportKind>
{
    if (str == "stdio")
        return TransportKind::Stdio;
    if (str == "sse")
        return TransportKind::Sse;
    return std::nullopt;
}

[[nodiscard]] constexpr auto scopeToString(Scope scope) -> std::string_view
{
    switch (scope)
    {
        case Scope::Local: return "local";
        case Scope::Project: return "project";
        case Scope::User: return "user";
    }
    return "local";
}

/// @brief Parses an exact scope name ("local", "project" or "user").
[[nodiscard]] constexpr auto scopeFromString(std::string_view str) -> std::optional<Scope>
{
    if (str == "local")
        return Scope::Local;
    if (str == "project")
        return Scope::Project;
    if (str == "user")
        return Scope::User;
    return std::nullopt;
}

/// @brief Advisory runtime status of a server. Never authoritative.
struct ServerStatus
{
    bool running = false;
    std::optional<std::string> error;
    std::optional<std::chrono::system_clock::time_point> lastChecked;
};

/// @brief A server as reported by the external tool, merged with the local overlay.
///
/// Only @c disabled comes from the sidecar file. Everything else is derived
/// fresh from the external tool's output on every list/get call.
struct ServerRecord
{
    std::string name;
    TransportKind transport = TransportKind::Stdio;
    std::optional<std::string> command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> url;
    Scope scope = Scope::Local;
    bool active = false;
    bool disabled = false;
    ServerStatus status;
};

/// @brief The per-server structure persisted in the sidecar file.
struct ServerConfigEntry
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool disabled = false;

    /// @brief Members this program does not model (e.g. "type", "url"), written back unchanged.
    nlohmann::json extra = nlohmann::json::object();
};

/// @brief Contents of a project's .mcp.json. The map key is the server name.
struct ProjectConfig
{
    std::map<std::string, ServerConfigEntry> servers;

    /// @brief Top-level members other than "mcpServers", written back unchanged.
    nlohmann::json extra = nlohmann::json::object();
};

/// @brief Parameters for registering a server with the external tool.
struct AddRequest
{
    std::string name;
    TransportKind transport = TransportKind::Stdio;
    std::optional<std::string> command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> url;
    Scope scope = Scope::Local;
};

/// @brief Outcome of an add or add-json request.
///
/// Validation and process failures are reported here with success == false
/// rather than as an Error, so callers can render the message directly.
struct AddResult
{
    bool success = false;
    std::string message;
    std::optional<std::string> serverName;
};

/// @brief Outcome of importing a single server.
struct ImportServerResult
{
    std::string name;
    bool success = false;
    std::optional<std::string> error;
};

/// @brief Outcome of a batch import, in input order.
struct ImportOutcome
{
    std::uint32_t importedCount = 0;
    std::uint32_t failedCount = 0;
    std::vector<ImportServerResult> servers;
};

} // namespace mcpman
