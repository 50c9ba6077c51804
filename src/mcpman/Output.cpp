// SPDX-License-Identifier: Apache-2.0
#include "Output.hpp"

#include <core/StringUtils.hpp>

#include <array>
#include <chrono>
#include <format>

namespace mcpman
{

namespace
{

    auto commandLine(const ServerRecord& server) -> std::string
    {
        if (server.transport == TransportKind::Sse)
            return server.url.value_or("");

        auto parts = std::vector<std::string> {};
        if (server.command)
            parts.push_back(*server.command);
        parts.insert(parts.end(), server.args.begin(), server.args.end());
        return strings::join(parts, " ");
    }

} // namespace

auto toJson(const ServerRecord& server) -> nlohmann::json
{
    auto status = nlohmann::json::object();
    status["running"] = server.status.running;
    status["error"] = server.status.error ? nlohmann::json(*server.status.error) : nlohmann::json(nullptr);
    if (server.status.lastChecked)
    {
        auto const seconds = std::chrono::floor<std::chrono::seconds>(*server.status.lastChecked);
        status["lastChecked"] = std::format("{:%FT%T}Z", seconds);
    }
    else
        status["lastChecked"] = nullptr;

    auto result = nlohmann::json::object();
    result["name"] = server.name;
    result["transport"] = std::string(transportToString(server.transport));
    result["command"] = server.command ? nlohmann::json(*server.command) : nlohmann::json(nullptr);
    result["args"] = server.args;
    result["env"] = server.env;
    result["url"] = server.url ? nlohmann::json(*server.url) : nlohmann::json(nullptr);
    result["scope"] = std::string(scopeToString(server.scope));
    result["active"] = server.active;
    result["disabled"] = server.disabled;
    result["status"] = std::move(status);
    return result;
}

auto toJson(const std::vector<ServerRecord>& servers) -> nlohmann::json
{
    auto result = nlohmann::json::array();
    for (const auto& server: servers)
        result.push_back(toJson(server));
    return result;
}

auto toJson(const AddResult& result) -> nlohmann::json
{
    return nlohmann::json {
        { "success", result.success },
        { "message", result.message },
        { "serverName", result.serverName ? nlohmann::json(*result.serverName) : nlohmann::json(nullptr) },
    };
}

auto toJson(const ImportOutcome& outcome) -> nlohmann::json
{
    auto servers = nlohmann::json::array();
    for (const auto& server: outcome.servers)
    {
        servers.push_back(nlohmann::json {
            { "name", server.name },
            { "success", server.success },
            { "error", server.error ? nlohmann::json(*server.error) : nlohmann::json(nullptr) },
        });
    }

    return nlohmann::json {
        { "importedCount", outcome.importedCount },
        { "failedCount", outcome.failedCount },
        { "servers", std::move(servers) },
    };
}

auto formatServerList(const std::vector<ServerRecord>& servers) -> std::string
{
    if (servers.empty())
        return "No MCP servers configured.\n";

    auto text = std::string {};
    for (auto const scope: std::array { Scope::Local, Scope::Project, Scope::User })
    {
        auto header = false;
        for (const auto& server: servers)
        {
            if (server.scope != scope)
                continue;
            if (!header)
            {
                text += std::format("{}:\n", scopeToString(scope));
                header = true;
            }
            text += std::format("  {}{}  [{}]  {}\n",
                                server.name,
                                server.disabled ? " (disabled)" : "",
                                transportToString(server.transport),
                                commandLine(server));
        }
    }
    return text;
}

auto formatServerDetail(const ServerRecord& server) -> std::string
{
    auto text = std::format("{}:\n", server.name);
    text += std::format("  Scope: {}\n", scopeToString(server.scope));
    text += std::format("  Type: {}\n", transportToString(server.transport));
    if (server.command)
        text += std::format("  Command: {}\n", *server.command);
    if (!server.args.empty())
        text += std::format("  Args: {}\n", strings::join(server.args, " "));
    if (server.url)
        text += std::format("  URL: {}\n", *server.url);
    for (const auto& [key, value]: server.env)
        text += std::format("  Env: {}={}\n", key, value);
    text += std::format("  Disabled: {}\n", server.disabled ? "yes" : "no");
    return text;
}

auto formatImportOutcome(const ImportOutcome& outcome) -> std::string
{
    auto text = std::format("Imported {} server(s), {} failed\n", outcome.importedCount, outcome.failedCount);
    for (const auto& server: outcome.servers)
    {
        if (server.success)
            text += std::format("  ok      {}\n", server.name);
        else
            text += std::format("  failed  {}: {}\n", server.name, server.error.value_or("unknown error"));
    }
    return text;
}

} // namespace mcpman
