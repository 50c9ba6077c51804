// SPDX-License-Identifier: Apache-2.0
#include "DetailOutputParser.hpp"

#include <core/Log.hpp>
#include <core/StringUtils.hpp>

#include <string>

namespace mcpman
{

namespace
{

    /// Returns the trimmed remainder of @p line if it starts with @p prefix.
    auto valueAfter(std::string_view line, std::string_view prefix) -> std::optional<std::string_view>
    {
        if (!line.starts_with(prefix))
            return std::nullopt;
        return strings::trim(line.substr(prefix.size()));
    }

} // namespace

auto parseScopeLabel(std::string_view label) -> Scope
{
    auto const lowered = strings::toLower(strings::trim(label));

    // The label's own leading word wins over words in its description,
    // e.g. "User config (available in all your projects)".
    if (lowered.starts_with("local"))
        return Scope::Local;
    if (lowered.starts_with("project"))
        return Scope::Project;
    if (lowered.starts_with("user") || lowered.starts_with("global"))
        return Scope::User;

    if (lowered.find("local") != std::string::npos)
        return Scope::Local;
    if (lowered.find("project") != std::string::npos)
        return Scope::Project;
    if (lowered.find("user") != std::string::npos || lowered.find("global") != std::string::npos)
        return Scope::User;
    return Scope::Local;
}

auto parseServerDetail(std::string_view name, std::string_view output) -> ServerRecord
{
    log::trace("Raw get output for '{}': '{}'", name, output);

    auto server = ServerRecord { .name = std::string(name) };

    for (auto const rawLine: strings::splitLines(output))
    {
        auto const line = strings::trim(rawLine);

        if (auto const scope = valueAfter(line, "Scope:"))
        {
            server.scope = parseScopeLabel(*scope);
        }
        else if (auto const type = valueAfter(line, "Type:"))
        {
            if (auto const transport = transportFromString(strings::toLower(*type)))
                server.transport = *transport;
            else
                log::debug("Unknown transport '{}' for server '{}', assuming stdio", *type, name);
        }
        else if (auto const command = valueAfter(line, "Command:"))
        {
            server.command = std::string(*command);
        }
        else if (auto const args = valueAfter(line, "Args:"))
        {
            if (!args->empty())
                server.args = strings::splitWhitespace(*args);
        }
        else if (auto const url = valueAfter(line, "URL:"))
        {
            server.url = std::string(*url);
        }
    }

    log::debug("Parsed details of '{}': transport={}, scope={}",
               name,
               transportToString(server.transport),
               scopeToString(server.scope));
    return server;
}

} // namespace mcpman
