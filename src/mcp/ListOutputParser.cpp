// SPDX-License-Identifier: Apache-2.0
#include "ListOutputParser.hpp"

#include <core/Log.hpp>
#include <core/StringUtils.hpp>

#include <cctype>
#include <string>

namespace mcpman
{

namespace
{

    auto isDriveLetter(std::string_view name, std::string_view afterColon) -> bool
    {
        return name.size() == 1 && std::isalpha(static_cast<unsigned char>(name.front())) != 0
               && !afterColon.empty() && (afterColon.front() == '\\' || afterColon.front() == '/');
    }

    auto isUrlScheme(std::string_view afterColon) -> bool
    {
        return afterColon.starts_with("//");
    }

} // namespace

auto recordStartName(std::string_view line) -> std::optional<std::string_view>
{
    auto const colon = line.find(':');
    if (colon == std::string_view::npos)
        return std::nullopt;

    auto const name = strings::trim(line.substr(0, colon));
    auto const afterColon = line.substr(colon + 1);

    if (name.empty())
        return std::nullopt;
    if (name.find('/') != std::string_view::npos || name.find('\\') != std::string_view::npos)
        return std::nullopt;
    if (isDriveLetter(name, afterColon) || isUrlScheme(afterColon))
        return std::nullopt;

    return name;
}

auto parseServerList(std::string_view output) -> std::vector<ServerRecord>
{
    log::trace("Raw list output: '{}'", output);

    auto servers = std::vector<ServerRecord> {};
    auto const trimmed = strings::trim(output);
    if (trimmed.empty() || trimmed.find(NoServersSentinel) != std::string_view::npos)
    {
        log::debug("List output reports no servers");
        return servers;
    }

    auto const lines = strings::splitLines(trimmed);
    auto i = size_t { 0 };
    while (i < lines.size())
    {
        auto const name = recordStartName(lines[i]);
        if (!name)
        {
            log::trace("Ignoring line {}: '{}'", i, lines[i]);
            ++i;
            continue;
        }

        auto const colon = lines[i].find(':');
        auto command = std::string(strings::trim(lines[i].substr(colon + 1)));
        ++i;

        // Wrapped command lines carry no delimiter of their own.
        while (i < lines.size() && !recordStartName(lines[i]))
        {
            auto const fragment = strings::trimEnd(lines[i]);
            if (!strings::trim(fragment).empty())
            {
                log::trace("Line {} continues '{}'", i, *name);
                command += ' ';
                command += fragment;
            }
            ++i;
        }

        log::debug("Parsed server '{}' with command '{}'", *name, command);
        servers.push_back(ServerRecord {
            .name = std::string(*name),
            .command = std::move(command),
        });
    }

    log::debug("Parsed {} servers from list output", servers.size());
    return servers;
}

} // namespace mcpman
