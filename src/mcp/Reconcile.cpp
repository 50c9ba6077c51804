// SPDX-License-Identifier: Apache-2.0
#include "Reconcile.hpp"

#include <core/StringUtils.hpp>

#include <iterator>
#include <string>

namespace mcpman
{

auto applyOverlay(ServerRecord live, const ProjectConfig& overlay) -> ServerRecord
{
    auto const it = overlay.servers.find(live.name);
    live.disabled = it != overlay.servers.end() && it->second.disabled;
    return live;
}

auto configEntryFromDetail(const ServerRecord& detail, bool disabled) -> ServerConfigEntry
{
    auto entry = ServerConfigEntry { .env = detail.env, .disabled = disabled };

    if (detail.command)
    {
        auto parts = strings::splitWhitespace(*detail.command);
        if (!parts.empty())
        {
            entry.command = std::move(parts.front());
            entry.args.assign(std::make_move_iterator(parts.begin() + 1), std::make_move_iterator(parts.end()));
        }
    }
    entry.args.insert(entry.args.end(), detail.args.begin(), detail.args.end());
    return entry;
}

auto setServerDisabled(ProjectConfig& config,
                       std::string_view name,
                       bool disabled,
                       const std::optional<ServerRecord>& detail) -> ToggleEffect
{
    auto const key = std::string(name);
    if (auto const it = config.servers.find(key); it != config.servers.end())
    {
        it->second.disabled = disabled;
        return ToggleEffect::Updated;
    }

    if (detail)
    {
        config.servers[key] = configEntryFromDetail(*detail, disabled);
        return ToggleEffect::CreatedFromDetail;
    }

    config.servers[key] = ServerConfigEntry { .disabled = disabled };
    return ToggleEffect::CreatedMinimal;
}

} // namespace mcpman
