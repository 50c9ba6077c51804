// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Types.hpp>

#include <optional>
#include <string_view>

namespace mcpman
{

/// @brief Merges the sidecar overlay into a record reported by the external tool.
///
/// Only the disabled flag is taken from the overlay; every other field of
/// @p live is kept as reported.
/// @param live The record parsed from the external tool's output.
/// @param overlay The project's sidecar configuration.
/// @return The merged record.
[[nodiscard]] auto applyOverlay(ServerRecord live, const ProjectConfig& overlay) -> ServerRecord;

/// @brief Builds a sidecar entry from a server's detail record.
///
/// The "Command:" text may carry the whole command line, so it is split on
/// whitespace into the executable and leading arguments; the record's
/// separately reported args follow.
[[nodiscard]] auto configEntryFromDetail(const ServerRecord& detail, bool disabled) -> ServerConfigEntry;

/// @brief Outcome of setServerDisabled().
enum class ToggleEffect
{
    Updated,            ///< An existing entry's disabled flag was set.
    CreatedFromDetail,  ///< A new entry was synthesized from the detail record.
    CreatedMinimal,     ///< A new entry without command metadata was created.
};

/// @brief Records the disabled intent for @p name in @p config.
///
/// An existing entry only has its disabled flag changed. A missing entry is
/// created from @p detail when available, or as an empty entry otherwise.
/// Repeating the call with the same value leaves the config unchanged.
[[nodiscard]] auto setServerDisabled(ProjectConfig& config,
                                     std::string_view name,
                                     bool disabled,
                                     const std::optional<ServerRecord>& detail) -> ToggleEffect;

} // namespace mcpman
