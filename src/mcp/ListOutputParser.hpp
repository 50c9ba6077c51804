// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Types.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace mcpman
{

/// @brief Phrase the external tool prints when nothing is registered.
constexpr auto NoServersSentinel = std::string_view { "No MCP servers configured" };

/// @brief Tests whether a line of list output starts a new server entry.
///
/// A line starts an entry when it has a colon and the text before the first
/// colon, trimmed, is non-empty and free of '/' and '\'. Drive letters
/// ("C:\...") and URL schemes ("https://...") are rejected as well, since
/// those appear on wrapped continuation lines.
/// @param line One line of output.
/// @return The server name, or std::nullopt if the line is not an entry start.
[[nodiscard]] auto recordStartName(std::string_view line) -> std::optional<std::string_view>;

/// @brief Parses the output of the external tool's "list" command.
///
/// Long commands are wrapped over several lines by the external tool; every
/// line that does not start a new entry is folded into the current entry's
/// command, joined with a single space. Lines before the first entry are
/// ignored. Records get parser defaults (stdio, local, not disabled); the
/// caller applies the sidecar overlay.
/// @param output Raw stdout of the list command.
/// @return The servers in output order. Empty for blank or "no servers" output.
[[nodiscard]] auto parseServerList(std::string_view output) -> std::vector<ServerRecord>;

} // namespace mcpman
