// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Types.hpp>

#include <string_view>

namespace mcpman
{

/// @brief Maps a free-form scope label such as "User config (global)" to a Scope.
///
/// Matches the substrings "local", "project", then "user" or "global",
/// case-insensitively, and falls back to Scope::Local.
[[nodiscard]] auto parseScopeLabel(std::string_view label) -> Scope;

/// @brief Parses the output of the external tool's "get <name>" command.
///
/// Recognizes the "Scope:", "Type:", "Command:", "Args:" and "URL:" lines.
/// Everything else, the environment block included, is ignored. Fields
/// that are not present keep their defaults.
/// @param name The server name that was queried.
/// @param output Raw stdout of the get command.
/// @return The server record. The disabled flag is left for the overlay.
[[nodiscard]] auto parseServerDetail(std::string_view name, std::string_view output) -> ServerRecord;

} // namespace mcpman
