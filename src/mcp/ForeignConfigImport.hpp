// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace mcpman
{

/// @brief Returns the location of the desktop app's MCP configuration.
///
/// On macOS: ~/Library/Application Support/Claude/claude_desktop_config.json
/// On Linux: $XDG_CONFIG_HOME/Claude/claude_desktop_config.json or
///           ~/.config/Claude/claude_desktop_config.json
/// @return The path, or Unsupported on other platforms.
[[nodiscard]] auto defaultForeignConfigPath() -> Result<std::string>;

/// @brief Reads and parses a desktop app configuration file, keeping member order.
/// @return The document, NotFound if the file does not exist, IoError if it
///         cannot be read, or ConfigParseError if it is not valid JSON.
[[nodiscard]] auto loadForeignConfig(std::string_view path) -> Result<nlohmann::ordered_json>;

/// @brief Converts one foreign server entry into an add-json payload.
///
/// The result is always {"type":"stdio","command":...,"args":[...],"env":{...}};
/// missing args and env become empty collections.
/// @param serverJson The entry under the foreign "mcpServers" object.
/// @return The payload, or ValidationError "Missing command field".
[[nodiscard]] auto foreignServerToAddJson(const nlohmann::ordered_json& serverJson) -> Result<nlohmann::ordered_json>;

} // namespace mcpman
