// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Types.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace mcpman
{

[[nodiscard]] auto toJson(const ServerRecord& server) -> nlohmann::json;
[[nodiscard]] auto toJson(const std::vector<ServerRecord>& servers) -> nlohmann::json;
[[nodiscard]] auto toJson(const AddResult& result) -> nlohmann::json;
[[nodiscard]] auto toJson(const ImportOutcome& outcome) -> nlohmann::json;

/// @brief Renders servers grouped by scope, one line per server.
[[nodiscard]] auto formatServerList(const std::vector<ServerRecord>& servers) -> std::string;

/// @brief Renders one server as an indented key/value block.
[[nodiscard]] auto formatServerDetail(const ServerRecord& server) -> std::string;

/// @brief Renders an import summary followed by one line per server.
[[nodiscard]] auto formatImportOutcome(const ImportOutcome& outcome) -> std::string;

} // namespace mcpman
