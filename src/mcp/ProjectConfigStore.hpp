// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/Types.hpp>

#include <string>
#include <string_view>

namespace mcpman
{

/// @brief File name of the sidecar configuration inside a project directory.
constexpr auto ProjectConfigFileName = std::string_view { ".mcp.json" };

/// @brief Returns the sidecar file path for a project directory.
[[nodiscard]] auto projectConfigPath(std::string_view projectPath) -> std::string;

/// @brief Reads a sidecar file.
///
/// A missing file yields an empty ProjectConfig. The store provides no locking;
/// read-modify-write sequences are the caller's responsibility.
/// @param path The path of the .mcp.json file itself.
/// @return The configuration, ConfigIoError if the file cannot be read, or
///         ConfigParseError if it is not valid JSON of the expected shape.
[[nodiscard]] auto readProjectConfigFile(std::string_view path) -> Result<ProjectConfig>;

/// @brief Writes a sidecar file, creating parent directories as needed.
/// @param path The path of the .mcp.json file itself.
/// @param config The configuration to serialize.
/// @return Success or ConfigIoError.
[[nodiscard]] auto writeProjectConfigFile(std::string_view path, const ProjectConfig& config) -> VoidResult;

/// @brief Converts a parsed sidecar document into a ProjectConfig.
/// @return The configuration or ConfigParseError on a schema mismatch.
[[nodiscard]] auto projectConfigFromJson(const nlohmann::json& root) -> Result<ProjectConfig>;

/// @brief Serializes a ProjectConfig into the sidecar document shape.
[[nodiscard]] auto projectConfigToJson(const ProjectConfig& config) -> nlohmann::json;

} // namespace mcpman
