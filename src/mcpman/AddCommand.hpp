// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/Types.hpp>

#include <CLI/CLI.hpp>

#include <map>
#include <string>
#include <vector>

namespace mcpman
{

/// @brief Raw values collected by the "add" subcommand.
struct AddCommandOptions
{
    std::string name;
    std::string transport = "stdio";
    std::string scope = "local";
    std::vector<std::string> env;
    std::string url;
    std::vector<std::string> commandLine;
};

/// @brief Registers the "add" subcommand on @p app, binding its values to @p options.
///
/// Options come first, then the server name, then the server command. Every
/// token after the name belongs to the command, including its own flags, so
/// `add -e K=V foo node s.js --port 3000` and `add -e K=V foo -- node s.js`
/// both work. Each -e takes exactly one KEY=VALUE and may be repeated.
auto registerAddCommand(CLI::App& app, AddCommandOptions& options) -> CLI::App*;

/// @brief Parses KEY=VALUE pairs into a map.
[[nodiscard]] auto parseEnvPairs(const std::vector<std::string>& pairs)
    -> Result<std::map<std::string, std::string>>;

/// @brief Builds the registry request from the parsed "add" values.
[[nodiscard]] auto makeAddRequest(const AddCommandOptions& options) -> Result<AddRequest>;

} // namespace mcpman
