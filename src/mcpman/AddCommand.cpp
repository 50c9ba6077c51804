// SPDX-License-Identifier: Apache-2.0
#include <mcpman/AddCommand.hpp>

#include <format>

namespace mcpman
{

auto registerAddCommand(CLI::App& app, AddCommandOptions& options) -> CLI::App*
{
    auto const scopeNames = std::vector<std::string> { "local", "project", "user" };

    auto* cmd = app.add_subcommand("add", "Register a server");
    cmd->positionals_at_end();
    cmd->add_option("-t,--transport", options.transport, "Transport")->check(CLI::IsMember({ "stdio", "sse" }));
    cmd->add_option("-s,--scope", options.scope, "Scope")->check(CLI::IsMember(scopeNames));
    cmd->add_option("-e,--env", options.env, "Environment variable KEY=VALUE (repeatable)")
        ->allow_extra_args(false)
        ->multi_option_policy(CLI::MultiOptionPolicy::TakeAll);
    cmd->add_option("--url", options.url, "Server URL (sse)");
    cmd->add_option("name", options.name, "Server name")->required();
    cmd->add_option("command", options.commandLine, "Command and its arguments (stdio)");
    return cmd;
}

auto parseEnvPairs(const std::vector<std::string>& pairs) -> Result<std::map<std::string, std::string>>
{
    auto env = std::map<std::string, std::string> {};
    for (const auto& pair: pairs)
    {
        auto const eq = pair.find('=');
        if (eq == std::string::npos || eq == 0)
            return makeError(ErrorCode::InvalidArgument,
                             std::format("Environment variable must be KEY=VALUE: {}", pair));
        env[pair.substr(0, eq)] = pair.substr(eq + 1);
    }
    return env;
}

auto makeAddRequest(const AddCommandOptions& options) -> Result<AddRequest>
{
    auto env = parseEnvPairs(options.env);
    if (!env)
        return std::unexpected(env.error());

    // Once the name is read every token is positional, so an explicit "--" arrives as a token.
    auto commandLine = options.commandLine;
    if (!commandLine.empty() && commandLine.front() == "--")
        commandLine.erase(commandLine.begin());

    auto request = AddRequest {
        .name = options.name,
        .transport = transportFromString(options.transport).value_or(TransportKind::Stdio),
        .command = std::nullopt,
        .args = {},
        .env = std::move(*env),
        .url = std::nullopt,
        .scope = scopeFromString(options.scope).value_or(Scope::Local),
    };
    if (!commandLine.empty())
    {
        request.command = commandLine.front();
        request.args.assign(commandLine.begin() + 1, commandLine.end());
    }
    if (!options.url.empty())
        request.url = options.url;
    else if (request.transport == TransportKind::Sse && !commandLine.empty())
        request.url = commandLine.front();

    return request;
}

} // namespace mcpman
