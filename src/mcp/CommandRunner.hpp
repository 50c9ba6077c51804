// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mcpman
{

/// @brief Captured result of one external command invocation.
struct CommandOutput
{
    std::string stdoutText;
    std::string stderrText;
    int exitCode = 0;

    [[nodiscard]] auto succeeded() const -> bool { return exitCode == 0; }
};

/// @brief Abstract interface for invoking the external tool's "mcp" subcommands.
class CommandRunner
{
  public:
    virtual ~CommandRunner() = default;

    /// @brief Runs a subcommand to completion (blocking).
    ///
    /// A non-zero exit code is not an error at this layer.
    /// @param args Subcommand and its arguments, e.g. {"get", "name"}.
    /// @param workingDirectory Directory to run in for this call only; unset uses the runner's default.
    /// @return The captured output or an error if the process could not be run.
    [[nodiscard]] virtual auto run(const std::vector<std::string>& args,
                                   const std::optional<std::string>& workingDirectory = std::nullopt)
        -> Result<CommandOutput> = 0;

    /// @brief Starts a subcommand without waiting for it to finish.
    /// @param args Subcommand and its arguments, e.g. {"serve"}.
    /// @return Success once the process is started, or an error.
    [[nodiscard]] virtual auto spawnDetached(const std::vector<std::string>& args) -> VoidResult = 0;
};

} // namespace mcpman
