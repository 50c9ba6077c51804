// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/CommandRunner.hpp>

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#ifndef _WIN32
    #include <sys/types.h>
#endif

namespace mcpman
{

/// @brief Configuration for launching the external tool.
struct ProcessCommandRunnerConfig
{
    /// @brief Executable name or path, resolved through PATH when not absolute.
    std::string binary = "claude";

    /// @brief Arguments placed before every subcommand.
    std::vector<std::string> baseArgs = { "mcp" };

    /// @brief The complete environment of the child process.
    std::map<std::string, std::string> env;

    /// @brief Working directory of the child, or the current directory if unset.
    std::optional<std::string> workingDirectory;
};

/// @brief CommandRunner that spawns the external tool as a child process.
///
/// stdout and stderr are captured through pipes and drained concurrently, so
/// a chatty stderr cannot stall the child. There is no timeout: a caller that
/// needs one has to enforce it around the call.
///
/// Detached children are remembered and reaped without blocking on every later
/// call and on destruction, so a long-lived runner does not accumulate zombies.
class ProcessCommandRunner: public CommandRunner
{
  public:
    explicit ProcessCommandRunner(ProcessCommandRunnerConfig config);
    ~ProcessCommandRunner() override;

    ProcessCommandRunner(const ProcessCommandRunner&) = delete;
    ProcessCommandRunner& operator=(const ProcessCommandRunner&) = delete;

    [[nodiscard]] auto run(const std::vector<std::string>& args,
                           const std::optional<std::string>& workingDirectory = std::nullopt)
        -> Result<CommandOutput> override;
    [[nodiscard]] auto spawnDetached(const std::vector<std::string>& args) -> VoidResult override;

    /// @brief Collects detached children that have exited.
    /// @return The number of detached children still running.
    auto reapDetachedChildren() -> std::size_t;

    [[nodiscard]] auto config() const noexcept -> const ProcessCommandRunnerConfig& { return _config; }

  private:
    [[nodiscard]] auto fullArgs(const std::vector<std::string>& args) const -> std::vector<std::string>;

    ProcessCommandRunnerConfig _config;

#ifndef _WIN32
    std::mutex _childrenMutex;
    std::vector<pid_t> _detachedChildren;
#endif
};

} // namespace mcpman
