// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <map>
#include <string>
#include <vector>

namespace mcpman
{

/// @brief Which environment variables are forwarded to the external tool.
struct EnvironmentPolicy
{
    /// @brief Variable names forwarded verbatim when present in the source.
    std::vector<std::string> forward;

    /// @brief Name prefixes forwarded verbatim (e.g. "LC_").
    std::vector<std::string> forwardPrefixes;

    /// @brief Variables set unconditionally, overriding forwarded values.
    std::map<std::string, std::string> set;
};

/// @brief Returns the policy forwarding the variables node-based tools need.
[[nodiscard]] auto defaultEnvironmentPolicy() -> EnvironmentPolicy;

/// @brief Applies @p policy to @p source.
/// @param source The environment to select from.
/// @param policy The allow-list and overrides.
/// @return The environment to hand to the child process.
[[nodiscard]] auto filterEnvironment(const std::map<std::string, std::string>& source,
                                     const EnvironmentPolicy& policy) -> std::map<std::string, std::string>;

/// @brief Snapshots the current process environment.
///
/// Meant to be called once at startup; library code receives the filtered
/// result instead of reading the global environment.
[[nodiscard]] auto captureProcessEnvironment() -> std::map<std::string, std::string>;

} // namespace mcpman
