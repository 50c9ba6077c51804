// SPDX-License-Identifier: Apache-2.0
#include "EnvironmentPolicy.hpp"

#include <algorithm>
#include <string_view>

#ifdef _WIN32
    #include <stdlib.h>
#else
extern char** environ;
#endif

namespace mcpman
{

auto defaultEnvironmentPolicy() -> EnvironmentPolicy
{
    return EnvironmentPolicy {
        .forward = {
            "PATH", "HOME", "USER", "SHELL", "LANG", "LC_ALL", "NODE_PATH", "NVM_DIR", "NVM_BIN",
            "HOMEBREW_PREFIX", "HOMEBREW_CELLAR", "HTTP_PROXY", "HTTPS_PROXY", "NO_PROXY", "ALL_PROXY",
        },
        .forwardPrefixes = { "LC_" },
        .set = {},
    };
}

auto filterEnvironment(const std::map<std::string, std::string>& source, const EnvironmentPolicy& policy)
    -> std::map<std::string, std::string>
{
    auto const allowed = [&](std::string_view name) {
        return std::ranges::find(policy.forward, name) != policy.forward.end()
               || std::ranges::any_of(policy.forwardPrefixes,
                                      [&](const std::string& prefix) { return name.starts_with(prefix); });
    };

    auto result = std::map<std::string, std::string> {};
    for (const auto& [name, value]: source)
    {
        if (allowed(name))
            result[name] = value;
    }
    for (const auto& [name, value]: policy.set)
        result[name] = value;
    return result;
}

auto captureProcessEnvironment() -> std::map<std::string, std::string>
{
    auto result = std::map<std::string, std::string> {};
#ifdef _WIN32
    auto** const entries = _environ;
#else
    auto** const entries = environ;
#endif
    if (!entries)
        return result;

    for (auto** e = entries; *e; ++e)
    {
        auto const entry = std::string_view(*e);
        auto const eq = entry.find('=');
        // Windows keeps per-drive cwd entries like "=C:=C:\"; skip nameless ones.
        if (eq == std::string_view::npos || eq == 0)
            continue;
        result.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
    }
    return result;
}

} // namespace mcpman
