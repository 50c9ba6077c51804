// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <core/StringUtils.hpp>

#include <print>
#include <string>

namespace mcpman::log
{

namespace
{
    auto globalLevel = Level::Warning;
    auto globalCallback = LogCallback {};
} // namespace

void setCallback(LogCallback callback)
{
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    auto const lowered = strings::toLower(name);
    if (lowered == "error")
        return Level::Error;
    if (lowered == "warning" || lowered == "warn")
        return Level::Warning;
    if (lowered == "info")
        return Level::Info;
    if (lowered == "debug")
        return Level::Debug;
    if (lowered == "trace")
        return Level::Trace;
    return std::nullopt;
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    // Standard output carries command results; diagnostics go to stderr.
    std::println(stderr, "mcpman: {}: {}", levelName(level), message);
}

} // namespace mcpman::log
