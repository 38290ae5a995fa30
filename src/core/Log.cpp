// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <chrono>
#include <print>

namespace mcpvisor::log
{

namespace
{
    auto globalLevel = Level::Info;
    auto globalCallback = LogCallback {};

    constexpr auto levelPrefix(Level l) -> std::string_view
    {
        switch (l)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    }
} // namespace

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    if (name == "error")
        return Level::Error;
    if (name == "warning" || name == "warn")
        return Level::Warning;
    if (name == "info")
        return Level::Info;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return std::nullopt;
}

auto levelName(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "error";
        case Level::Warning: return "warning";
        case Level::Info: return "info";
        case Level::Debug: return "debug";
        case Level::Trace: return "trace";
    }
    return "info";
}

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

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    std::println(stderr, "{:%T} [{}] {}", now, levelPrefix(level), message);
}

} // namespace mcpvisor::log
