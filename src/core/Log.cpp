// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <core/Timestamp.hpp>

#include <fstream>
#include <print>
#include <string>

namespace mindcast::log
{

namespace
{
    auto globalLevel = Level::Info;
    auto globalCallback = LogCallback {};
    auto globalFile = std::ofstream {};

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

auto setFile(std::string_view path) -> bool
{
    if (globalFile.is_open())
        globalFile.close();

    if (path.empty())
        return true;

    globalFile.open(std::string(path), std::ios::app);
    return globalFile.is_open();
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    if (globalFile.is_open())
    {
        std::println(globalFile, "{} [{}] {}", logTimestamp(), levelPrefix(level), message);
        globalFile.flush();
    }

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    std::println(stderr, "[{}] {}", levelPrefix(level), message);
}

auto preview(std::string_view text, std::size_t maxLength) -> std::string
{
    if (text.size() <= maxLength)
        return std::string(text);
    return std::string(text.substr(0, maxLength)) + "...";
}

} // namespace mindcast::log
