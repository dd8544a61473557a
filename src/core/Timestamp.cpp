// SPDX-License-Identifier: Apache-2.0
#include "Timestamp.hpp"

#include <array>
#include <ctime>
#include <format>

namespace mindcast
{

namespace
{

    auto localTime(std::chrono::system_clock::time_point when) -> std::tm
    {
        auto const seconds = std::chrono::system_clock::to_time_t(when);
        auto tm = std::tm {};
#ifdef _WIN32
        localtime_s(&tm, &seconds);
#else
        localtime_r(&seconds, &tm);
#endif
        return tm;
    }

    auto formatTime(const std::tm& tm, char const* pattern) -> std::string
    {
        auto buf = std::array<char, 64> {};
        auto const len = std::strftime(buf.data(), buf.size(), pattern, &tm);
        return std::string(buf.data(), len);
    }

} // namespace

auto fileTimestamp(std::chrono::system_clock::time_point when) -> std::string
{
    auto const micros =
        std::chrono::duration_cast<std::chrono::microseconds>(when.time_since_epoch()).count() % 1'000'000;
    return std::format("{}_{:06}", formatTime(localTime(when), "%Y%m%d_%H%M%S"), micros);
}

auto fileTimestamp() -> std::string
{
    return fileTimestamp(std::chrono::system_clock::now());
}

auto logTimestamp() -> std::string
{
    return formatTime(localTime(std::chrono::system_clock::now()), "%Y-%m-%d %H:%M:%S");
}

} // namespace mindcast
