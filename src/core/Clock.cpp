// SPDX-License-Identifier: Apache-2.0
#include "Clock.hpp"

#include <array>
#include <ctime>
#include <format>

namespace dictum
{

namespace
{
    auto toLocal(SystemTime time) -> std::tm
    {
        auto const seconds = std::chrono::system_clock::to_time_t(time);
        auto tm = std::tm {};
#if defined(_WIN32)
        localtime_s(&tm, &seconds);
#else
        localtime_r(&seconds, &tm);
#endif
        return tm;
    }

    auto millisecondsOf(SystemTime time) -> int
    {
        auto const sinceEpoch = time.time_since_epoch();
        auto const ms = std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch)
                        - std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch);
        return static_cast<int>(ms.count());
    }
} // namespace

auto formatLocalTime(SystemTime time, std::string_view pattern) -> std::string
{
    auto const tm = toLocal(time);
    auto const format = std::string(pattern);
    auto buf = std::array<char, 128> {};
    auto const length = std::strftime(buf.data(), buf.size(), format.c_str(), &tm);
    return std::string(buf.data(), length);
}

auto compactTimestamp(SystemTime time) -> std::string
{
    return std::format("{}{:03}", formatLocalTime(time, "%Y%m%d_%H%M%S"), millisecondsOf(time));
}

auto isoTimestamp(SystemTime time) -> std::string
{
    // strftime's %z yields "+0100"; ISO-8601 wants "+01:00".
    auto offset = formatLocalTime(time, "%z");
    if (offset.size() == 5)
        offset.insert(3, ":");
    return std::format("{}.{:03}{}", formatLocalTime(time, "%Y-%m-%dT%H:%M:%S"), millisecondsOf(time), offset);
}

} // namespace dictum
