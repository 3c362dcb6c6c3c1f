#pragma once

#include <chrono>
#include <ctime>

namespace test_utils {

// Local wall-clock time, so formatted timestamps are predictable in any time zone.
inline std::chrono::system_clock::time_point localTime(int year, int month, int day, int hour, int minute,
                                                       int second)
{
    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = second;
    tm_buf.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm_buf));
}

} // namespace test_utils
