#include "nabunet/platform/time.h"

#include <ctime>
#include <cstdint>

#if defined(__unix__) || defined(__APPLE__)
#include <time.h>
#endif

namespace nabunet::platform {

std::uint64_t unix_time_seconds()
{
    std::time_t t = std::time(nullptr);
    if (t <= 0) return 0;
    return static_cast<std::uint64_t>(t);
}

LocalTime to_local_time(std::uint64_t secs)
{
    const std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
#if defined(__unix__) || defined(__APPLE__)
    ::localtime_r(&t, &tm);
#else
    tm = *std::localtime(&t);
#endif

    LocalTime out;
    out.year    = tm.tm_year + 1900;
    out.month   = tm.tm_mon + 1;
    out.day     = tm.tm_mday;
    out.hour    = tm.tm_hour;
    out.minute  = tm.tm_min;
    out.second  = tm.tm_sec;
    out.weekday = tm.tm_wday;
    return out;
}

LocalTime local_time_now()
{
    return to_local_time(unix_time_seconds());
}

} // namespace nabunet::platform
