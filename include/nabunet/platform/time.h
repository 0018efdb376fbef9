#pragma once
#include <cstdint>

namespace nabunet::platform {

// Broken-down local time.
struct LocalTime {
    int year{1984};     // full year, e.g. 1984
    int month{1};       // 1..12
    int day{1};         // 1..31
    int hour{0};
    int minute{0};
    int second{0};
    int weekday{0};     // 0 = Sunday .. 6 = Saturday
};

// Returns current UNIX time in seconds (UTC). 0 if unknown/not set.
std::uint64_t unix_time_seconds();

// Convert UNIX seconds to the host's local time zone.
LocalTime to_local_time(std::uint64_t secs);

LocalTime local_time_now();

} // namespace nabunet::platform
