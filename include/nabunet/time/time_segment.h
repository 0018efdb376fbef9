#pragma once

#include <cstdint>
#include <vector>

#include "nabunet/platform/time.h"

namespace nabunet::time {

// Framed time segment (pak 0x7FFFFF, segment 0) for `now`, CRC included.
// The client only understands the fixed year 84, so `now.year` is ignored.
std::vector<std::uint8_t> build_time_segment(const platform::LocalTime& now);

} // namespace nabunet::time
