#pragma once

#include <chrono>
#include <cstdint>

namespace draftstore::util {

/*
  Time utilities. Rows store unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

} // namespace draftstore::util
