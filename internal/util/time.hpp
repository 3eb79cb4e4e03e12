#pragma once

#include <chrono>
#include <cstdint>

namespace asqueue::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t ToUnixMillis(TimePoint tp);

int64_t NowUnixMillis();

} // namespace asqueue::util
