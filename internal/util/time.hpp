#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>

namespace docman::util {

/*
  Time utilities. Every timestamp goes through here.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMs();

// Last-write time in nanoseconds of the filesystem clock. Only meaningful for
// equality checks against values produced by the same function.
int64_t FileTimeNanos(std::filesystem::file_time_type ft);

} // namespace docman::util
