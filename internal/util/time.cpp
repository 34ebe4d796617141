#include "time.hpp"

namespace docman::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t NowMs() {
  return ToUnixMillis(Now());
}

int64_t FileTimeNanos(std::filesystem::file_time_type ft) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(ft.time_since_epoch()).count();
}

} // namespace docman::util
