#include "time.hpp"

#include <ctime>

namespace ingest::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

std::string FormatUtc(TimePoint tp, const char* format) {
  const std::time_t seconds = Clock::to_time_t(tp);
  std::tm           utc{};
  gmtime_r(&seconds, &utc);

  char buffer[64];
  const auto written = std::strftime(buffer, sizeof(buffer), format, &utc);
  return std::string(buffer, written);
}

std::string ToIso8601(TimePoint tp) {
  return FormatUtc(tp, "%Y-%m-%dT%H:%M:%SZ");
}

} // namespace ingest::util
