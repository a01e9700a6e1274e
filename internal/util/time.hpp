#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace ingest::util {

/*
  Time utilities. Records store epoch milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

uint64_t NowMillis();

// strftime-style formatting in UTC, e.g. "%Y%m%dT%H%M%SZ".
std::string FormatUtc(TimePoint tp, const char* format);

// 2024-01-31T12:00:00Z
std::string ToIso8601(TimePoint tp);

} // namespace ingest::util
