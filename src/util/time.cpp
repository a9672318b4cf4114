// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace gossipnet {
namespace util {

namespace {

bool ToUtc(std::time_t t, std::tm &out) {
#if defined(_WIN32)
  return gmtime_s(&out, &t) == 0;
#else
  return gmtime_r(&t, &out) != nullptr;
#endif
}

} // namespace

TimePoint Now() { return std::chrono::system_clock::now(); }

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

TimePoint FromUnixMillis(int64_t millis) {
  return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
      std::chrono::milliseconds(millis)));
}

std::string FormatRFC3339(TimePoint tp) {
  const int64_t millis = ToUnixMillis(tp);
  int64_t seconds = millis / 1000;
  int64_t frac = millis % 1000;
  if (frac < 0) {
    frac += 1000;
    seconds -= 1;
  }

  std::tm tm_utc{};
  if (!ToUtc(static_cast<std::time_t>(seconds), tm_utc)) {
    return "invalid";
  }

  std::ostringstream oss;
  oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.'
      << std::setw(3) << std::setfill('0') << frac << 'Z';
  return oss.str();
}

} // namespace util
} // namespace gossipnet
