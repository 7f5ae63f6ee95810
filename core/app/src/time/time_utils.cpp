#include "autotrader/time/time_utils.hpp"
#include "autotrader/domain/errors.hpp"

#include <cstdio>
#include <ctime>

namespace autotrader {

// -----------------------------------------------------------------------------
// to_iso8601
// -----------------------------------------------------------------------------
std::string to_iso8601(Timestamp tp) {
  std::int64_t ms = timestamp_to_ms(tp);

  // Floor division so that pre-epoch times keep a positive millisecond part.
  std::int64_t seconds = ms / 1000;
  std::int64_t millis = ms % 1000;
  if (millis < 0) {
    millis += 1000;
    seconds -= 1;
  }

  std::time_t t = static_cast<std::time_t>(seconds);
  std::tm tm{};
  gmtime_r(&t, &tm);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                tm.tm_min, tm.tm_sec, static_cast<int>(millis));
  return buf;
}

// -----------------------------------------------------------------------------
// from_iso8601
// -----------------------------------------------------------------------------
Timestamp from_iso8601(const std::string& text) {
  std::tm tm{};
  int consumed = 0;
  int matched = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                            &tm.tm_year, &tm.tm_mon, &tm.tm_mday, &tm.tm_hour,
                            &tm.tm_min, &tm.tm_sec, &consumed);
  if (matched != 6) {
    throw ValidationError("invalid ISO-8601 timestamp: '" + text + "'");
  }

  tm.tm_year -= 1900;
  tm.tm_mon -= 1;

  // Optional ".mmm" fraction. Digits beyond milliseconds are ignored.
  std::int64_t millis = 0;
  std::size_t pos = static_cast<std::size_t>(consumed);
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 3) {
        millis = millis * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      throw ValidationError("invalid ISO-8601 fraction: '" + text + "'");
    }
    for (; digits < 3; ++digits) {
      millis *= 10;
    }
  }
  if (pos < text.size() && text[pos] == 'Z') {
    ++pos;
  }
  if (pos != text.size()) {
    throw ValidationError("trailing characters in timestamp: '" + text + "'");
  }

  std::int64_t seconds = static_cast<std::int64_t>(timegm(&tm));
  return ms_to_timestamp(seconds * 1000 + millis);
}

}  // namespace autotrader
