#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock time point used by every record and event. All timestamps the
// engine creates come from ITimeProvider::now_ms(), so they carry
// millisecond precision and survive a round trip through the ISO-8601 form
// used in the state store unchanged.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Conversions between epoch milliseconds, Timestamp and the
//         canonical ISO-8601 UTC string form ("2024-01-01T12:00:00.000Z").
//
// Thread-safety: Stateless. Safe to call from any thread (the ISO helpers use
//                the reentrant gmtime_r/timegm).
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// to_iso8601
// -------------------------------------------------------------------------
// @brief  Formats a Timestamp as "YYYY-MM-DDTHH:MM:SS.mmmZ" (UTC).
//
// @details
// Sub-millisecond precision is truncated. Times before the epoch are
// formatted with a floored second and a positive millisecond field.
// -------------------------------------------------------------------------
std::string to_iso8601(Timestamp tp);

// -------------------------------------------------------------------------
// from_iso8601
// -------------------------------------------------------------------------
// @brief  Parses the format produced by to_iso8601(). The fractional part
//         and the trailing 'Z' are optional; a missing fraction means .000.
//
// @throws ValidationError if the string is not a valid timestamp.
// -------------------------------------------------------------------------
Timestamp from_iso8601(const std::string& text);

}  // namespace autotrader
