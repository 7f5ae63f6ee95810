#pragma once

#include <cstdint>

namespace autotrader {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract clock
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" for every component that stamps a record (orders,
//         trades, positions, signals, events, store TTLs).
//
// @details
// Components never call std::chrono::system_clock directly. They hold a
// const reference to an ITimeProvider injected at construction:
//
//   - LiveTimeProvider:       wall-clock time, used by the executable.
//   - SimulationTimeProvider: manually advanced time, used by tests and by
//                             historical replays so that signal expiry,
//                             trade ordering and TTL expiry are
//                             deterministic.
//
// Thread-safety: Implementations must be safe to call from any thread.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch
  //         (1970-01-01 00:00:00 UTC).
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace autotrader
