#pragma once

#include "autotrader/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace autotrader {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: manually driven clock
// -----------------------------------------------------------------------------
//
// @brief  Returns whatever time was last set through advance_time() or
//         advance_by().
//
// @details
// Used by tests and by replays of recorded market data. The clock starts at
// the value given to the constructor (0 by default). Monotonicity is the
// caller's responsibility; advance_time() accepts any value so tests can
// position the clock freely.
//
// Thread-safety: now_ms(), advance_time() and advance_by() are atomic and
//                safe to call from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock to new_time_ms.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace autotrader
