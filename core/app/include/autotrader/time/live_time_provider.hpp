#pragma once

#include "autotrader/time/i_time_provider.hpp"

namespace autotrader {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock time source
// -----------------------------------------------------------------------------
// Delegates to std::chrono::system_clock. Stateless; safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace autotrader
