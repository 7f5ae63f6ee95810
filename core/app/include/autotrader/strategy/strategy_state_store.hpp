#pragma once

#include "autotrader/domain/strategy_state.hpp"
#include "autotrader/store/i_state_store.hpp"
#include "autotrader/time/i_time_provider.hpp"

#include <optional>
#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// StrategyStateStore
// -----------------------------------------------------------------------------
// Typed access to "strategy:{id}:state" records. Stateless apart from the
// references it holds; safe to share between strategies and threads as far
// as the underlying IStateStore is.
// -----------------------------------------------------------------------------
class StrategyStateStore {
 public:
  StrategyStateStore(IStateStore& store, const ITimeProvider& time_provider);

  // Persisted state, or std::nullopt. Throws ValidationError for a record
  // that cannot be decoded.
  std::optional<domain::StrategyState> load(const std::string& strategy_id);

  // Persisted state if present, otherwise a fresh active state that is
  // persisted before being returned.
  domain::StrategyState loadOrCreate(const std::string& strategy_id,
                                     const std::string& symbol);

  // Stamps last_update from the clock and writes the record. Throws
  // StoreUnavailableError if the store declines the write.
  void save(domain::StrategyState& state);

 private:
  IStateStore& store_;
  const ITimeProvider& time_provider_;
};

}  // namespace autotrader
