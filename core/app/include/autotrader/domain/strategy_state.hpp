#pragma once

#include "autotrader/domain/order.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace autotrader {
namespace domain {

// -----------------------------------------------------------------------------
// StrategyState
// -----------------------------------------------------------------------------
// Persisted per strategy instance under "strategy:{id}:state". Created when a
// strategy is first activated, set inactive (never deleted) when it is
// removed. `current_position` is null or a JSON reference to the position
// the strategy believes it holds; `metadata` carries strategy-specific
// observability data such as the last emitted signal.
// -----------------------------------------------------------------------------
struct StrategyState {
  std::string strategy_id;
  std::string symbol;
  bool active{true};
  Timestamp last_update{};
  double position_size{0.0};
  nlohmann::json current_position;  // null when flat
  Metadata metadata = Metadata::object();
};

}  // namespace domain
}  // namespace autotrader
