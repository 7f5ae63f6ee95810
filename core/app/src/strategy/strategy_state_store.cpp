#include "autotrader/strategy/strategy_state_store.hpp"

#include "autotrader/domain/codec.hpp"
#include "autotrader/domain/errors.hpp"

namespace autotrader {

StrategyStateStore::StrategyStateStore(IStateStore& store,
                                       const ITimeProvider& time_provider)
    : store_(store), time_provider_(time_provider) {}

std::optional<domain::StrategyState> StrategyStateStore::load(
    const std::string& strategy_id) {
  const std::string key = strategyStateKey(strategy_id);
  auto raw = store_.get(key);
  if (!raw) {
    return std::nullopt;
  }
  try {
    return raw->get<domain::StrategyState>();
  } catch (const nlohmann::json::exception& e) {
    throw ValidationError("corrupt record at '" + key + "': " + e.what());
  }
}

domain::StrategyState StrategyStateStore::loadOrCreate(
    const std::string& strategy_id, const std::string& symbol) {
  if (auto existing = load(strategy_id)) {
    return *existing;
  }

  domain::StrategyState state;
  state.strategy_id = strategy_id;
  state.symbol = symbol;
  state.active = true;
  save(state);
  return state;
}

void StrategyStateStore::save(domain::StrategyState& state) {
  state.last_update = ms_to_timestamp(time_provider_.now_ms());
  const std::string key = strategyStateKey(state.strategy_id);
  if (!store_.set(key, state)) {
    throw StoreUnavailableError("state store rejected write of '" + key + "'");
  }
}

}  // namespace autotrader
