#pragma once

#include "autotrader/strategy/i_strategy.hpp"
#include "autotrader/strategy/strategy_state_store.hpp"
#include "autotrader/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace autotrader {

// -----------------------------------------------------------------------------
// StrategyContext
// -----------------------------------------------------------------------------
// Everything a factory needs to build one strategy instance.
// -----------------------------------------------------------------------------
struct StrategyContext {
  std::string id;
  std::string symbol;
  nlohmann::json params = nlohmann::json::object();
  StrategyStateStore& states;
  const ITimeProvider& time_provider;
};

using StrategyFactory =
    std::function<std::unique_ptr<IStrategy>(const StrategyContext&)>;

// -----------------------------------------------------------------------------
// StrategyRegistry
// -----------------------------------------------------------------------------
//
// @brief  Maps a strategy-type tag ("ma_crossover") to the factory that
//         builds it.
//
// @details
// The StrategyManager creates every strategy through a registry, so new
// strategy types are added by registering a factory, not by editing the
// manager. withBuiltins() returns a registry holding every strategy type
// shipped with this library.
//
// Thread-safety: Not synchronized. Populate before handing the registry to
// the StrategyManager; afterwards it is only read.
// -----------------------------------------------------------------------------
class StrategyRegistry {
 public:
  StrategyRegistry() = default;

  // Registry pre-populated with the built-in strategy types.
  static StrategyRegistry withBuiltins();

  // @throws InvalidStateError if `tag` is already registered.
  // @throws std::invalid_argument if `factory` is empty.
  void registerFactory(const std::string& tag, StrategyFactory factory);

  // @throws NotFoundError if `tag` is not registered.
  std::unique_ptr<IStrategy> create(const std::string& tag,
                                    const StrategyContext& context) const;

  bool contains(const std::string& tag) const;

  // Registered tags in lexicographic order.
  std::vector<std::string> tags() const;

 private:
  std::map<std::string, StrategyFactory> factories_;
};

}  // namespace autotrader
