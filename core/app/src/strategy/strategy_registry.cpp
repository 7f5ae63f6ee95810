#include "autotrader/strategy/strategy_registry.hpp"

#include "autotrader/domain/errors.hpp"
#include "autotrader/strategy/ma_crossover_strategy.hpp"

#include <stdexcept>

namespace autotrader {

StrategyRegistry StrategyRegistry::withBuiltins() {
  StrategyRegistry registry;
  registry.registerFactory(kMaCrossoverTag, [](const StrategyContext& ctx) {
    return std::make_unique<MaCrossoverStrategy>(
        ctx.id, ctx.symbol, ctx.params, ctx.states, ctx.time_provider);
  });
  return registry;
}

void StrategyRegistry::registerFactory(const std::string& tag,
                                       StrategyFactory factory) {
  if (!factory) {
    throw std::invalid_argument("StrategyRegistry: empty factory for '" + tag +
                                "'");
  }
  auto [it, inserted] = factories_.emplace(tag, std::move(factory));
  if (!inserted) {
    throw InvalidStateError("strategy type already registered: " + tag);
  }
}

std::unique_ptr<IStrategy> StrategyRegistry::create(
    const std::string& tag, const StrategyContext& context) const {
  auto it = factories_.find(tag);
  if (it == factories_.end()) {
    throw NotFoundError("unknown strategy type: " + tag);
  }
  return it->second(context);
}

bool StrategyRegistry::contains(const std::string& tag) const {
  return factories_.count(tag) != 0;
}

std::vector<std::string> StrategyRegistry::tags() const {
  std::vector<std::string> out;
  out.reserve(factories_.size());
  for (const auto& entry : factories_) {
    out.push_back(entry.first);
  }
  return out;
}

}  // namespace autotrader
