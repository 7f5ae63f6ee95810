#include "autotrader/engine/strategy_manager.hpp"

#include "autotrader/domain/codec.hpp"
#include "autotrader/domain/errors.hpp"
#include "autotrader/strategy/signal_validator.hpp"

#include <exception>
#include <iostream>

namespace autotrader {

StrategyManager::StrategyManager(StrategyRegistry registry,
                                 StrategyStateStore& states,
                                 TradingEngine& engine, EventBus& bus,
                                 const ITimeProvider& time_provider,
                                 const TradingConfig& trading_config)
    : registry_(std::move(registry)),
      states_(states),
      engine_(engine),
      bus_(bus),
      time_provider_(time_provider),
      trading_config_(trading_config) {}

std::shared_ptr<IStrategy> StrategyManager::find(const std::string& id) const {
  std::lock_guard lock(mutex_);
  auto it = strategies_.find(id);
  if (it == strategies_.end()) {
    return nullptr;
  }
  return it->second.strategy;
}

void StrategyManager::emitSystemError(const std::string& strategy_id,
                                      const char* operation,
                                      const std::string& error) {
  bus_.emit(EventType::SystemError, {{"component", "strategy_manager"},
                                     {"operation", operation},
                                     {"strategy_id", strategy_id},
                                     {"error", error}});
}

// -----------------------------------------------------------------------------
// addStrategy
// -----------------------------------------------------------------------------
void StrategyManager::addStrategy(const std::string& id, const std::string& type,
                                  const std::string& symbol,
                                  nlohmann::json params) {
  if (hasStrategy(id)) {
    throw InvalidStateError("strategy already running: " + id);
  }
  if (params.is_null()) {
    params = nlohmann::json::object();
  }
  if (!params.is_object()) {
    throw ValidationError("strategy params must be a JSON object");
  }
  if (!params.contains("risk_factor")) {
    params["risk_factor"] = trading_config_.risk_factor;
  }

  StrategyContext context{id, symbol, params, states_, time_provider_};
  std::shared_ptr<IStrategy> strategy = registry_.create(type, context);
  strategy->initialize();

  {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = strategies_.emplace(id, Entry{type, strategy});
    if (!inserted) {
      throw InvalidStateError("strategy already running: " + id);
    }
  }

  bus_.emit(EventType::StrategyStarted, {{"strategy_id", id},
                                         {"type", type},
                                         {"symbol", symbol},
                                         {"params", params},
                                         {"active", strategy->isActive()}});
  std::cout << "[StrategyManager] Added " << type << " strategy " << id
            << " on " << symbol << std::endl;
}

// -----------------------------------------------------------------------------
// removeStrategy
// -----------------------------------------------------------------------------
void StrategyManager::removeStrategy(const std::string& id) {
  std::shared_ptr<IStrategy> strategy = find(id);
  if (!strategy) {
    throw NotFoundError("strategy not running: " + id);
  }

  strategy->cleanup();

  {
    std::lock_guard lock(mutex_);
    strategies_.erase(id);
  }

  bus_.emit(EventType::StrategyStopped,
            {{"strategy_id", id}, {"symbol", strategy->symbol()}});
  std::cout << "[StrategyManager] Removed strategy " << id << std::endl;
}

// -----------------------------------------------------------------------------
// setStrategyActive
// -----------------------------------------------------------------------------
void StrategyManager::setStrategyActive(const std::string& id, bool active) {
  std::shared_ptr<IStrategy> strategy = find(id);
  if (!strategy) {
    throw NotFoundError("strategy not running: " + id);
  }
  strategy->setActive(active);
  bus_.emit(EventType::StrategyUpdated,
            {{"strategy_id", id}, {"active", active}});
}

// -----------------------------------------------------------------------------
// processData
// -----------------------------------------------------------------------------
void StrategyManager::processData(const domain::DataPoint& point) {
  std::vector<std::shared_ptr<IStrategy>> targets;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, entry] : strategies_) {
      if (entry.strategy->symbol() == point.symbol) {
        targets.push_back(entry.strategy);
      }
    }
  }

  for (const auto& strategy : targets) {
    if (strategy->dataRequirements().count(point.data_type) == 0) {
      continue;
    }
    runStrategy(*strategy, point);
  }
}

double StrategyManager::stopLossFor(const domain::Signal& signal) const {
  const double pct = trading_config_.default_stop_loss_percent;
  return signal.side == domain::Side::Buy ? signal.price * (1.0 - pct)
                                          : signal.price * (1.0 + pct);
}

void StrategyManager::runStrategy(IStrategy& strategy,
                                  const domain::DataPoint& point) {
  std::optional<domain::Signal> signal;
  try {
    strategy.processData(point);
    signal = strategy.generateSignal();
  } catch (const std::exception& e) {
    std::cerr << "[StrategyManager] Strategy " << strategy.id()
              << " failed on " << point.data_type << " point: " << e.what()
              << std::endl;
    emitSystemError(strategy.id(), "process_data", e.what());
    return;
  }

  if (!signal) {
    return;
  }

  {
    std::lock_guard lock(mutex_);
    ++signals_generated_;
  }

  const Timestamp now = ms_to_timestamp(time_provider_.now_ms());
  if (!validateSignal(strategy, *signal, now)) {
    std::lock_guard lock(mutex_);
    ++signals_rejected_;
    return;
  }

  bus_.emit(EventType::StrategySignal, *signal);

  try {
    nlohmann::json metadata = signal->metadata;
    metadata["strategy_id"] = signal->strategy_id;
    metadata["signal_type"] = domain::signalTypeToString(signal->type);
    metadata["confidence"] = signal->confidence;

    engine_.executeMarketOrder(signal->symbol, signal->side, signal->size,
                               stopLossFor(*signal), std::move(metadata));

    std::lock_guard lock(mutex_);
    ++orders_submitted_;
  } catch (const std::exception& e) {
    std::cerr << "[StrategyManager] Order for signal from " << strategy.id()
              << " failed: " << e.what() << std::endl;
    emitSystemError(strategy.id(), "execute_signal", e.what());
  }
}

// -----------------------------------------------------------------------------
// Introspection
// -----------------------------------------------------------------------------
nlohmann::json StrategyManager::getStrategySummary() const {
  std::vector<std::pair<std::string, std::shared_ptr<IStrategy>>> snapshot;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, entry] : strategies_) {
      snapshot.emplace_back(entry.type, entry.strategy);
    }
  }

  nlohmann::json summary = nlohmann::json::array();
  for (const auto& [type, strategy] : snapshot) {
    summary.push_back({{"type", type},
                       {"state", strategy->state()},
                       {"data_requirements", strategy->dataRequirements()}});
  }
  return summary;
}

bool StrategyManager::hasStrategy(const std::string& id) const {
  std::lock_guard lock(mutex_);
  return strategies_.count(id) != 0;
}

std::size_t StrategyManager::strategyCount() const {
  std::lock_guard lock(mutex_);
  return strategies_.size();
}

std::size_t StrategyManager::signalsGenerated() const {
  std::lock_guard lock(mutex_);
  return signals_generated_;
}

std::size_t StrategyManager::signalsRejected() const {
  std::lock_guard lock(mutex_);
  return signals_rejected_;
}

std::size_t StrategyManager::ordersSubmitted() const {
  std::lock_guard lock(mutex_);
  return orders_submitted_;
}

}  // namespace autotrader
