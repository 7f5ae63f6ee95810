#pragma once

#include "autotrader/config/engine_config.hpp"
#include "autotrader/domain/data_point.hpp"
#include "autotrader/engine/trading_engine.hpp"
#include "autotrader/eventbus/event_bus.hpp"
#include "autotrader/strategy/i_strategy.hpp"
#include "autotrader/strategy/strategy_registry.hpp"
#include "autotrader/strategy/strategy_state_store.hpp"
#include "autotrader/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace autotrader {

// -----------------------------------------------------------------------------
// StrategyManager: running strategy instances
// -----------------------------------------------------------------------------
//
// @brief  Owns every running strategy, routes DataPoints to them, and
//         forwards their validated signals to the TradingEngine.
//
// @details
// Routing: a point reaches a strategy only when the strategy's symbol
// equals the point's symbol and its dataRequirements() contain the point's
// data_type.
//
// Per strategy and point:
//   processData → generateSignal → validateSignal → emit strategy_signal
//   → TradingEngine::executeMarketOrder(stop_loss from
//     TradingConfig::default_stop_loss_percent)
//
// A failure anywhere in that chain is logged, emitted as system_error, and
// does not affect the other strategies or later points.
//
// Lifecycle events: strategy_started (add), strategy_stopped (remove),
// strategy_updated (pause/resume).
//
// Thread model:
//   The strategy map is guarded by mutex_, which is never held while a
//   strategy or the engine runs; strategies are shared with in-flight
//   processing through shared_ptr so removal cannot destroy one mid-call.
//   processData() is meant to be driven by one thread (the ingestion
//   worker).
// -----------------------------------------------------------------------------
class StrategyManager {
 public:
  StrategyManager(StrategyRegistry registry, StrategyStateStore& states,
                  TradingEngine& engine, EventBus& bus,
                  const ITimeProvider& time_provider,
                  const TradingConfig& trading_config);

  StrategyManager(const StrategyManager&) = delete;
  StrategyManager& operator=(const StrategyManager&) = delete;
  StrategyManager(StrategyManager&&) = delete;
  StrategyManager& operator=(StrategyManager&&) = delete;

  // -------------------------------------------------------------------------
  // addStrategy(id, type, symbol, params)
  // -------------------------------------------------------------------------
  // @brief  Builds the strategy through the registry, initializes it and
  //         emits strategy_started.
  //
  // @details
  // TradingConfig::risk_factor is supplied as "risk_factor" when `params`
  // does not set one.
  //
  // @throws InvalidStateError if `id` is already running.
  // @throws NotFoundError     if `type` is not registered.
  // @throws ValidationError   for invalid params.
  // -------------------------------------------------------------------------
  void addStrategy(const std::string& id, const std::string& type,
                   const std::string& symbol,
                   nlohmann::json params = nlohmann::json::object());

  // -------------------------------------------------------------------------
  // removeStrategy(id)
  // -------------------------------------------------------------------------
  // @brief  Cleans the strategy up (persisting it inactive), drops it and
  //         emits strategy_stopped.
  //
  // @throws NotFoundError if `id` is not running.
  // -------------------------------------------------------------------------
  void removeStrategy(const std::string& id);

  // Pauses or resumes signal generation and emits strategy_updated.
  // @throws NotFoundError if `id` is not running.
  void setStrategyActive(const std::string& id, bool active);

  // Routes one point. Never throws for a strategy or order failure.
  void processData(const domain::DataPoint& point);

  // JSON array with one {"type", "state", "data_requirements"} object per
  // strategy, ordered by id.
  nlohmann::json getStrategySummary() const;

  bool hasStrategy(const std::string& id) const;
  std::size_t strategyCount() const;

  // Counters for status reporting.
  std::size_t signalsGenerated() const;
  std::size_t signalsRejected() const;
  std::size_t ordersSubmitted() const;

 private:
  struct Entry {
    std::string type;
    std::shared_ptr<IStrategy> strategy;
  };

  std::shared_ptr<IStrategy> find(const std::string& id) const;

  // One strategy, one point. Failures are contained here.
  void runStrategy(IStrategy& strategy, const domain::DataPoint& point);

  double stopLossFor(const domain::Signal& signal) const;

  void emitSystemError(const std::string& strategy_id, const char* operation,
                       const std::string& error);

  const StrategyRegistry registry_;
  StrategyStateStore& states_;
  TradingEngine& engine_;
  EventBus& bus_;
  const ITimeProvider& time_provider_;
  const TradingConfig trading_config_;

  mutable std::mutex mutex_;  // Protects strategies_ and the counters
  std::map<std::string, Entry> strategies_;
  std::size_t signals_generated_{0};
  std::size_t signals_rejected_{0};
  std::size_t orders_submitted_{0};
};

}  // namespace autotrader
