#pragma once

#include "autotrader/concurrent/data_ingestion_loop.hpp"
#include "autotrader/config/engine_config.hpp"
#include "autotrader/domain/data_point.hpp"
#include "autotrader/engine/strategy_manager.hpp"
#include "autotrader/engine/trading_engine.hpp"
#include "autotrader/eventbus/event_bus.hpp"
#include "autotrader/execution/i_execution_client.hpp"
#include "autotrader/ledger/order_ledger.hpp"
#include "autotrader/ledger/position_ledger.hpp"
#include "autotrader/store/i_state_store.hpp"
#include "autotrader/strategy/strategy_registry.hpp"
#include "autotrader/strategy/strategy_state_store.hpp"
#include "autotrader/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// TradingSystem: process-level root
// -----------------------------------------------------------------------------
//
// @brief  Builds and owns the EventBus, ledgers, TradingEngine,
//         StrategyManager and DataIngestionLoop, and exposes the
//         operations an outer surface (CLI, gateway, tests) needs.
//
// @details
// Construction order (destruction is the reverse):
//   EventBus → OrderLedger, PositionLedger → TradingEngine →
//   StrategyStateStore → StrategyManager → DataIngestionLoop
//
// Data path: processMarketData() queues a DataPoint. For a "price" point
// (numeric value) or a "candle" point (value.close) the ingestion worker
// first reports the mark price to the MarkPriceListener, if one is set. It
// then hands the point to StrategyManager::processData() and marks open
// positions on that symbol through TradingEngine::updatePositions() so
// stop-losses react to the same tick.
//
// start() launches the ingestion worker, starts the strategies listed in
// the config and emits system_status. stop() halts ingestion without
// draining, closes every open position best-effort with
// {"reason": "system_shutdown"}, and emits system_status.
//
// Thread model: start(), stop() and every accessor are safe from any
// thread. The store, execution client and clock are injected by reference
// and must outlive the system.
// -----------------------------------------------------------------------------
class TradingSystem {
 public:
  // Called on the ingestion thread with (symbol, price) for every point
  // that carries a positive mark price, before any strategy sees it.
  using MarkPriceListener =
      std::function<void(const std::string& symbol, double price)>;

  TradingSystem(IStateStore& store, IExecutionClient& execution,
                const ITimeProvider& time_provider, EngineConfig config,
                StrategyRegistry registry = StrategyRegistry::withBuiltins());

  // Calls stop().
  ~TradingSystem();

  TradingSystem(const TradingSystem&) = delete;
  TradingSystem& operator=(const TradingSystem&) = delete;
  TradingSystem(TradingSystem&&) = delete;
  TradingSystem& operator=(TradingSystem&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Starts ingestion and the configured strategies. Idempotent.
  //
  // @details
  // A configured strategy that fails to start is logged and emitted as
  // system_error; the others still start.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Stops ingestion (discarding queued points) and closes all open
  //         positions. Idempotent.
  //
  // @return Outcome of the shutdown close-all; empty if already stopped.
  // -------------------------------------------------------------------------
  BatchResult stop();

  bool isRunning() const { return running_.load(); }

  // Queues `point` for the ingestion worker. Returns false (and logs) when
  // the system is not running.
  bool processMarketData(domain::DataPoint point);

  // Builds a DataPoint stamped with the current time and queues it.
  bool processMarketData(const std::string& symbol, const std::string& data_type,
                         nlohmann::json value);

  // Replaces the mark price listener. An empty function removes it.
  void setMarkPriceListener(MarkPriceListener listener);

  void addStrategy(const std::string& id, const std::string& type,
                   const std::string& symbol,
                   nlohmann::json params = nlohmann::json::object());
  void removeStrategy(const std::string& id);
  void setStrategyActive(const std::string& id, bool active);

  // {"running", "timestamp", "strategies", "positions", "ingestion"}.
  nlohmann::json getSystemStatus() const;

  // {"total_trades", "trades"} for trades matching `filter`.
  nlohmann::json getTradeHistory(const TradeFilter& filter = {}) const;

  EventBus& eventBus() { return bus_; }
  TradingEngine& tradingEngine() { return *engine_; }
  StrategyManager& strategyManager() { return *strategy_manager_; }
  OrderLedger& orderLedger() { return *orders_; }
  PositionLedger& positionLedger() { return *positions_; }
  const EngineConfig& config() const { return config_; }

 private:
  // Ingestion handler: strategies first, then position marking.
  void handleDataPoint(const domain::DataPoint& point);

  // Mark price carried by `point`, if any.
  static std::optional<double> markPrice(const domain::DataPoint& point);

  const ITimeProvider& time_provider_;
  const EngineConfig config_;

  EventBus bus_;
  std::unique_ptr<OrderLedger> orders_;
  std::unique_ptr<PositionLedger> positions_;
  std::unique_ptr<TradingEngine> engine_;
  std::unique_ptr<StrategyStateStore> strategy_states_;
  std::unique_ptr<StrategyManager> strategy_manager_;
  std::unique_ptr<DataIngestionLoop> ingestion_;

  mutable std::mutex listener_mutex_;
  MarkPriceListener mark_price_listener_;

  std::mutex lifecycle_mutex_;  // Serializes start()/stop()
  std::atomic<bool> running_{false};
};

}  // namespace autotrader
