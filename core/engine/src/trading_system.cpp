#include "autotrader/engine/trading_system.hpp"

#include "autotrader/domain/codec.hpp"
#include "autotrader/domain/errors.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace autotrader {

// -----------------------------------------------------------------------------
// Constructor: wire components leaf-first
// -----------------------------------------------------------------------------
TradingSystem::TradingSystem(IStateStore& store, IExecutionClient& execution,
                             const ITimeProvider& time_provider,
                             EngineConfig config, StrategyRegistry registry)
    : time_provider_(time_provider),
      config_(std::move(config)),
      bus_(time_provider) {
  orders_ = std::make_unique<OrderLedger>(store, time_provider_);
  positions_ = std::make_unique<PositionLedger>(store, time_provider_);
  engine_ = std::make_unique<TradingEngine>(*orders_, *positions_, execution,
                                            bus_);
  strategy_states_ = std::make_unique<StrategyStateStore>(store, time_provider_);
  strategy_manager_ = std::make_unique<StrategyManager>(
      std::move(registry), *strategy_states_, *engine_, bus_, time_provider_,
      config_.trading);
  ingestion_ = std::make_unique<DataIngestionLoop>(
      [this](const domain::DataPoint& point) { handleDataPoint(point); });
}

TradingSystem::~TradingSystem() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradingSystem::start() {
  std::lock_guard lifecycle(lifecycle_mutex_);
  if (running_.load()) {
    return;
  }

  ingestion_->start();
  running_.store(true);

  for (const StrategyConfig& sc : config_.strategies) {
    if (strategy_manager_->hasStrategy(sc.id)) {
      continue;
    }
    try {
      strategy_manager_->addStrategy(sc.id, sc.type, sc.symbol, sc.params);
    } catch (const Error& e) {
      std::cerr << "[TradingSystem] Could not start strategy " << sc.id << ": "
                << e.what() << std::endl;
      bus_.emit(EventType::SystemError, {{"component", "trading_system"},
                                         {"operation", "start_strategy"},
                                         {"strategy_id", sc.id},
                                         {"error", e.what()}});
    }
  }

  bus_.emit(EventType::SystemStatus,
            {{"status", "started"},
             {"strategies", strategy_manager_->strategyCount()}});
  std::cout << "[TradingSystem] Started with "
            << strategy_manager_->strategyCount() << " strategies"
            << std::endl;
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
BatchResult TradingSystem::stop() {
  std::lock_guard lifecycle(lifecycle_mutex_);
  if (!running_.load()) {
    return {};
  }

  running_.store(false);
  const std::size_t discarded = ingestion_->stop();

  BatchResult closed = engine_->closeAllPositions({{"reason", "system_shutdown"}});

  bus_.emit(EventType::SystemStatus,
            {{"status", "stopped"},
             {"discarded_points", discarded},
             {"positions_closed", closed.succeeded.size()},
             {"positions_failed", closed.failed.size()}});
  std::cout << "[TradingSystem] Stopped" << std::endl;
  return closed;
}

// -----------------------------------------------------------------------------
// Market data
// -----------------------------------------------------------------------------
bool TradingSystem::processMarketData(domain::DataPoint point) {
  if (!running_.load()) {
    std::cerr << "[TradingSystem] Not running, ignoring " << point.data_type
              << " point for " << point.symbol << std::endl;
    return false;
  }
  return ingestion_->push(std::move(point));
}

bool TradingSystem::processMarketData(const std::string& symbol,
                                      const std::string& data_type,
                                      nlohmann::json value) {
  domain::DataPoint point;
  point.data_type = data_type;
  point.symbol = symbol;
  point.timestamp = ms_to_timestamp(time_provider_.now_ms());
  point.value = std::move(value);
  return processMarketData(std::move(point));
}

std::optional<double> TradingSystem::markPrice(const domain::DataPoint& point) {
  if (point.data_type == domain::kPriceData && point.value.is_number()) {
    return point.value.get<double>();
  }
  if (point.data_type == domain::kCandleData && point.value.is_object()) {
    auto close = point.value.find("close");
    if (close != point.value.end() && close->is_number()) {
      return close->get<double>();
    }
  }
  return std::nullopt;
}

void TradingSystem::setMarkPriceListener(MarkPriceListener listener) {
  std::lock_guard lock(listener_mutex_);
  mark_price_listener_ = std::move(listener);
}

void TradingSystem::handleDataPoint(const domain::DataPoint& point) {
  std::optional<double> price = markPrice(point);
  if (price && *price <= 0.0) {
    price.reset();
  }

  if (price) {
    MarkPriceListener listener;
    {
      std::lock_guard lock(listener_mutex_);
      listener = mark_price_listener_;
    }
    if (listener) {
      listener(point.symbol, *price);
    }
  }

  strategy_manager_->processData(point);

  if (price) {
    engine_->updatePositions(point.symbol, *price);
  }
}

// -----------------------------------------------------------------------------
// Strategy management
// -----------------------------------------------------------------------------
void TradingSystem::addStrategy(const std::string& id, const std::string& type,
                                const std::string& symbol,
                                nlohmann::json params) {
  strategy_manager_->addStrategy(id, type, symbol, std::move(params));
}

void TradingSystem::removeStrategy(const std::string& id) {
  strategy_manager_->removeStrategy(id);
}

void TradingSystem::setStrategyActive(const std::string& id, bool active) {
  strategy_manager_->setStrategyActive(id, active);
}

// -----------------------------------------------------------------------------
// Projections
// -----------------------------------------------------------------------------
nlohmann::json TradingSystem::getSystemStatus() const {
  return {
      {"running", running_.load()},
      {"timestamp", to_iso8601(ms_to_timestamp(time_provider_.now_ms()))},
      {"strategies", strategy_manager_->getStrategySummary()},
      {"positions", engine_->getPositionSummary()},
      {"ingestion",
       {{"pending", ingestion_->pendingCount()},
        {"processed", ingestion_->processedCount()},
        {"failed", ingestion_->failedCount()},
        {"discarded", ingestion_->discardedCount()}}},
  };
}

nlohmann::json TradingSystem::getTradeHistory(const TradeFilter& filter) const {
  nlohmann::json trades = nlohmann::json::array();
  for (const domain::Trade& trade : engine_->getTradeHistory(filter)) {
    trades.push_back(trade);
  }
  return {{"total_trades", trades.size()}, {"trades", trades}};
}

}  // namespace autotrader
