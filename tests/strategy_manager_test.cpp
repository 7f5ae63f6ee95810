// =============================================================================
// strategy_manager_test.cpp
// =============================================================================
// Unit tests for autotrader::StrategyManager.
//
// Validates:
//   - addStrategy builds through the registry, initializes, emits
//     strategy_started, and injects the configured risk_factor
//   - Duplicate ids and unknown types are rejected
//   - Points are routed by symbol and data type only
//   - A valid signal becomes a market order with the configured stop-loss
//   - A throwing strategy is isolated from the others
//   - Rejected signals and failed orders are counted, not propagated
//   - removeStrategy / setStrategyActive lifecycle and events
//
// Design: processData() is driven synchronously from the test thread. A
// scripted strategy registered next to the built-ins makes failure modes
// deterministic.
// =============================================================================

#include "autotrader/domain/errors.hpp"
#include "autotrader/engine/strategy_manager.hpp"
#include "autotrader/engine/trading_engine.hpp"
#include "autotrader/eventbus/event_bus.hpp"
#include "autotrader/execution/mock_execution_client.hpp"
#include "autotrader/ledger/order_ledger.hpp"
#include "autotrader/ledger/position_ledger.hpp"
#include "autotrader/store/in_memory_state_store.hpp"
#include "autotrader/strategy/strategy_base.hpp"
#include "autotrader/strategy/strategy_registry.hpp"
#include "autotrader/strategy/strategy_state_store.hpp"
#include "autotrader/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

using autotrader::EventType;
using autotrader::domain::DataPoint;
using autotrader::domain::Side;

namespace {

// Emits a buy at every price point it sees. params.mode selects a failure:
//   "throw"  -> processData() throws
//   "reject" -> validateSignalHook() rejects every signal
class ScriptedStrategy final : public autotrader::StrategyBase {
 public:
  explicit ScriptedStrategy(const autotrader::StrategyContext& ctx)
      : StrategyBase(ctx.id, ctx.symbol, ctx.states, ctx.time_provider),
        mode_(ctx.params.value("mode", std::string("signal"))) {}

  void processData(const DataPoint& point) override {
    if (mode_ == "throw") {
      throw std::runtime_error("scripted failure");
    }
    last_price_ = point.value.get<double>();
  }

  std::optional<autotrader::domain::Signal> generateSignal() override {
    if (!isActive() || !last_price_) {
      return std::nullopt;
    }
    autotrader::domain::Signal s;
    s.strategy_id = id();
    s.symbol = symbol();
    s.side = Side::Buy;
    s.size = 1.0;
    s.price = *last_price_;
    s.confidence = 0.5;
    s.timestamp = autotrader::ms_to_timestamp(timeProvider().now_ms());
    last_price_.reset();
    return s;
  }

  std::set<std::string> dataRequirements() const override {
    return {autotrader::domain::kPriceData};
  }

  bool validateSignalHook(const autotrader::domain::Signal&) const override {
    return mode_ != "reject";
  }

 private:
  const std::string mode_;
  std::optional<double> last_price_;
};

DataPoint pricePoint(const std::string& symbol, double price) {
  DataPoint p;
  p.data_type = autotrader::domain::kPriceData;
  p.symbol = symbol;
  p.value = price;
  return p;
}

autotrader::StrategyRegistry registryWithScripted() {
  auto registry = autotrader::StrategyRegistry::withBuiltins();
  registry.registerFactory("scripted", [](const autotrader::StrategyContext& ctx) {
    return std::make_unique<ScriptedStrategy>(ctx);
  });
  return registry;
}

}  // namespace

// =============================================================================
// Test fixture: full engine stack over an in-memory store.
// =============================================================================
class StrategyManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    clock.advance_time(1700000000000);
    execution.setMarketPrice("SOL-USDC", 100.0);
    trading.default_stop_loss_percent = 0.1;
    trading.risk_factor = 0.03;
    manager = std::make_unique<autotrader::StrategyManager>(
        registryWithScripted(), states, engine, bus, clock, trading);
  }

  std::size_t historyCount(EventType type) {
    return bus.getHistory(type, 0).size();
  }

  autotrader::SimulationTimeProvider clock;
  autotrader::InMemoryStateStore store{clock};
  autotrader::OrderLedger orders{store, clock};
  autotrader::PositionLedger positions{store, clock};
  autotrader::MockExecutionClient execution;
  autotrader::EventBus bus{clock};
  autotrader::TradingEngine engine{orders, positions, execution, bus};
  autotrader::StrategyStateStore states{store, clock};
  autotrader::TradingConfig trading;
  std::unique_ptr<autotrader::StrategyManager> manager;
};

// -----------------------------------------------------------------------------
// 1. addStrategy emits strategy_started with the effective params.
// -----------------------------------------------------------------------------
TEST_F(StrategyManagerTest, AddStrategyEmitsStarted) {
  manager->addStrategy("s1", "scripted", "SOL-USDC");

  EXPECT_TRUE(manager->hasStrategy("s1"));
  EXPECT_EQ(manager->strategyCount(), 1u);

  const auto started = bus.getHistory(EventType::StrategyStarted);
  ASSERT_EQ(started.size(), 1u);
  EXPECT_EQ(started[0].payload["strategy_id"], "s1");
  EXPECT_EQ(started[0].payload["type"], "scripted");
  EXPECT_EQ(started[0].payload["active"], true);
  EXPECT_DOUBLE_EQ(started[0].payload["params"]["risk_factor"].get<double>(), 0.03);
}

// -----------------------------------------------------------------------------
// 2. Duplicate ids, unknown types and non-object params are rejected.
// -----------------------------------------------------------------------------
TEST_F(StrategyManagerTest, AddStrategyRejectsInvalid) {
  manager->addStrategy("s1", "scripted", "SOL-USDC");
  EXPECT_THROW(manager->addStrategy("s1", "scripted", "SOL-USDC"),
               autotrader::InvalidStateError);
  EXPECT_THROW(manager->addStrategy("s2", "no_such_type", "SOL-USDC"),
               autotrader::NotFoundError);
  EXPECT_THROW(manager->addStrategy("s3", "scripted", "SOL-USDC", nlohmann::json::array()),
               autotrader::ValidationError);
  EXPECT_EQ(manager->strategyCount(), 1u);
}

// -----------------------------------------------------------------------------
// 3. A signal becomes a filled order and an open position whose stop-loss
//    is price * (1 - default_stop_loss_percent).
// -----------------------------------------------------------------------------
TEST_F(StrategyManagerTest, SignalBecomesOrder) {
  manager->addStrategy("s1", "scripted", "SOL-USDC");
  manager->processData(pricePoint("SOL-USDC", 100.0));

  EXPECT_EQ(manager->signalsGenerated(), 1u);
  EXPECT_EQ(manager->ordersSubmitted(), 1u);
  EXPECT_EQ(historyCount(EventType::StrategySignal), 1u);

  const auto open = positions.openPositions();
  ASSERT_EQ(open.size(), 1u);
  EXPECT_DOUBLE_EQ(open[0].stop_loss.value_or(0), 90.0);
  EXPECT_EQ(open[0].metadata["strategy_id"], "s1");
  EXPECT_EQ(open[0].metadata["signal_type"], "entry");
  EXPECT_DOUBLE_EQ(open[0].metadata["confidence"].get<double>(), 0.5);
}

// -----------------------------------------------------------------------------
// 4. Routing: other symbols and unrequested data types are not delivered.
// -----------------------------------------------------------------------------
TEST_F(StrategyManagerTest, RoutesBySymbolAndType) {
  manager->addStrategy("s1", "scripted", "SOL-USDC");

  manager->processData(pricePoint("ETH-USDC", 2000.0));
  DataPoint candle;
  candle.data_type = autotrader::domain::kCandleData;
  candle.symbol = "SOL-USDC";
  candle.value = {{"close", 100.0}, {"volume", 1.0}};
  manager->processData(candle);

  EXPECT_EQ(manager->signalsGenerated(), 0u);
  EXPECT_TRUE(positions.openPositions().empty());
}

// -----------------------------------------------------------------------------
// 5. A throwing strategy reports system_error; its neighbour still trades.
// Why: one broken strategy must not take the others down.
// -----------------------------------------------------------------------------
TEST_F(StrategyManagerTest, FailingStrategyIsIsolated) {
  manager->addStrategy("bad", "scripted", "SOL-USDC", {{"mode", "throw"}});
  manager->addStrategy("good", "scripted", "SOL-USDC");

  manager->processData(pricePoint("SOL-USDC", 100.0));

  EXPECT_EQ(manager->ordersSubmitted(), 1u);
  const auto errors = bus.getHistory(EventType::SystemError);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].payload["component"], "strategy_manager");
  EXPECT_EQ(errors[0].payload["strategy_id"], "bad");
  EXPECT_EQ(errors[0].payload["operation"], "process_data");
}

// -----------------------------------------------------------------------------
// 6. A rejected signal is counted and never reaches the engine.
// -----------------------------------------------------------------------------
TEST_F(StrategyManagerTest, RejectedSignalIsNotExecuted) {
  manager->addStrategy("s1", "scripted", "SOL-USDC", {{"mode", "reject"}});
  manager->processData(pricePoint("SOL-USDC", 100.0));

  EXPECT_EQ(manager->signalsGenerated(), 1u);
  EXPECT_EQ(manager->signalsRejected(), 1u);
  EXPECT_EQ(manager->ordersSubmitted(), 0u);
  EXPECT_EQ(historyCount(EventType::StrategySignal), 0u);
  EXPECT_EQ(historyCount(EventType::OrderPlaced), 0u);
}

// -----------------------------------------------------------------------------
// 7. An order failure is reported as system_error and does not throw.
// -----------------------------------------------------------------------------
TEST_F(StrategyManagerTest, OrderFailureIsReported) {
  manager->addStrategy("s1", "scripted", "BONK-USDC");  // no market price
  EXPECT_NO_THROW(manager->processData(pricePoint("BONK-USDC", 0.00002)));

  EXPECT_EQ(manager->ordersSubmitted(), 0u);
  bool saw_execute_signal = false;
  for (const auto& e : bus.getHistory(EventType::SystemError)) {
    if (e.payload["operation"] == "execute_signal") {
      saw_execute_signal = true;
      EXPECT_EQ(e.payload["strategy_id"], "s1");
    }
  }
  EXPECT_TRUE(saw_execute_signal);
}

// -----------------------------------------------------------------------------
// 8. Pausing stops signals; removing persists the strategy inactive.
// -----------------------------------------------------------------------------
TEST_F(StrategyManagerTest, PauseAndRemove) {
  manager->addStrategy("s1", "scripted", "SOL-USDC");

  manager->setStrategyActive("s1", false);
  manager->processData(pricePoint("SOL-USDC", 100.0));
  EXPECT_EQ(manager->signalsGenerated(), 0u);
  EXPECT_EQ(historyCount(EventType::StrategyUpdated), 1u);

  manager->removeStrategy("s1");
  EXPECT_FALSE(manager->hasStrategy("s1"));
  EXPECT_EQ(historyCount(EventType::StrategyStopped), 1u);
  EXPECT_FALSE(states.load("s1")->active);

  EXPECT_THROW(manager->removeStrategy("s1"), autotrader::NotFoundError);
  EXPECT_THROW(manager->setStrategyActive("s1", true), autotrader::NotFoundError);
}

// -----------------------------------------------------------------------------
// 9. getStrategySummary lists every strategy with its state, ordered by id.
// -----------------------------------------------------------------------------
TEST_F(StrategyManagerTest, StrategySummary) {
  manager->addStrategy("b_ma", "ma_crossover", "SOL-USDC");
  manager->addStrategy("a_scripted", "scripted", "ETH-USDC");

  const auto summary = manager->getStrategySummary();
  ASSERT_EQ(summary.size(), 2u);
  EXPECT_EQ(summary[0]["state"]["strategy_id"], "a_scripted");
  EXPECT_EQ(summary[0]["data_requirements"], nlohmann::json::array({"price"}));
  EXPECT_EQ(summary[1]["type"], "ma_crossover");
  EXPECT_EQ(summary[1]["state"]["active"], true);
}
