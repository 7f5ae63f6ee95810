// =============================================================================
// order_ledger_test.cpp
// =============================================================================
// Unit tests for autotrader::OrderLedger.
//
// Validates:
//   - createOrder persists a Pending order with a prefixed id
//   - Order status only moves forward; terminal states reject every update
//   - Filled stamps filled_at; metadata updates merge
//   - A fresh ledger over the same store reads back identical records
//   - A failed store write leaves the cached record unchanged
//   - Trades inherit symbol/side from their order; attachPosition is one-shot
//   - getTrades filters by symbol and time range, ordered by timestamp
//     and then by creation sequence
// =============================================================================

#include "autotrader/domain/codec.hpp"
#include "autotrader/domain/errors.hpp"
#include "autotrader/ledger/order_ledger.hpp"
#include "autotrader/store/in_memory_state_store.hpp"
#include "autotrader/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using autotrader::OrderLedger;
using autotrader::OrderUpdate;
using autotrader::domain::OrderStatus;
using autotrader::domain::Side;

namespace {

// Store that can be told to decline writes (set() returns false) while
// still serving reads.
class DecliningStore final : public autotrader::IStateStore {
 public:
  explicit DecliningStore(const autotrader::ITimeProvider& clock) : inner_(clock) {}

  std::optional<nlohmann::json> get(const std::string& key) override {
    return inner_.get(key);
  }
  bool set(const std::string& key, const nlohmann::json& value,
           std::optional<std::chrono::seconds> ttl) override {
    if (decline_.load()) {
      return false;
    }
    return inner_.set(key, value, ttl);
  }
  bool remove(const std::string& key) override { return inner_.remove(key); }

  void setDecline(bool decline) { decline_.store(decline); }

 private:
  autotrader::InMemoryStateStore inner_;
  std::atomic<bool> decline_{false};
};

OrderUpdate statusUpdate(OrderStatus status) {
  OrderUpdate u;
  u.status = status;
  return u;
}

}  // namespace

// =============================================================================
// Test fixture: ledger over a declinable in-memory store.
// =============================================================================
class OrderLedgerTest : public ::testing::Test {
 protected:
  void SetUp() override { clock.advance_time(1700000000000); }

  autotrader::SimulationTimeProvider clock;
  DecliningStore store{clock};
  OrderLedger ledger{store, clock};
};

// -----------------------------------------------------------------------------
// 1. createOrder produces a persisted Pending order.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, CreateOrderPersistsPending) {
  const auto order = ledger.createOrder("SOL-USDC", Side::Buy, 2.0);

  EXPECT_EQ(order.id.rfind("ord_", 0), 0u);
  EXPECT_EQ(order.status, OrderStatus::Pending);
  EXPECT_EQ(order.submitted_at, autotrader::ms_to_timestamp(1700000000000));
  EXPECT_TRUE(order.metadata.is_object());

  auto raw = store.get(autotrader::orderKey(order.id));
  ASSERT_TRUE(raw.has_value());
  EXPECT_EQ((*raw)["status"], "pending");
  EXPECT_EQ((*raw)["type"], "market");
}

// -----------------------------------------------------------------------------
// 2. Non-positive size or price is rejected before anything is written.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, CreateOrderValidatesInput) {
  EXPECT_THROW(ledger.createOrder("SOL-USDC", Side::Buy, 0.0),
               autotrader::ValidationError);
  EXPECT_THROW(ledger.createOrder("SOL-USDC", Side::Sell, 1.0,
                                  autotrader::domain::OrderKind::Limit, -5.0),
               autotrader::ValidationError);
}

// -----------------------------------------------------------------------------
// 3. Pending -> Filled stamps filled_at and fill fields; Filled is terminal.
// Why: a filled order re-opened as Pending could be executed twice.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, FilledIsTerminal) {
  const auto order = ledger.createOrder("SOL-USDC", Side::Buy, 2.0);

  clock.advance_by(250);
  OrderUpdate fill = statusUpdate(OrderStatus::Filled);
  fill.filled_price = 101.5;
  fill.filled_size = 2.0;
  const auto filled = ledger.updateOrder(order.id, fill);

  EXPECT_EQ(filled.status, OrderStatus::Filled);
  ASSERT_TRUE(filled.filled_at.has_value());
  EXPECT_EQ(*filled.filled_at, autotrader::ms_to_timestamp(1700000000250));
  EXPECT_DOUBLE_EQ(*filled.filled_price, 101.5);

  for (auto next : {OrderStatus::Pending, OrderStatus::Filled,
                    OrderStatus::Failed, OrderStatus::Cancelled}) {
    EXPECT_THROW(ledger.updateOrder(order.id, statusUpdate(next)),
                 autotrader::InvalidStateError);
  }
  EXPECT_EQ(ledger.getOrder(order.id)->status, OrderStatus::Filled);
}

// -----------------------------------------------------------------------------
// 4. The transition table: Pending reaches every state, terminals none.
// -----------------------------------------------------------------------------
TEST(OrderTransitionTest, ForwardOnly) {
  const OrderStatus all[] = {OrderStatus::Pending, OrderStatus::Filled,
                             OrderStatus::Failed, OrderStatus::Cancelled};
  for (auto next : all) {
    EXPECT_TRUE(OrderLedger::transitionStatus(OrderStatus::Pending, next));
  }
  for (auto from : {OrderStatus::Filled, OrderStatus::Failed,
                    OrderStatus::Cancelled}) {
    EXPECT_TRUE(OrderLedger::isTerminal(from));
    for (auto next : all) {
      EXPECT_FALSE(OrderLedger::transitionStatus(from, next));
    }
  }
  EXPECT_FALSE(OrderLedger::isTerminal(OrderStatus::Pending));
}

// -----------------------------------------------------------------------------
// 5. Failed records the error message.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, FailedRecordsError) {
  const auto order = ledger.createOrder("SOL-USDC", Side::Sell, 1.0);
  OrderUpdate fail = statusUpdate(OrderStatus::Failed);
  fail.error = "no liquidity";

  const auto failed = ledger.updateOrder(order.id, fail);
  EXPECT_EQ(failed.status, OrderStatus::Failed);
  EXPECT_EQ(failed.error.value_or(""), "no liquidity");
}

// -----------------------------------------------------------------------------
// 6. Metadata updates merge into the existing metadata.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, MetadataMerges) {
  const auto order = ledger.createOrder("SOL-USDC", Side::Buy, 1.0,
                                        autotrader::domain::OrderKind::Market,
                                        std::nullopt, {{"strategy_id", "s1"}});
  OrderUpdate u = statusUpdate(OrderStatus::Pending);
  u.metadata = nlohmann::json{{"note", "retry"}};

  const auto updated = ledger.updateOrder(order.id, u);
  EXPECT_EQ(updated.metadata["strategy_id"], "s1");
  EXPECT_EQ(updated.metadata["note"], "retry");
  EXPECT_EQ(updated.status, OrderStatus::Pending);
}

// -----------------------------------------------------------------------------
// 7. Updating an unknown order raises NotFoundError.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, UpdateUnknownOrderThrows) {
  EXPECT_THROW(ledger.updateOrder("ord_missing", statusUpdate(OrderStatus::Cancelled)),
               autotrader::NotFoundError);
  EXPECT_FALSE(ledger.getOrder("ord_missing").has_value());
}

// -----------------------------------------------------------------------------
// 8. A fresh ledger over the same store reads back identical records.
// Why: the store is the source of truth. After a restart, the cache must
//      rebuild to exactly what was written.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, FreshLedgerReadsSameRecords) {
  const auto order = ledger.createOrder("SOL-USDC", Side::Buy, 2.0,
                                        autotrader::domain::OrderKind::Market,
                                        std::nullopt, {{"k", "v"}});
  OrderUpdate fill = statusUpdate(OrderStatus::Filled);
  fill.filled_price = 100.25;
  fill.filled_size = 2.0;
  const auto filled = ledger.updateOrder(order.id, fill);
  const auto trade = ledger.createTrade(order.id, std::nullopt, 100.25, 2.0, 0.1);

  OrderLedger fresh(store, clock);
  const auto reloaded = fresh.getOrder(order.id);
  ASSERT_TRUE(reloaded.has_value());
  EXPECT_EQ(nlohmann::json(*reloaded), nlohmann::json(filled));

  const auto reloaded_trade = fresh.getTrade(trade.id);
  ASSERT_TRUE(reloaded_trade.has_value());
  EXPECT_EQ(nlohmann::json(*reloaded_trade), nlohmann::json(trade));

  // The loaded record obeys the same transition rules.
  EXPECT_THROW(fresh.updateOrder(order.id, statusUpdate(OrderStatus::Cancelled)),
               autotrader::InvalidStateError);
}

// -----------------------------------------------------------------------------
// 9. A declined write propagates and leaves the cached order unchanged.
// Why: cache and store must never disagree about an id.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, DeclinedWriteLeavesCacheUnchanged) {
  const auto order = ledger.createOrder("SOL-USDC", Side::Buy, 2.0);

  store.setDecline(true);
  EXPECT_THROW(ledger.updateOrder(order.id, statusUpdate(OrderStatus::Cancelled)),
               autotrader::StoreUnavailableError);
  store.setDecline(false);

  EXPECT_EQ(ledger.getOrder(order.id)->status, OrderStatus::Pending);
  EXPECT_EQ((*store.get(autotrader::orderKey(order.id)))["status"], "pending");

  // The order can still be cancelled once the store accepts writes.
  EXPECT_EQ(ledger.updateOrder(order.id, statusUpdate(OrderStatus::Cancelled)).status,
            OrderStatus::Cancelled);
}

// -----------------------------------------------------------------------------
// 10. A trade takes symbol and side from its order; unknown orders fail.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, TradeInheritsFromOrder) {
  const auto order = ledger.createOrder("ETH-USDC", Side::Sell, 0.5);
  const auto trade = ledger.createTrade(order.id, std::nullopt, 2500.0, 0.5, 1.25);

  EXPECT_EQ(trade.id.rfind("trade_", 0), 0u);
  EXPECT_EQ(trade.symbol, "ETH-USDC");
  EXPECT_EQ(trade.side, Side::Sell);
  EXPECT_FALSE(trade.position_id.has_value());

  EXPECT_THROW(ledger.createTrade("ord_missing", std::nullopt, 1.0, 1.0, 0.0),
               autotrader::NotFoundError);
  EXPECT_THROW(ledger.createTrade(order.id, std::nullopt, 1.0, 1.0, -0.1),
               autotrader::ValidationError);
}

// -----------------------------------------------------------------------------
// 11. attachPosition links a trade once; a second attach is rejected.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, AttachPositionOnce) {
  const auto order = ledger.createOrder("SOL-USDC", Side::Buy, 1.0);
  const auto trade = ledger.createTrade(order.id, std::nullopt, 100.0, 1.0, 0.0);

  const auto attached = ledger.attachPosition(trade.id, "pos_1");
  EXPECT_EQ(attached.position_id.value_or(""), "pos_1");
  EXPECT_EQ((*store.get(autotrader::tradeKey(trade.id)))["position_id"], "pos_1");

  EXPECT_THROW(ledger.attachPosition(trade.id, "pos_2"),
               autotrader::InvalidStateError);
  EXPECT_THROW(ledger.attachPosition("trade_missing", "pos_1"),
               autotrader::NotFoundError);
}

// -----------------------------------------------------------------------------
// 12. getTrades filters by symbol and inclusive time range, sorted by time.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, GetTradesFiltersAndSorts) {
  const auto sol = ledger.createOrder("SOL-USDC", Side::Buy, 1.0);
  const auto eth = ledger.createOrder("ETH-USDC", Side::Buy, 1.0);

  const auto t1 = ledger.createTrade(sol.id, std::nullopt, 100.0, 1.0, 0.0);
  clock.advance_by(1000);
  const auto t2 = ledger.createTrade(eth.id, std::nullopt, 2500.0, 1.0, 0.0);
  clock.advance_by(1000);
  const auto t3 = ledger.createTrade(sol.id, std::nullopt, 101.0, 1.0, 0.0);

  const auto all = ledger.getTrades();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].id, t1.id);
  EXPECT_EQ(all[1].id, t2.id);
  EXPECT_EQ(all[2].id, t3.id);

  autotrader::TradeFilter by_symbol;
  by_symbol.symbol = "SOL-USDC";
  const auto sol_trades = ledger.getTrades(by_symbol);
  ASSERT_EQ(sol_trades.size(), 2u);
  EXPECT_EQ(sol_trades[0].id, t1.id);
  EXPECT_EQ(sol_trades[1].id, t3.id);

  autotrader::TradeFilter window;
  window.start = t2.timestamp;
  window.end = t3.timestamp;
  const auto windowed = ledger.getTrades(window);
  ASSERT_EQ(windowed.size(), 2u);
  EXPECT_EQ(windowed[0].id, t2.id);
  EXPECT_EQ(windowed[1].id, t3.id);
}

// -----------------------------------------------------------------------------
// 13. Trades sharing a timestamp come back in creation order, and the order
//     survives a reload from the store.
// Why: an opening trade and its stop-loss close are often recorded on the
//      same tick; history must not list the close first.
// -----------------------------------------------------------------------------
TEST_F(OrderLedgerTest, SameTimestampKeepsCreationOrder) {
  constexpr int kTrades = 20;
  const auto order = ledger.createOrder("SOL-USDC", Side::Buy, 1.0);

  std::vector<std::string> created;
  for (int i = 0; i < kTrades; ++i) {
    created.push_back(
        ledger.createTrade(order.id, std::nullopt, 100.0 + i, 1.0, 0.0).id);
  }

  const auto trades = ledger.getTrades();
  ASSERT_EQ(trades.size(), static_cast<std::size_t>(kTrades));
  for (int i = 0; i < kTrades; ++i) {
    EXPECT_EQ(trades[i].id, created[i]) << "position " << i;
    EXPECT_EQ(trades[i].sequence, static_cast<std::uint64_t>(i + 1));
  }

  // A fresh ledger continues the sequence after the trades it loads.
  OrderLedger reloaded{store, clock};
  ASSERT_TRUE(reloaded.getTrade(created.back()).has_value());
  EXPECT_EQ(reloaded.getTrade(created.back())->sequence,
            static_cast<std::uint64_t>(kTrades));
  const auto next = reloaded.createTrade(order.id, std::nullopt, 99.0, 1.0, 0.0);
  EXPECT_EQ(next.sequence, static_cast<std::uint64_t>(kTrades + 1));

  const auto merged = reloaded.getTrades();
  ASSERT_EQ(merged.size(), 2u);
  EXPECT_EQ(merged[0].id, created.back());
  EXPECT_EQ(merged[1].id, next.id);
}
