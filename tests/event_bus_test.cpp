// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for autotrader::EventBus.
//
// Validates:
//   - Every subscriber of a type receives an emitted payload exactly once
//   - Subscribers of other types are not invoked
//   - Payloads are stamped with "timestamp" and "event_type"
//   - A failing handler neither blocks nor fails the others
//   - Unsubscribe stops delivery; unknown ids are rejected
//   - History is bounded per type and returned oldest first
//   - Re-entrant emit (handler emits inside its callback) does not deadlock
//   - Event type string conversion
//
// Design note: handlers run on std::async tasks, so every counter the tests
// touch from a handler is a std::atomic or guarded by a mutex.
// =============================================================================

#include "autotrader/eventbus/event_bus.hpp"
#include "autotrader/events/event_types.hpp"
#include "autotrader/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using autotrader::EventBus;
using autotrader::EventType;

// =============================================================================
// Test fixture: fresh clock and bus for each test.
// =============================================================================
class EventBusTest : public ::testing::Test {
 protected:
  void SetUp() override { clock.advance_time(1700000000000); }

  autotrader::SimulationTimeProvider clock;
  EventBus bus{clock};
};

// -----------------------------------------------------------------------------
// 1. Every subscriber of a type receives the payload exactly once.
// Why: the engine and logging subscribers both listen to trade_executed. If
//      one is skipped, downstream accounting silently diverges.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, AllSubscribersReceiveOnce) {
  std::atomic<int> count_a{0};
  std::atomic<int> count_b{0};
  std::atomic<int> count_c{0};

  bus.subscribe(EventType::TradeExecuted, [&](const nlohmann::json&) { ++count_a; });
  bus.subscribe(EventType::TradeExecuted, [&](const nlohmann::json&) { ++count_b; });
  bus.subscribe(EventType::TradeExecuted, [&](const nlohmann::json&) { ++count_c; });

  const auto result = bus.emit(EventType::TradeExecuted, {{"id", "trade_1"}});

  EXPECT_EQ(result.delivered, 3u);
  EXPECT_EQ(result.failed, 0u);
  EXPECT_EQ(count_a.load(), 1);
  EXPECT_EQ(count_b.load(), 1);
  EXPECT_EQ(count_c.load(), 1);
}

// -----------------------------------------------------------------------------
// 2. Subscribers of a different type are not invoked.
// Why: a position_closed handler must never see order_placed payloads.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, DeliveryIsFilteredByType) {
  std::atomic<int> closed_count{0};
  bus.subscribe(EventType::PositionClosed,
                [&](const nlohmann::json&) { ++closed_count; });

  const auto result = bus.emit(EventType::OrderPlaced, {{"id", "ord_1"}});

  EXPECT_EQ(result.delivered, 0u);
  EXPECT_EQ(closed_count.load(), 0);
}

// -----------------------------------------------------------------------------
// 3. The delivered payload carries the emitted fields plus the stamps.
// Why: consumers key off "event_type" and order events by "timestamp".
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, PayloadIsStamped) {
  std::mutex m;
  nlohmann::json received;
  bus.subscribe(EventType::OrderPlaced, [&](const nlohmann::json& payload) {
    std::lock_guard lock(m);
    received = payload;
  });

  bus.emit(EventType::OrderPlaced, {{"id", "ord_abc"}, {"size", 2.5}});

  std::lock_guard lock(m);
  EXPECT_EQ(received["id"], "ord_abc");
  EXPECT_DOUBLE_EQ(received["size"].get<double>(), 2.5);
  EXPECT_EQ(received["event_type"], "order_placed");
  EXPECT_EQ(received["timestamp"], "2023-11-14T22:13:20.000Z");
}

// -----------------------------------------------------------------------------
// 4. A non-object payload is wrapped as {"data": payload}.
// Why: stamping requires an object; scalars must not be lost.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ScalarPayloadIsWrapped) {
  bus.emit(EventType::PriceUpdate, 101.5);

  const auto history = bus.getHistory(EventType::PriceUpdate);
  ASSERT_EQ(history.size(), 1u);
  EXPECT_DOUBLE_EQ(history[0].payload["data"].get<double>(), 101.5);
  EXPECT_EQ(history[0].payload["event_type"], "price_update");
}

// -----------------------------------------------------------------------------
// 5. A throwing handler is counted as failed and does not stop the others.
// Why: one broken subscriber must not starve the rest of the system.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, FailingHandlerIsIsolated) {
  std::atomic<int> good_count{0};
  bus.subscribe(EventType::SystemError, [&](const nlohmann::json&) { ++good_count; });
  bus.subscribe(EventType::SystemError, [](const nlohmann::json&) {
    throw std::runtime_error("subscriber exploded");
  });
  bus.subscribe(EventType::SystemError, [&](const nlohmann::json&) { ++good_count; });

  const auto result = bus.emit(EventType::SystemError, {{"error", "x"}});

  EXPECT_EQ(result.delivered, 2u);
  EXPECT_EQ(result.failed, 1u);
  EXPECT_EQ(good_count.load(), 2);
}

// -----------------------------------------------------------------------------
// 6. Unsubscribe stops delivery; a second unsubscribe reports false.
// Why: removed strategies must stop receiving events immediately.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  std::atomic<int> count{0};
  const auto id = bus.subscribe(EventType::PositionUpdated,
                                [&](const nlohmann::json&) { ++count; });
  EXPECT_EQ(bus.subscriberCount(EventType::PositionUpdated), 1u);

  bus.emit(EventType::PositionUpdated);
  EXPECT_TRUE(bus.unsubscribe(EventType::PositionUpdated, id));
  bus.emit(EventType::PositionUpdated);

  EXPECT_EQ(count.load(), 1);
  EXPECT_EQ(bus.subscriberCount(EventType::PositionUpdated), 0u);
  EXPECT_FALSE(bus.unsubscribe(EventType::PositionUpdated, id));
}

// -----------------------------------------------------------------------------
// 7. Unsubscribing with the wrong type is rejected and leaves the handler.
// Why: ids are scoped by type; a mismatch must not remove another handler.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeWrongTypeIsRejected) {
  const auto id = bus.subscribe(EventType::OrderPlaced, [](const nlohmann::json&) {});
  EXPECT_FALSE(bus.unsubscribe(EventType::OrderCancelled, id));
  EXPECT_EQ(bus.subscriberCount(EventType::OrderPlaced), 1u);
}

// -----------------------------------------------------------------------------
// 8. An empty handler is rejected.
// Why: invoking an empty std::function would throw on every emit.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, EmptyHandlerThrows) {
  EXPECT_THROW(bus.subscribe(EventType::OrderPlaced, EventBus::Handler{}),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 9. Emitting with no subscribers still records history.
// Why: history is the audit trail, independent of who is listening.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, EmitWithoutSubscribersRecordsHistory) {
  const auto result = bus.emit(EventType::SystemStatus, {{"status", "ok"}});
  EXPECT_EQ(result.delivered, 0u);
  EXPECT_EQ(result.failed, 0u);
  EXPECT_EQ(bus.getHistory(EventType::SystemStatus).size(), 1u);
}

// -----------------------------------------------------------------------------
// 10. History per type is bounded at kMaxHistory, evicting the oldest.
// Why: a long-running process must not grow memory without limit.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, HistoryIsBounded) {
  const std::size_t total = EventBus::kMaxHistory + 1;
  for (std::size_t i = 0; i < total; ++i) {
    bus.emit(EventType::PriceUpdate, {{"seq", i}});
  }

  const auto all = bus.getHistory(EventType::PriceUpdate, 0);
  ASSERT_EQ(all.size(), EventBus::kMaxHistory);
  EXPECT_EQ(all.front().payload["seq"].get<std::size_t>(), 1u);
  EXPECT_EQ(all.back().payload["seq"].get<std::size_t>(), total - 1);
}

// -----------------------------------------------------------------------------
// 11. getHistory(limit) returns the most recent entries, oldest first.
// Why: dashboards ask for "the last N" and expect chronological order.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, HistoryLimitReturnsMostRecent) {
  for (int i = 0; i < 10; ++i) {
    clock.advance_by(1000);
    bus.emit(EventType::OrderPlaced, {{"seq", i}});
  }

  const auto last3 = bus.getHistory(EventType::OrderPlaced, 3);
  ASSERT_EQ(last3.size(), 3u);
  EXPECT_EQ(last3[0].payload["seq"], 7);
  EXPECT_EQ(last3[1].payload["seq"], 8);
  EXPECT_EQ(last3[2].payload["seq"], 9);
  EXPECT_LT(last3[0].timestamp, last3[2].timestamp);

  EXPECT_EQ(bus.getHistory(EventType::OrderPlaced).size(), 10u);
}

// -----------------------------------------------------------------------------
// 12. clearHistory() clears one type or all types.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ClearHistory) {
  bus.emit(EventType::OrderPlaced);
  bus.emit(EventType::TradeExecuted);

  bus.clearHistory(EventType::OrderPlaced);
  EXPECT_TRUE(bus.getHistory(EventType::OrderPlaced).empty());
  EXPECT_EQ(bus.getHistory(EventType::TradeExecuted).size(), 1u);

  bus.clearHistory();
  EXPECT_TRUE(bus.getHistory(EventType::TradeExecuted).empty());
}

// -----------------------------------------------------------------------------
// 13. A handler that emits another event does not deadlock.
// Why: the engine's handlers may emit follow-up events (e.g. system_error).
//      The bus lock must not be held while handlers run.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ReentrantEmitDoesNotDeadlock) {
  std::atomic<int> nested{0};
  bus.subscribe(EventType::SystemWarning, [&](const nlohmann::json&) { ++nested; });
  bus.subscribe(EventType::RiskLimitBreach, [&](const nlohmann::json&) {
    bus.emit(EventType::SystemWarning, {{"source", "risk"}});
  });

  const auto result = bus.emit(EventType::RiskLimitBreach);

  EXPECT_EQ(result.delivered, 1u);
  EXPECT_EQ(nested.load(), 1);
}

// -----------------------------------------------------------------------------
// 14. Event type tokens round-trip and unknown tokens are rejected.
// Why: the wire names are part of the external contract.
// -----------------------------------------------------------------------------
TEST(EventTypeTest, TokenConversion) {
  EXPECT_STREQ(autotrader::eventTypeToString(EventType::AccountValueUpdate),
               "account_value_update");
  EXPECT_EQ(autotrader::eventTypeFromString("margin_call"), EventType::MarginCall);
  EXPECT_THROW(autotrader::eventTypeFromString("not_an_event"),
               std::invalid_argument);
  EXPECT_EQ(autotrader::kEventTypeCount, 19u);
}
