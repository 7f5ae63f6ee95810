// =============================================================================
// state_store_test.cpp
// =============================================================================
// Unit tests for autotrader::InMemoryStateStore and the record codec.
//
// Validates:
//   - set/get/remove basics and missing-key behaviour
//   - TTL expiry driven by the injected clock
//   - Outage simulation: every call throws StoreUnavailableError
//   - ISO-8601 timestamps survive an encode/decode pass at ms precision
//   - Unknown enum tokens in a stored record are rejected
// =============================================================================

#include "autotrader/domain/codec.hpp"
#include "autotrader/domain/errors.hpp"
#include "autotrader/store/i_state_store.hpp"
#include "autotrader/store/in_memory_state_store.hpp"
#include "autotrader/time/simulation_time_provider.hpp"
#include "autotrader/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>

using autotrader::InMemoryStateStore;

// =============================================================================
// Test fixture: store over a simulation clock at a fixed start time.
// =============================================================================
class StateStoreTest : public ::testing::Test {
 protected:
  void SetUp() override { clock.advance_time(1700000000000); }

  autotrader::SimulationTimeProvider clock;
  InMemoryStateStore store{clock};
};

// -----------------------------------------------------------------------------
// 1. A stored value reads back unchanged; a missing key is std::nullopt.
// -----------------------------------------------------------------------------
TEST_F(StateStoreTest, SetGetRemove) {
  EXPECT_FALSE(store.get("order:missing").has_value());

  ASSERT_TRUE(store.set("order:ord_1", {{"order_id", "ord_1"}, {"size", 2.0}}));
  auto value = store.get("order:ord_1");
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ((*value)["order_id"], "ord_1");
  EXPECT_EQ(store.size(), 1u);

  EXPECT_TRUE(store.remove("order:ord_1"));
  EXPECT_FALSE(store.remove("order:ord_1"));
  EXPECT_FALSE(store.get("order:ord_1").has_value());
}

// -----------------------------------------------------------------------------
// 2. A key with a TTL disappears once the clock passes its expiry.
// Why: cached strategy scratch data must not outlive its lease.
// -----------------------------------------------------------------------------
TEST_F(StateStoreTest, TtlExpiry) {
  ASSERT_TRUE(store.set("lease", {{"v", 1}}, std::chrono::seconds(30)));
  ASSERT_TRUE(store.set("forever", {{"v", 2}}));

  clock.advance_by(29999);
  EXPECT_TRUE(store.get("lease").has_value());

  clock.advance_by(1);
  EXPECT_FALSE(store.get("lease").has_value());
  EXPECT_TRUE(store.get("forever").has_value());
  EXPECT_EQ(store.size(), 1u);
}

// -----------------------------------------------------------------------------
// 3. A non-positive TTL is declined.
// -----------------------------------------------------------------------------
TEST_F(StateStoreTest, NonPositiveTtlIsDeclined) {
  EXPECT_FALSE(store.set("k", {{"v", 1}}, std::chrono::seconds(0)));
  EXPECT_FALSE(store.get("k").has_value());
}

// -----------------------------------------------------------------------------
// 4. While unavailable, every operation throws StoreUnavailableError, and
//    data written before the outage is intact afterwards.
// Why: the ledgers surface outages as errors instead of silently losing
//      writes.
// -----------------------------------------------------------------------------
TEST_F(StateStoreTest, OutageThrows) {
  ASSERT_TRUE(store.set("position:pos_1", {{"position_id", "pos_1"}}));

  store.setAvailable(false);
  EXPECT_THROW(store.get("position:pos_1"), autotrader::StoreUnavailableError);
  EXPECT_THROW(store.set("position:pos_2", {{"x", 1}}),
               autotrader::StoreUnavailableError);
  EXPECT_THROW(store.remove("position:pos_1"), autotrader::StoreUnavailableError);

  store.setAvailable(true);
  EXPECT_TRUE(store.get("position:pos_1").has_value());
  EXPECT_FALSE(store.get("position:pos_2").has_value());
}

// -----------------------------------------------------------------------------
// 5. Key helpers follow the "<kind>:<id>" layout.
// -----------------------------------------------------------------------------
TEST(StateStoreKeyTest, KeyLayout) {
  EXPECT_EQ(autotrader::orderKey("ord_1"), "order:ord_1");
  EXPECT_EQ(autotrader::tradeKey("trade_1"), "trade:trade_1");
  EXPECT_EQ(autotrader::positionKey("pos_1"), "position:pos_1");
  EXPECT_EQ(autotrader::strategyStateKey("sol_ma"), "strategy:sol_ma:state");
}

// -----------------------------------------------------------------------------
// 6. Timestamps keep millisecond precision through ISO-8601 text.
// Why: records are ordered by timestamp; truncation would reorder trades
//      that happen within the same second.
// -----------------------------------------------------------------------------
TEST(CodecTest, IsoTimestampKeepsMilliseconds) {
  const auto ts = autotrader::ms_to_timestamp(1700000000123);
  const std::string text = autotrader::to_iso8601(ts);
  EXPECT_EQ(text, "2023-11-14T22:13:20.123Z");
  EXPECT_EQ(autotrader::from_iso8601(text), ts);
  EXPECT_THROW(autotrader::from_iso8601("yesterday"), autotrader::ValidationError);
}

// -----------------------------------------------------------------------------
// 7. A position record written by the codec decodes to the same values,
//    including an absent stop-loss.
// -----------------------------------------------------------------------------
TEST(CodecTest, PositionRecord) {
  autotrader::domain::Position p;
  p.id = "pos_0000abcd";
  p.symbol = "SOL-USDC";
  p.side = autotrader::domain::Side::Sell;
  p.size = 3.0;
  p.entry_price = 100.0;
  p.current_price = 98.0;
  p.unrealized_pnl = 6.0;
  p.entry_time = autotrader::ms_to_timestamp(1700000000000);
  p.last_update_time = autotrader::ms_to_timestamp(1700000005000);

  const nlohmann::json j = p;
  EXPECT_EQ(j["side"], "sell");
  EXPECT_EQ(j["status"], "open");
  EXPECT_TRUE(j["stop_loss"].is_null());

  const auto back = j.get<autotrader::domain::Position>();
  EXPECT_EQ(back.id, p.id);
  EXPECT_EQ(back.side, p.side);
  EXPECT_FALSE(back.stop_loss.has_value());
  EXPECT_EQ(back.last_update_time, p.last_update_time);
}

// -----------------------------------------------------------------------------
// 8. A record with an unknown status token is rejected.
// Why: a corrupt record must not be read back as a plausible state.
// -----------------------------------------------------------------------------
TEST(CodecTest, UnknownStatusIsRejected) {
  EXPECT_THROW(autotrader::domain::orderStatusFromString("half_filled"),
               autotrader::ValidationError);
  EXPECT_EQ(autotrader::domain::orderStatusFromString("cancelled"),
            autotrader::domain::OrderStatus::Cancelled);
}

// -----------------------------------------------------------------------------
// 9. A DataPoint accepts either "timestamp_ms" or ISO "timestamp".
// -----------------------------------------------------------------------------
TEST(CodecTest, DataPointTimestampForms) {
  const nlohmann::json by_ms = {{"data_type", "price"},
                                {"symbol", "SOL-USDC"},
                                {"timestamp_ms", 1700000000000},
                                {"value", 101.5}};
  const nlohmann::json by_iso = {{"data_type", "price"},
                                 {"symbol", "SOL-USDC"},
                                 {"timestamp", "2023-11-14T22:13:20.000Z"},
                                 {"value", 101.5}};

  const auto a = by_ms.get<autotrader::domain::DataPoint>();
  const auto b = by_iso.get<autotrader::domain::DataPoint>();
  EXPECT_EQ(a.timestamp, b.timestamp);
  EXPECT_TRUE(a.metadata.is_object());

  nlohmann::json no_time = by_ms;
  no_time.erase("timestamp_ms");
  EXPECT_THROW(no_time.get<autotrader::domain::DataPoint>(),
               autotrader::ValidationError);
}
