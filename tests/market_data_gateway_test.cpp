// =============================================================================
// market_data_gateway_test.cpp
// =============================================================================
// Unit tests for autotrader::MarketDataGateway::decode.
//
// Validates:
//   - Candle and price messages decode with timestamp_ms or ISO timestamps
//   - Metadata is carried through
//   - Malformed JSON, missing fields and empty identifiers are rejected
//
// No socket is opened: decode() is the whole wire contract.
// =============================================================================

#include "autotrader/domain/errors.hpp"
#include "autotrader/gateway/market_data_gateway.hpp"
#include "autotrader/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <string>

using autotrader::MarketDataGateway;
using autotrader::ValidationError;

// -----------------------------------------------------------------------------
// 1. A candle message with timestamp_ms and metadata.
// -----------------------------------------------------------------------------
TEST(MarketDataGatewayTest, DecodesCandle) {
  const auto point = MarketDataGateway::decode(R"({
    "data_type": "candle", "symbol": "SOL-USDC", "timestamp_ms": 1700000000000,
    "value": {"open": 101.2, "high": 101.9, "low": 100.8, "close": 101.5,
              "volume": 2500000},
    "metadata": {"source": "feeder"}
  })");

  EXPECT_EQ(point.data_type, "candle");
  EXPECT_EQ(point.symbol, "SOL-USDC");
  EXPECT_EQ(autotrader::timestamp_to_ms(point.timestamp), 1700000000000);
  EXPECT_DOUBLE_EQ(point.value["close"].get<double>(), 101.5);
  EXPECT_EQ(point.metadata["source"], "feeder");
}

// -----------------------------------------------------------------------------
// 2. A price message with an ISO-8601 timestamp.
// -----------------------------------------------------------------------------
TEST(MarketDataGatewayTest, DecodesIsoTimestamp) {
  const auto point = MarketDataGateway::decode(
      R"({"data_type": "price", "symbol": "ETH-USDC",
          "timestamp": "2023-11-14T22:13:20.000Z", "value": 2000.5})");

  EXPECT_EQ(autotrader::timestamp_to_ms(point.timestamp), 1700000000000);
  EXPECT_DOUBLE_EQ(point.value.get<double>(), 2000.5);
  EXPECT_TRUE(point.metadata.is_object());
}

// -----------------------------------------------------------------------------
// 3. Rejections.
// Why: the receive loop counts and skips anything decode() throws for, so
//      every malformed shape must surface as ValidationError.
// -----------------------------------------------------------------------------
TEST(MarketDataGatewayTest, RejectsMalformedMessages) {
  EXPECT_THROW(MarketDataGateway::decode("{ not json"), ValidationError);
  EXPECT_THROW(MarketDataGateway::decode(
                   R"({"data_type": "price", "timestamp_ms": 1, "value": 1})"),
               ValidationError);
  EXPECT_THROW(MarketDataGateway::decode(
                   R"({"data_type": "price", "symbol": "SOL-USDC", "value": 1})"),
               ValidationError);
  EXPECT_THROW(MarketDataGateway::decode(
                   R"({"data_type": "", "symbol": "SOL-USDC", "timestamp_ms": 1, "value": 1})"),
               ValidationError);
}
