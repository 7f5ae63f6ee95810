#pragma once

#include "autotrader/domain/order_status.hpp"
#include "autotrader/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace autotrader {
namespace domain {

// -----------------------------------------------------------------------------
// Metadata
// -----------------------------------------------------------------------------
// Free-form key/value annotations attached to orders, trades, positions,
// signals and strategy state. Always a JSON object; never null.
// -----------------------------------------------------------------------------
using Metadata = nlohmann::json;

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Generated by IdGenerator as "ord_" followed by 8 random hex characters.
// Assumed unique; no collision check is made.
// -----------------------------------------------------------------------------
using OrderId = std::string;

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Tokens: "buy", "sell".
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// Side that unwinds a position opened on `side`.
inline Side opposite(Side side) {
  return side == Side::Buy ? Side::Sell : Side::Buy;
}

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
//
// @brief  A request to trade `size` of `symbol` on `side`, plus its current
//         lifecycle status and fill.
//
// @details
// Created by the TradingEngine in Pending. The authoritative copy lives in
// the OrderLedger; every other component receives copies. Fill fields are
// empty until the order is Filled; `error` is set only when Failed.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id;
  std::string symbol;                  // "BASE-QUOTE", e.g. "SOL-USDC"
  Side side{Side::Buy};
  double size{0.0};
  std::optional<double> price;         // Requested price (limit only)
  OrderKind kind{OrderKind::Market};
  OrderStatus status{OrderStatus::Pending};
  Timestamp submitted_at{};
  std::optional<double> filled_price;
  std::optional<double> filled_size;
  std::optional<Timestamp> filled_at;
  std::optional<std::string> error;
  Metadata metadata = Metadata::object();
};

}  // namespace domain
}  // namespace autotrader
