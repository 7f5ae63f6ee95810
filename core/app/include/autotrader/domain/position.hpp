#pragma once

#include "autotrader/domain/order.hpp"
#include "autotrader/domain/trade.hpp"

#include <optional>
#include <string>

namespace autotrader {
namespace domain {

// -----------------------------------------------------------------------------
// PositionStatus
// -----------------------------------------------------------------------------
//
//   Open ──> Closing ──> Closed
//     │                    ▲
//     └────────────────────┘   (manual close)
//
// Closing means a stop-loss was breached and the close is in flight. A
// position is never re-opened. Tokens: "open", "closing", "closed".
// -----------------------------------------------------------------------------
enum class PositionStatus {
  Open,
  Closing,
  Closed,
};

// -----------------------------------------------------------------------------
// Position
// -----------------------------------------------------------------------------
//
// @brief  Exposure opened by one filled order.
//
// @details
// `size` is fixed at creation; there are no partial closes.
//
// PnL sign convention, for both unrealized and realized PnL:
//   buy  → (price - entry_price) * size
//   sell → (entry_price - price) * size
//
// unrealized_pnl tracks current_price while the position is open and is
// zeroed on close, when realized_pnl is set from the close price.
// -----------------------------------------------------------------------------
struct Position {
  PositionId id;
  std::string symbol;
  Side side{Side::Buy};
  double size{0.0};
  double entry_price{0.0};
  double current_price{0.0};
  PositionStatus status{PositionStatus::Open};
  double unrealized_pnl{0.0};
  double realized_pnl{0.0};
  std::optional<double> stop_loss;
  Timestamp entry_time{};
  Timestamp last_update_time{};
  Metadata metadata = Metadata::object();
};

// Signed PnL of holding `size` on `side` from entry_price to price.
inline double pnl(Side side, double entry_price, double price, double size) {
  double diff = price - entry_price;
  if (side == Side::Sell) {
    diff = -diff;
  }
  return diff * size;
}

// True when `price` has reached the stop for a position on `side`.
inline bool stopLossBreached(Side side, double stop_loss, double price) {
  return side == Side::Buy ? price <= stop_loss : price >= stop_loss;
}

}  // namespace domain
}  // namespace autotrader
