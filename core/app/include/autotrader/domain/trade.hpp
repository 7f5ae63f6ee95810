#pragma once

#include "autotrader/domain/order.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace autotrader {
namespace domain {

using TradeId = std::string;
using PositionId = std::string;

// -----------------------------------------------------------------------------
// Trade
// -----------------------------------------------------------------------------
// One executed swap. Always references an existing order. `position_id` is
// empty for an opening trade until the position has been created, and is
// attached exactly once afterwards; nothing else on a trade ever changes.
//
// `sequence` is the creation order within the ledger that recorded the
// trade. It orders trades that share a timestamp.
// -----------------------------------------------------------------------------
struct Trade {
  TradeId id;
  OrderId order_id;
  std::optional<PositionId> position_id;
  std::string symbol;
  Side side{Side::Buy};
  double size{0.0};
  double price{0.0};
  double fee{0.0};
  Timestamp timestamp{};
  std::uint64_t sequence{0};
  Metadata metadata = Metadata::object();
};

}  // namespace domain
}  // namespace autotrader
