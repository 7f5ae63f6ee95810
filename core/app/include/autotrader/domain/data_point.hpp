#pragma once

#include "autotrader/domain/order.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace autotrader {
namespace domain {

// Data-type tags understood by the built-in components.
inline constexpr const char* kCandleData = "candle";  // value: {open,high,low,close,volume}
inline constexpr const char* kPriceData = "price";    // value: number

// -----------------------------------------------------------------------------
// DataPoint
// -----------------------------------------------------------------------------
// One market observation: the unit the DataIngestionLoop queues and the
// StrategyManager routes. `value` is tag-specific JSON.
// -----------------------------------------------------------------------------
struct DataPoint {
  std::string data_type;
  std::string symbol;
  Timestamp timestamp{};
  nlohmann::json value;
  Metadata metadata = Metadata::object();
};

}  // namespace domain
}  // namespace autotrader
