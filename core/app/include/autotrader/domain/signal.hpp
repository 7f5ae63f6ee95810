#pragma once

#include "autotrader/domain/order.hpp"

#include <optional>
#include <string>

namespace autotrader {
namespace domain {

// Tokens: "entry", "exit".
enum class SignalType {
  Entry,
  Exit,
};

// -----------------------------------------------------------------------------
// Signal
// -----------------------------------------------------------------------------
// A candidate trade produced by a strategy. It passes validateSignal() before
// reaching the TradingEngine and is consumed exactly once.
// -----------------------------------------------------------------------------
struct Signal {
  std::string strategy_id;
  std::string symbol;
  Side side{Side::Buy};
  double size{0.0};
  double price{0.0};
  SignalType type{SignalType::Entry};
  double confidence{0.0};
  Timestamp timestamp{};
  std::optional<Timestamp> expiry;
  Metadata metadata = Metadata::object();
};

}  // namespace domain
}  // namespace autotrader
