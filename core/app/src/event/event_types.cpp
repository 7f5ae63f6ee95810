#include "autotrader/events/event_types.hpp"

#include <array>
#include <stdexcept>

namespace autotrader {

namespace {

// Indexed by the EventType enumerator value.
constexpr std::array<const char*, kEventTypeCount> kTokens = {
    "trade_executed",   "order_placed",       "order_cancelled",
    "position_opened",  "position_closed",    "position_updated",
    "strategy_started", "strategy_stopped",   "strategy_updated",
    "strategy_signal",  "system_error",       "system_warning",
    "system_status",    "price_update",       "volume_spike",
    "volatility_alert", "risk_limit_breach",  "margin_call",
    "account_value_update",
};

}  // namespace

const char* eventTypeToString(EventType type) {
  if (!isValidEventType(type)) {
    throw std::invalid_argument("event type out of range: " +
                                std::to_string(static_cast<int>(type)));
  }
  return kTokens[static_cast<std::size_t>(type)];
}

EventType eventTypeFromString(const std::string& token) {
  for (std::size_t i = 0; i < kTokens.size(); ++i) {
    if (token == kTokens[i]) {
      return static_cast<EventType>(i);
    }
  }
  throw std::invalid_argument("unknown event type: '" + token + "'");
}

}  // namespace autotrader
