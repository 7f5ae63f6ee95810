#pragma once

#include <cstddef>
#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// EventType
// -----------------------------------------------------------------------------
//
// @brief  Closed set of event categories carried by the EventBus.
//
// @details
// Grouped by producer:
//   trade/order     TradingEngine
//   position        TradingEngine (PositionLedger mutations)
//   strategy        StrategyManager
//   system          any component swallowing a failure, TradingSystem
//   market/risk/    reserved for feeders and external risk monitors; the
//   account           bus accepts them like any other type
//
// Every type has a canonical lowercase token ("trade_executed", ...) that is
// stamped into the payload under "event_type".
// -----------------------------------------------------------------------------
enum class EventType {
  TradeExecuted,
  OrderPlaced,
  OrderCancelled,

  PositionOpened,
  PositionClosed,
  PositionUpdated,

  StrategyStarted,
  StrategyStopped,
  StrategyUpdated,
  StrategySignal,

  SystemError,
  SystemWarning,
  SystemStatus,

  PriceUpdate,
  VolumeSpike,
  VolatilityAlert,

  RiskLimitBreach,
  MarginCall,
  AccountValueUpdate,
};

// Number of enumerators; EventBus sizes its per-type tables with it.
inline constexpr std::size_t kEventTypeCount =
    static_cast<std::size_t>(EventType::AccountValueUpdate) + 1;

// True when `type` is one of the enumerators above. A value cast from an
// arbitrary integer is not.
inline bool isValidEventType(EventType type) {
  return static_cast<std::size_t>(type) < kEventTypeCount;
}

// Canonical token for `type`.
// @throws std::invalid_argument for a value outside the enumeration.
const char* eventTypeToString(EventType type);

// Inverse of eventTypeToString().
// @throws std::invalid_argument for an unknown token.
EventType eventTypeFromString(const std::string& token);

}  // namespace autotrader
