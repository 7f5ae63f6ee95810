#pragma once

#include "autotrader/domain/data_point.hpp"
#include "autotrader/domain/order.hpp"
#include "autotrader/domain/order_status.hpp"
#include "autotrader/domain/position.hpp"
#include "autotrader/domain/signal.hpp"
#include "autotrader/domain/strategy_state.hpp"
#include "autotrader/domain/trade.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace autotrader {
namespace domain {

// -----------------------------------------------------------------------------
// Canonical string tokens
// -----------------------------------------------------------------------------
//
// @brief  Enum <-> lowercase token conversion used by the state store
//         records, event payloads and the gateway wire format.
//
// @details
// *ToString() never fails (every switch is exhaustive). *FromString()
// throws ValidationError for an unknown token so a corrupt store record is
// reported instead of silently decoding to a default.
// -----------------------------------------------------------------------------
const char* sideToString(Side side);
Side sideFromString(const std::string& token);

const char* orderStatusToString(OrderStatus status);
OrderStatus orderStatusFromString(const std::string& token);

const char* orderKindToString(OrderKind kind);
OrderKind orderKindFromString(const std::string& token);

const char* positionStatusToString(PositionStatus status);
PositionStatus positionStatusFromString(const std::string& token);

const char* signalTypeToString(SignalType type);
SignalType signalTypeFromString(const std::string& token);

// -----------------------------------------------------------------------------
// JSON record codecs
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json ADL hooks. These define the flat record layout that
//         the ledgers persist and that event payloads carry.
//
// @details
// Optional fields serialize as JSON null. Timestamps serialize as ISO-8601
// UTC strings with millisecond precision. from_json() accepts a missing
// optional field as null; a missing required field raises
// nlohmann::json::out_of_range.
//
// Key layout (Order):
//   order_id, symbol, side, size, price, type, status, timestamp,
//   filled_price, filled_size, filled_timestamp, error, metadata
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Order& order);
void from_json(const nlohmann::json& j, Order& order);

void to_json(nlohmann::json& j, const Trade& trade);
void from_json(const nlohmann::json& j, Trade& trade);

void to_json(nlohmann::json& j, const Position& position);
void from_json(const nlohmann::json& j, Position& position);

void to_json(nlohmann::json& j, const Signal& signal);
void from_json(const nlohmann::json& j, Signal& signal);

void to_json(nlohmann::json& j, const DataPoint& point);
void from_json(const nlohmann::json& j, DataPoint& point);

void to_json(nlohmann::json& j, const StrategyState& state);
void from_json(const nlohmann::json& j, StrategyState& state);

}  // namespace domain
}  // namespace autotrader
