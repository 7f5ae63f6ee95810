#include "autotrader/domain/codec.hpp"
#include "autotrader/domain/errors.hpp"

namespace autotrader {
namespace domain {

namespace {

using nlohmann::json;

template <typename T>
json optionalToJson(const std::optional<T>& value) {
  return value ? json(*value) : json(nullptr);
}

json optionalTimeToJson(const std::optional<Timestamp>& value) {
  return value ? json(to_iso8601(*value)) : json(nullptr);
}

template <typename T>
std::optional<T> optionalFromJson(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

std::optional<Timestamp> optionalTimeFromJson(const json& j, const char* key) {
  auto text = optionalFromJson<std::string>(j, key);
  if (!text) {
    return std::nullopt;
  }
  return from_iso8601(*text);
}

Timestamp timeFromJson(const json& j, const char* key) {
  return from_iso8601(j.at(key).get<std::string>());
}

json metadataFromJson(const json& j) {
  auto it = j.find("metadata");
  if (it == j.end() || it->is_null()) {
    return json::object();
  }
  return *it;
}

}  // namespace

// -----------------------------------------------------------------------------
// Token conversions
// -----------------------------------------------------------------------------
const char* sideToString(Side side) {
  switch (side) {
    case Side::Buy:  return "buy";
    case Side::Sell: return "sell";
  }
  return "buy";
}

Side sideFromString(const std::string& token) {
  if (token == "buy") return Side::Buy;
  if (token == "sell") return Side::Sell;
  throw ValidationError("unknown side: '" + token + "'");
}

const char* orderStatusToString(OrderStatus status) {
  switch (status) {
    case OrderStatus::Pending:   return "pending";
    case OrderStatus::Filled:    return "filled";
    case OrderStatus::Failed:    return "failed";
    case OrderStatus::Cancelled: return "cancelled";
  }
  return "pending";
}

OrderStatus orderStatusFromString(const std::string& token) {
  if (token == "pending") return OrderStatus::Pending;
  if (token == "filled") return OrderStatus::Filled;
  if (token == "failed") return OrderStatus::Failed;
  if (token == "cancelled") return OrderStatus::Cancelled;
  throw ValidationError("unknown order status: '" + token + "'");
}

const char* orderKindToString(OrderKind kind) {
  switch (kind) {
    case OrderKind::Market: return "market";
    case OrderKind::Limit:  return "limit";
  }
  return "market";
}

OrderKind orderKindFromString(const std::string& token) {
  if (token == "market") return OrderKind::Market;
  if (token == "limit") return OrderKind::Limit;
  throw ValidationError("unknown order type: '" + token + "'");
}

const char* positionStatusToString(PositionStatus status) {
  switch (status) {
    case PositionStatus::Open:    return "open";
    case PositionStatus::Closing: return "closing";
    case PositionStatus::Closed:  return "closed";
  }
  return "open";
}

PositionStatus positionStatusFromString(const std::string& token) {
  if (token == "open") return PositionStatus::Open;
  if (token == "closing") return PositionStatus::Closing;
  if (token == "closed") return PositionStatus::Closed;
  throw ValidationError("unknown position status: '" + token + "'");
}

const char* signalTypeToString(SignalType type) {
  switch (type) {
    case SignalType::Entry: return "entry";
    case SignalType::Exit:  return "exit";
  }
  return "entry";
}

SignalType signalTypeFromString(const std::string& token) {
  if (token == "entry") return SignalType::Entry;
  if (token == "exit") return SignalType::Exit;
  throw ValidationError("unknown signal type: '" + token + "'");
}

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
void to_json(json& j, const Order& order) {
  j = json{
      {"order_id", order.id},
      {"symbol", order.symbol},
      {"side", sideToString(order.side)},
      {"size", order.size},
      {"price", optionalToJson(order.price)},
      {"type", orderKindToString(order.kind)},
      {"status", orderStatusToString(order.status)},
      {"timestamp", to_iso8601(order.submitted_at)},
      {"filled_price", optionalToJson(order.filled_price)},
      {"filled_size", optionalToJson(order.filled_size)},
      {"filled_timestamp", optionalTimeToJson(order.filled_at)},
      {"error", optionalToJson(order.error)},
      {"metadata", order.metadata},
  };
}

void from_json(const json& j, Order& order) {
  order.id = j.at("order_id").get<std::string>();
  order.symbol = j.at("symbol").get<std::string>();
  order.side = sideFromString(j.at("side").get<std::string>());
  order.size = j.at("size").get<double>();
  order.price = optionalFromJson<double>(j, "price");
  order.kind = orderKindFromString(j.at("type").get<std::string>());
  order.status = orderStatusFromString(j.at("status").get<std::string>());
  order.submitted_at = timeFromJson(j, "timestamp");
  order.filled_price = optionalFromJson<double>(j, "filled_price");
  order.filled_size = optionalFromJson<double>(j, "filled_size");
  order.filled_at = optionalTimeFromJson(j, "filled_timestamp");
  order.error = optionalFromJson<std::string>(j, "error");
  order.metadata = metadataFromJson(j);
}

// -----------------------------------------------------------------------------
// Trade
// -----------------------------------------------------------------------------
void to_json(json& j, const Trade& trade) {
  j = json{
      {"trade_id", trade.id},
      {"order_id", trade.order_id},
      {"position_id", optionalToJson(trade.position_id)},
      {"symbol", trade.symbol},
      {"side", sideToString(trade.side)},
      {"size", trade.size},
      {"price", trade.price},
      {"fee", trade.fee},
      {"timestamp", to_iso8601(trade.timestamp)},
      {"sequence", trade.sequence},
      {"metadata", trade.metadata},
  };
}

void from_json(const json& j, Trade& trade) {
  trade.id = j.at("trade_id").get<std::string>();
  trade.order_id = j.at("order_id").get<std::string>();
  trade.position_id = optionalFromJson<std::string>(j, "position_id");
  trade.symbol = j.at("symbol").get<std::string>();
  trade.side = sideFromString(j.at("side").get<std::string>());
  trade.size = j.at("size").get<double>();
  trade.price = j.at("price").get<double>();
  trade.fee = j.at("fee").get<double>();
  trade.timestamp = timeFromJson(j, "timestamp");
  trade.sequence = j.value("sequence", std::uint64_t{0});
  trade.metadata = metadataFromJson(j);
}

// -----------------------------------------------------------------------------
// Position
// -----------------------------------------------------------------------------
void to_json(json& j, const Position& position) {
  j = json{
      {"position_id", position.id},
      {"symbol", position.symbol},
      {"side", sideToString(position.side)},
      {"size", position.size},
      {"entry_price", position.entry_price},
      {"current_price", position.current_price},
      {"status", positionStatusToString(position.status)},
      {"unrealized_pnl", position.unrealized_pnl},
      {"realized_pnl", position.realized_pnl},
      {"stop_loss", optionalToJson(position.stop_loss)},
      {"entry_time", to_iso8601(position.entry_time)},
      {"last_update_time", to_iso8601(position.last_update_time)},
      {"metadata", position.metadata},
  };
}

void from_json(const json& j, Position& position) {
  position.id = j.at("position_id").get<std::string>();
  position.symbol = j.at("symbol").get<std::string>();
  position.side = sideFromString(j.at("side").get<std::string>());
  position.size = j.at("size").get<double>();
  position.entry_price = j.at("entry_price").get<double>();
  position.current_price = j.at("current_price").get<double>();
  position.status =
      positionStatusFromString(j.at("status").get<std::string>());
  position.unrealized_pnl = j.at("unrealized_pnl").get<double>();
  position.realized_pnl = j.at("realized_pnl").get<double>();
  position.stop_loss = optionalFromJson<double>(j, "stop_loss");
  position.entry_time = timeFromJson(j, "entry_time");
  position.last_update_time = timeFromJson(j, "last_update_time");
  position.metadata = metadataFromJson(j);
}

// -----------------------------------------------------------------------------
// Signal
// -----------------------------------------------------------------------------
void to_json(json& j, const Signal& signal) {
  j = json{
      {"strategy_id", signal.strategy_id},
      {"symbol", signal.symbol},
      {"side", sideToString(signal.side)},
      {"size", signal.size},
      {"price", signal.price},
      {"signal_type", signalTypeToString(signal.type)},
      {"confidence", signal.confidence},
      {"timestamp", to_iso8601(signal.timestamp)},
      {"expiry", optionalTimeToJson(signal.expiry)},
      {"metadata", signal.metadata},
  };
}

void from_json(const json& j, Signal& signal) {
  signal.strategy_id = j.at("strategy_id").get<std::string>();
  signal.symbol = j.at("symbol").get<std::string>();
  signal.side = sideFromString(j.at("side").get<std::string>());
  signal.size = j.at("size").get<double>();
  signal.price = j.at("price").get<double>();
  signal.type = signalTypeFromString(j.at("signal_type").get<std::string>());
  signal.confidence = j.value("confidence", 0.0);
  signal.timestamp = timeFromJson(j, "timestamp");
  signal.expiry = optionalTimeFromJson(j, "expiry");
  signal.metadata = metadataFromJson(j);
}

// -----------------------------------------------------------------------------
// DataPoint
// -----------------------------------------------------------------------------
// The gateway wire format stamps points with integer "timestamp_ms"; stored
// and emitted points use the ISO "timestamp" field. Both are accepted.
// -----------------------------------------------------------------------------
void to_json(json& j, const DataPoint& point) {
  j = json{
      {"data_type", point.data_type},
      {"symbol", point.symbol},
      {"timestamp", to_iso8601(point.timestamp)},
      {"value", point.value},
      {"metadata", point.metadata},
  };
}

void from_json(const json& j, DataPoint& point) {
  point.data_type = j.at("data_type").get<std::string>();
  point.symbol = j.at("symbol").get<std::string>();
  if (j.contains("timestamp_ms")) {
    point.timestamp = ms_to_timestamp(j.at("timestamp_ms").get<std::int64_t>());
  } else if (j.contains("timestamp")) {
    point.timestamp = timeFromJson(j, "timestamp");
  } else {
    throw ValidationError("data point for '" + point.symbol +
                          "' has no timestamp");
  }
  point.value = j.at("value");
  point.metadata = metadataFromJson(j);
}

// -----------------------------------------------------------------------------
// StrategyState
// -----------------------------------------------------------------------------
void to_json(json& j, const StrategyState& state) {
  j = json{
      {"strategy_id", state.strategy_id},
      {"symbol", state.symbol},
      {"active", state.active},
      {"last_update", to_iso8601(state.last_update)},
      {"position_size", state.position_size},
      {"current_position", state.current_position},
      {"metadata", state.metadata},
  };
}

void from_json(const json& j, StrategyState& state) {
  state.strategy_id = j.at("strategy_id").get<std::string>();
  state.symbol = j.at("symbol").get<std::string>();
  state.active = j.value("active", true);
  state.last_update = timeFromJson(j, "last_update");
  state.position_size = j.value("position_size", 0.0);
  state.current_position = j.value("current_position", json(nullptr));
  state.metadata = metadataFromJson(j);
}

}  // namespace domain
}  // namespace autotrader
