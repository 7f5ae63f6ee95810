#include "autotrader/ledger/order_ledger.hpp"

#include "autotrader/domain/codec.hpp"
#include "autotrader/domain/errors.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>

namespace autotrader {

namespace {

// Decodes a stored record, reporting malformed data as ValidationError.
template <typename Record>
Record decodeRecord(const nlohmann::json& raw, const std::string& key) {
  try {
    return raw.get<Record>();
  } catch (const nlohmann::json::exception& e) {
    throw ValidationError("corrupt record at '" + key + "': " + e.what());
  }
}

void requireObject(const domain::Metadata& metadata, const char* what) {
  if (!metadata.is_object()) {
    throw ValidationError(std::string(what) + " metadata must be a JSON object");
  }
}

}  // namespace

OrderLedger::OrderLedger(IStateStore& store, const ITimeProvider& time_provider)
    : store_(store), time_provider_(time_provider) {}

// -----------------------------------------------------------------------------
// transitionStatus / isTerminal
// -----------------------------------------------------------------------------
bool OrderLedger::transitionStatus(domain::OrderStatus current,
                                   domain::OrderStatus next) {
  using S = domain::OrderStatus;

  switch (current) {
    case S::Pending:
      return next == S::Pending ||
             next == S::Filled ||
             next == S::Failed ||
             next == S::Cancelled;

    case S::Filled:
    case S::Failed:
    case S::Cancelled:
      return false;
  }

  return false;
}

bool OrderLedger::isTerminal(domain::OrderStatus status) {
  using S = domain::OrderStatus;
  return status == S::Filled || status == S::Failed || status == S::Cancelled;
}

// -----------------------------------------------------------------------------
// persist: write-through helper
// -----------------------------------------------------------------------------
void OrderLedger::persist(const std::string& key, const nlohmann::json& record) {
  if (!store_.set(key, record)) {
    throw StoreUnavailableError("state store rejected write of '" + key + "'");
  }
}

// -----------------------------------------------------------------------------
// Locked lookups with load-on-miss
// -----------------------------------------------------------------------------
domain::Order* OrderLedger::findOrderLocked(const domain::OrderId& id) {
  auto it = orders_.find(id);
  if (it != orders_.end()) {
    return &it->second;
  }
  const std::string key = orderKey(id);
  auto raw = store_.get(key);
  if (!raw) {
    return nullptr;
  }
  auto [inserted, ok] =
      orders_.emplace(id, decodeRecord<domain::Order>(*raw, key));
  return &inserted->second;
}

domain::Trade* OrderLedger::findTradeLocked(const domain::TradeId& id) {
  auto it = trades_.find(id);
  if (it != trades_.end()) {
    return &it->second;
  }
  const std::string key = tradeKey(id);
  auto raw = store_.get(key);
  if (!raw) {
    return nullptr;
  }
  auto [inserted, ok] =
      trades_.emplace(id, decodeRecord<domain::Trade>(*raw, key));
  next_trade_sequence_ =
      std::max(next_trade_sequence_, inserted->second.sequence + 1);
  return &inserted->second;
}

// -----------------------------------------------------------------------------
// createOrder
// -----------------------------------------------------------------------------
domain::Order OrderLedger::createOrder(const std::string& symbol,
                                       domain::Side side, double size,
                                       domain::OrderKind kind,
                                       std::optional<double> price,
                                       domain::Metadata metadata) {
  if (!(size > 0.0)) {
    throw ValidationError("order size must be positive, got " +
                          std::to_string(size));
  }
  if (price && !(*price > 0.0)) {
    throw ValidationError("order price must be positive, got " +
                          std::to_string(*price));
  }
  if (metadata.is_null()) {
    metadata = domain::Metadata::object();
  }
  requireObject(metadata, "order");

  domain::Order order;
  order.id = ids_.next(kOrderIdPrefix);
  order.symbol = symbol;
  order.side = side;
  order.size = size;
  order.price = price;
  order.kind = kind;
  order.status = domain::OrderStatus::Pending;
  order.submitted_at = ms_to_timestamp(time_provider_.now_ms());
  order.metadata = std::move(metadata);

  std::unique_lock lock(mutex_);
  persist(orderKey(order.id), order);
  orders_[order.id] = order;
  return order;
}

// -----------------------------------------------------------------------------
// getOrder
// -----------------------------------------------------------------------------
std::optional<domain::Order> OrderLedger::getOrder(const domain::OrderId& id) {
  {
    std::shared_lock lock(mutex_);
    auto it = orders_.find(id);
    if (it != orders_.end()) {
      return it->second;
    }
  }

  std::unique_lock lock(mutex_);
  if (const domain::Order* order = findOrderLocked(id)) {
    return *order;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// updateOrder
// -----------------------------------------------------------------------------
domain::Order OrderLedger::updateOrder(const domain::OrderId& id,
                                       const OrderUpdate& update) {
  std::unique_lock lock(mutex_);

  domain::Order* current = findOrderLocked(id);
  if (current == nullptr) {
    throw NotFoundError("order not found: " + id);
  }

  if (!transitionStatus(current->status, update.status)) {
    throw InvalidStateError(
        "order " + id + ": illegal transition " +
        domain::orderStatusToString(current->status) + " -> " +
        domain::orderStatusToString(update.status));
  }

  domain::Order next = *current;
  next.status = update.status;
  if (update.filled_price) {
    next.filled_price = update.filled_price;
  }
  if (update.filled_size) {
    next.filled_size = update.filled_size;
  }
  if (update.error) {
    next.error = update.error;
  }
  if (update.metadata) {
    requireObject(*update.metadata, "order update");
    next.metadata.update(*update.metadata);
  }
  if (update.status == domain::OrderStatus::Filled) {
    next.filled_at = ms_to_timestamp(time_provider_.now_ms());
  }

  persist(orderKey(id), next);
  *current = next;

  if (current->status != domain::OrderStatus::Pending) {
    std::cout << "[OrderLedger] Order " << id << " -> "
              << domain::orderStatusToString(current->status) << std::endl;
  }
  return next;
}

// -----------------------------------------------------------------------------
// createTrade
// -----------------------------------------------------------------------------
domain::Trade OrderLedger::createTrade(const domain::OrderId& order_id,
                                       std::optional<domain::PositionId> position_id,
                                       double price, double size, double fee,
                                       domain::Metadata metadata) {
  if (!(price > 0.0) || !(size > 0.0)) {
    throw ValidationError("trade price and size must be positive");
  }
  if (fee < 0.0) {
    throw ValidationError("trade fee must not be negative");
  }
  if (metadata.is_null()) {
    metadata = domain::Metadata::object();
  }
  requireObject(metadata, "trade");

  std::unique_lock lock(mutex_);

  const domain::Order* order = findOrderLocked(order_id);
  if (order == nullptr) {
    throw NotFoundError("cannot record trade: order not found: " + order_id);
  }

  domain::Trade trade;
  trade.id = ids_.next(kTradeIdPrefix);
  trade.order_id = order_id;
  trade.position_id = std::move(position_id);
  trade.symbol = order->symbol;
  trade.side = order->side;
  trade.size = size;
  trade.price = price;
  trade.fee = fee;
  trade.timestamp = ms_to_timestamp(time_provider_.now_ms());
  trade.sequence = next_trade_sequence_;
  trade.metadata = std::move(metadata);

  persist(tradeKey(trade.id), trade);
  trades_[trade.id] = trade;
  ++next_trade_sequence_;
  return trade;
}

std::optional<domain::Trade> OrderLedger::getTrade(const domain::TradeId& id) {
  {
    std::shared_lock lock(mutex_);
    auto it = trades_.find(id);
    if (it != trades_.end()) {
      return it->second;
    }
  }

  std::unique_lock lock(mutex_);
  if (const domain::Trade* trade = findTradeLocked(id)) {
    return *trade;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// attachPosition
// -----------------------------------------------------------------------------
domain::Trade OrderLedger::attachPosition(const domain::TradeId& trade_id,
                                          const domain::PositionId& position_id) {
  std::unique_lock lock(mutex_);

  domain::Trade* current = findTradeLocked(trade_id);
  if (current == nullptr) {
    throw NotFoundError("trade not found: " + trade_id);
  }
  if (current->position_id) {
    throw InvalidStateError("trade " + trade_id +
                            " already attached to position " +
                            *current->position_id);
  }

  domain::Trade next = *current;
  next.position_id = position_id;

  persist(tradeKey(trade_id), next);
  *current = next;
  return next;
}

// -----------------------------------------------------------------------------
// getTrades
// -----------------------------------------------------------------------------
std::vector<domain::Trade> OrderLedger::getTrades(const TradeFilter& filter) const {
  std::vector<domain::Trade> result;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, trade] : trades_) {
      if (filter.symbol && trade.symbol != *filter.symbol) {
        continue;
      }
      if (filter.start && trade.timestamp < *filter.start) {
        continue;
      }
      if (filter.end && trade.timestamp > *filter.end) {
        continue;
      }
      result.push_back(trade);
    }
  }

  std::sort(result.begin(), result.end(),
            [](const domain::Trade& a, const domain::Trade& b) {
              if (a.timestamp != b.timestamp) {
                return a.timestamp < b.timestamp;
              }
              if (a.sequence != b.sequence) {
                return a.sequence < b.sequence;
              }
              return a.id < b.id;
            });
  return result;
}

}  // namespace autotrader
