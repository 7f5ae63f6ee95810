#pragma once

#include "autotrader/concurrent/id_generator.hpp"
#include "autotrader/domain/order.hpp"
#include "autotrader/domain/order_status.hpp"
#include "autotrader/domain/trade.hpp"
#include "autotrader/store/i_state_store.hpp"
#include "autotrader/time/i_time_provider.hpp"

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace autotrader {

// -----------------------------------------------------------------------------
// OrderUpdate
// -----------------------------------------------------------------------------
// Requested change for OrderLedger::updateOrder(). Unset optionals leave the
// corresponding field unchanged; `metadata` is merged key by key into the
// order's existing metadata.
// -----------------------------------------------------------------------------
struct OrderUpdate {
  domain::OrderStatus status{domain::OrderStatus::Pending};
  std::optional<double> filled_price;
  std::optional<double> filled_size;
  std::optional<std::string> error;
  std::optional<domain::Metadata> metadata;
};

// -----------------------------------------------------------------------------
// TradeFilter
// -----------------------------------------------------------------------------
// Selection for OrderLedger::getTrades(). Every set field must match; the
// time range is inclusive on both ends.
// -----------------------------------------------------------------------------
struct TradeFilter {
  std::optional<std::string> symbol;
  std::optional<Timestamp> start;
  std::optional<Timestamp> end;
};

// -----------------------------------------------------------------------------
// OrderLedger: authoritative order and trade records
// -----------------------------------------------------------------------------
//
// @brief  Write-through cache of orders and trades over an IStateStore.
//
// @details
// Every mutation builds the new record on a copy, persists the full record
// under "order:{id}" / "trade:{id}", and only then commits the copy to the
// in-memory map. If the store write throws or is declined, the cache keeps
// its previous value and the error propagates, so cache and store never
// disagree about an id.
//
// Lookups check the cache first and fall back to the store (load-on-miss).
// A record that exists in the store but cannot be decoded raises
// ValidationError.
//
// Order status transitions are validated by transitionStatus(); an illegal
// transition raises InvalidStateError and changes nothing.
//
// The ledger emits no events. Event publication belongs to the
// TradingEngine, which knows why a record changed.
//
// Thread model:
//   All public methods are thread-safe. Reads take a shared lock on the
//   cache; mutations hold an exclusive lock across read-modify-persist-
//   commit, so concurrent updates of the same order are serialized.
//
// Ownership:
//   Owned by TradingSystem (or a test). Holds references to the store and
//   clock, which must outlive it. Callers always receive copies.
// -----------------------------------------------------------------------------
class OrderLedger {
 public:
  OrderLedger(IStateStore& store, const ITimeProvider& time_provider);

  OrderLedger(const OrderLedger&) = delete;
  OrderLedger& operator=(const OrderLedger&) = delete;
  OrderLedger(OrderLedger&&) = delete;
  OrderLedger& operator=(OrderLedger&&) = delete;

  // -------------------------------------------------------------------------
  // createOrder(...)
  // -------------------------------------------------------------------------
  // @brief  Creates and persists a new Pending order.
  //
  // @throws ValidationError if size <= 0 or a supplied price is <= 0.
  // @throws StoreUnavailableError if the record cannot be written.
  // -------------------------------------------------------------------------
  domain::Order createOrder(const std::string& symbol, domain::Side side,
                            double size,
                            domain::OrderKind kind = domain::OrderKind::Market,
                            std::optional<double> price = std::nullopt,
                            domain::Metadata metadata = domain::Metadata::object());

  // Cached copy, else loaded from the store, else std::nullopt.
  std::optional<domain::Order> getOrder(const domain::OrderId& id);

  // -------------------------------------------------------------------------
  // updateOrder(id, update)
  // -------------------------------------------------------------------------
  // @brief  Applies `update` to the order and persists it.
  //
  // @details
  // Moving to Filled stamps filled_at from the clock. Moving to Failed
  // records `update.error`.
  //
  // @throws NotFoundError      if no such order exists.
  // @throws InvalidStateError  if the status transition is illegal.
  // -------------------------------------------------------------------------
  domain::Order updateOrder(const domain::OrderId& id, const OrderUpdate& update);

  // -------------------------------------------------------------------------
  // createTrade(...)
  // -------------------------------------------------------------------------
  // @brief  Records an executed swap against an existing order. Symbol and
  //         side are taken from the order.
  //
  // @throws NotFoundError   if the order does not exist.
  // @throws ValidationError if price or size is <= 0, or fee < 0.
  // -------------------------------------------------------------------------
  domain::Trade createTrade(const domain::OrderId& order_id,
                            std::optional<domain::PositionId> position_id,
                            double price, double size, double fee,
                            domain::Metadata metadata = domain::Metadata::object());

  std::optional<domain::Trade> getTrade(const domain::TradeId& id);

  // -------------------------------------------------------------------------
  // attachPosition(trade_id, position_id)
  // -------------------------------------------------------------------------
  // @brief  Sets the trade's position id. Allowed once per trade.
  //
  // @throws NotFoundError     if the trade does not exist.
  // @throws InvalidStateError if the trade already references a position.
  // -------------------------------------------------------------------------
  domain::Trade attachPosition(const domain::TradeId& trade_id,
                               const domain::PositionId& position_id);

  // Trades known to this ledger that match `filter`, sorted by timestamp
  // ascending, then by creation sequence.
  std::vector<domain::Trade> getTrades(const TradeFilter& filter = {}) const;

  // -------------------------------------------------------------------------
  // transitionStatus(current, next)
  // -------------------------------------------------------------------------
  // Legal transitions:
  //   Pending   → Pending (field update only), Filled, Failed, Cancelled
  //   Filled    → (none; terminal)
  //   Failed    → (none; terminal)
  //   Cancelled → (none; terminal)
  // -------------------------------------------------------------------------
  static bool transitionStatus(domain::OrderStatus current,
                               domain::OrderStatus next);

  static bool isTerminal(domain::OrderStatus status);

 private:
  // Cache lookup with load-on-miss. Caller holds mutex_ exclusively.
  domain::Order* findOrderLocked(const domain::OrderId& id);
  domain::Trade* findTradeLocked(const domain::TradeId& id);

  // Writes `record` under `key`. Throws StoreUnavailableError when the store
  // declines the write.
  void persist(const std::string& key, const nlohmann::json& record);

  IStateStore& store_;
  const ITimeProvider& time_provider_;
  IdGenerator ids_;

  mutable std::shared_mutex mutex_;  // Protects orders_ and trades_
  std::unordered_map<domain::OrderId, domain::Order> orders_;
  std::unordered_map<domain::TradeId, domain::Trade> trades_;
  // Next Trade::sequence. Kept above every sequence seen, including trades
  // loaded from the store.
  std::uint64_t next_trade_sequence_{1};
};

}  // namespace autotrader
