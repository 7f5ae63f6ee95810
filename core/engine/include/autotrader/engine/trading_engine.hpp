#pragma once

#include "autotrader/domain/order.hpp"
#include "autotrader/domain/position.hpp"
#include "autotrader/domain/trade.hpp"
#include "autotrader/eventbus/event_bus.hpp"
#include "autotrader/execution/i_execution_client.hpp"
#include "autotrader/ledger/order_ledger.hpp"
#include "autotrader/ledger/position_ledger.hpp"

#include <nlohmann/json.hpp>

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace autotrader {

// -----------------------------------------------------------------------------
// BatchResult
// -----------------------------------------------------------------------------
// Per-position outcome of a best-effort batch (updatePositions,
// closeAllPositions). Ids appear in processing order.
// -----------------------------------------------------------------------------
struct BatchResult {
  std::vector<domain::PositionId> succeeded;
  std::vector<domain::PositionId> failed;
};

// -----------------------------------------------------------------------------
// TradingEngine: order, trade and position orchestration
// -----------------------------------------------------------------------------
//
// @brief  The only component that turns a trading decision into ledger
//         records: creates orders, calls the execution client, records
//         trades, opens and closes positions, and broadcasts every
//         transition on the EventBus.
//
// @details
// Market order flow (executeMarketOrder):
//
//   validate → Order(Pending) ─emit order_placed─> getQuote → executeSwap
//        │                                              │
//        │                               failure ───────┴──> Order(Failed)
//        │                                                   emit system_error
//        │                                                   throw ExecutionError
//        ▼
//   Trade → Position(Open) → attach position to trade → Order(Filled)
//   emit trade_executed, position_opened
//
// Closing runs the same flow with the opposite side and finishes with
// Position(Closed). Closes are serialized per position id: a second close
// of the same position waits for the first and then fails with
// InvalidStateError because it observes Closed. The claim on an id is
// dropped as soon as its close finishes.
//
// Events of a close (order_placed, system_error, trade_executed,
// position_closed) are collected while the id is claimed and emitted in
// that order after the claim is released. Subscribers may therefore call
// back into the engine, including closing positions, without deadlock.
//
// No retries and no timeouts are applied to execution client calls.
//
// Event payloads carry the record as serialized by domain/codec.hpp
// (order, trade or position object). system_error payloads carry
// {"component", "operation", "error"} plus the ids involved.
//
// Thread model:
//   All public methods are thread-safe. Ledgers and the bus synchronize
//   themselves; the engine adds only the per-position close locks.
//
// Ownership:
//   Holds references to its collaborators, which must outlive it.
// -----------------------------------------------------------------------------
class TradingEngine {
 public:
  TradingEngine(OrderLedger& orders, PositionLedger& positions,
                IExecutionClient& execution, EventBus& bus);

  TradingEngine(const TradingEngine&) = delete;
  TradingEngine& operator=(const TradingEngine&) = delete;
  TradingEngine(TradingEngine&&) = delete;
  TradingEngine& operator=(TradingEngine&&) = delete;

  // -------------------------------------------------------------------------
  // executeMarketOrder(symbol, side, size, stop_loss, metadata)
  // -------------------------------------------------------------------------
  // @brief  Submits a market order and opens a position from its fill.
  //
  // @return The Filled order.
  //
  // @throws ValidationError if `symbol` is not "BASE-QUOTE" or size <= 0;
  //         nothing is written in that case.
  // @throws ExecutionError  if the quote or swap fails; the order is left
  //         Failed with the error text.
  // -------------------------------------------------------------------------
  domain::Order executeMarketOrder(const std::string& symbol, domain::Side side,
                                   double size,
                                   std::optional<double> stop_loss = std::nullopt,
                                   domain::Metadata metadata = domain::Metadata::object());

  // -------------------------------------------------------------------------
  // closePosition(position_id, metadata)
  // -------------------------------------------------------------------------
  // @brief  Closes the full position at market.
  //
  // @return The Closed position with realized PnL.
  //
  // @throws NotFoundError     if the position does not exist.
  // @throws InvalidStateError if it is already Closed.
  // @throws ExecutionError    if the quote or swap fails; the closing order
  //         is Failed and the position is unchanged.
  // -------------------------------------------------------------------------
  domain::Position closePosition(const domain::PositionId& position_id,
                                 domain::Metadata metadata = domain::Metadata::object());

  // -------------------------------------------------------------------------
  // cancelOrder(order_id)
  // -------------------------------------------------------------------------
  // @brief  Moves a Pending order to Cancelled and emits order_cancelled.
  //
  // @throws NotFoundError / InvalidStateError from the OrderLedger.
  // -------------------------------------------------------------------------
  domain::Order cancelOrder(const domain::OrderId& order_id);

  // -------------------------------------------------------------------------
  // updatePositions(symbol, current_price)
  // -------------------------------------------------------------------------
  // @brief  Marks every Open/Closing position on `symbol` to
  //         `current_price` and closes those whose stop-loss is breached.
  //
  // @details
  // Each position is handled independently: a failure is logged, emitted
  // as system_error, recorded in BatchResult::failed, and the batch moves
  // on. Stop-loss closes carry metadata {"reason": "stop_loss"}.
  //
  // @throws ValidationError if current_price <= 0.
  // -------------------------------------------------------------------------
  BatchResult updatePositions(const std::string& symbol, double current_price);

  // -------------------------------------------------------------------------
  // closeAllPositions(metadata)
  // -------------------------------------------------------------------------
  // @brief  Best-effort close of every Open/Closing position, one
  //         std::async task per position, all joined before returning.
  // -------------------------------------------------------------------------
  BatchResult closeAllPositions(domain::Metadata metadata = domain::Metadata::object());

  // {"total_positions", "total_unrealized_pnl", "active_symbols",
  //  "positions"} over Open/Closing positions.
  nlohmann::json getPositionSummary() const;

  // Trades matching `filter`, oldest first.
  std::vector<domain::Trade> getTradeHistory(const TradeFilter& filter = {}) const;

  // Number of positions with a close currently in progress.
  std::size_t closesInFlight() const;

 private:
  struct TokenPair {
    std::string base;
    std::string quote;
  };

  // Splits "BASE-QUOTE". Throws ValidationError for anything else.
  static TokenPair splitSymbol(const std::string& symbol);

  // Events held back until no engine lock is held, in emission order.
  using PendingEvents = std::vector<std::pair<EventType, nlohmann::json>>;

  // Holds the close claim on one position id for its lifetime. Blocks in
  // the constructor while another close of the same id is in flight.
  class CloseClaim {
   public:
    CloseClaim(TradingEngine& engine, domain::PositionId position_id);
    ~CloseClaim();

    CloseClaim(const CloseClaim&) = delete;
    CloseClaim& operator=(const CloseClaim&) = delete;

   private:
    TradingEngine& engine_;
    const domain::PositionId position_id_;
  };

  // Quote then swap for `order`. On failure marks the order Failed, queues
  // system_error on `pending` and throws ExecutionError.
  SwapResult execute(const domain::Order& order, const TokenPair& pair,
                     const char* operation, PendingEvents& pending);

  // Body of closePosition(). Caller holds the CloseClaim for the id.
  domain::Position closeClaimed(const domain::PositionId& position_id,
                                const domain::Metadata& metadata,
                                PendingEvents& pending);

  void publish(PendingEvents& pending);

  static nlohmann::json systemError(const char* operation,
                                    const std::string& error,
                                    nlohmann::json context);

  void emitSystemError(const char* operation, const std::string& error,
                       nlohmann::json context = nlohmann::json::object());

  OrderLedger& orders_;
  PositionLedger& positions_;
  IExecutionClient& execution_;
  EventBus& bus_;

  mutable std::mutex closing_mutex_;  // Protects closing_
  std::condition_variable closing_cv_;
  std::unordered_set<domain::PositionId> closing_;  // Ids with a close in flight
};

}  // namespace autotrader
