#pragma once

#include "autotrader/concurrent/id_generator.hpp"
#include "autotrader/domain/position.hpp"
#include "autotrader/store/i_state_store.hpp"
#include "autotrader/time/i_time_provider.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace autotrader {

// -----------------------------------------------------------------------------
// PositionLedger: authoritative position records
// -----------------------------------------------------------------------------
//
// @brief  Write-through cache of positions over an IStateStore, keyed
//         "position:{id}". Owns PnL bookkeeping and the position status
//         machine.
//
// @details
// Same persistence discipline as OrderLedger: mutate a copy, persist it,
// then commit it to the cache. A failed write leaves the cache untouched.
//
// Status machine (see transitionStatus()):
//   Open    → Closing (stop-loss breached), Closed (manual close)
//   Closing → Closed
//   Closed  → (none)
//
// updatePrice() is the only path into Closing: when the new price breaches
// the stop-loss of an Open position it moves to Closing in the same write.
// The caller (TradingEngine) then closes it.
//
// Thread model:
//   All public methods are thread-safe (shared lock for reads, exclusive
//   lock across each read-modify-persist-commit).
// -----------------------------------------------------------------------------
class PositionLedger {
 public:
  PositionLedger(IStateStore& store, const ITimeProvider& time_provider);

  PositionLedger(const PositionLedger&) = delete;
  PositionLedger& operator=(const PositionLedger&) = delete;
  PositionLedger(PositionLedger&&) = delete;
  PositionLedger& operator=(PositionLedger&&) = delete;

  // -------------------------------------------------------------------------
  // createPosition(...)
  // -------------------------------------------------------------------------
  // @brief  Creates and persists an Open position. current_price starts at
  //         entry_price and both PnL fields at zero.
  //
  // @throws ValidationError if size or entry_price is <= 0, or a supplied
  //         stop-loss is <= 0.
  // -------------------------------------------------------------------------
  domain::Position createPosition(const std::string& symbol, domain::Side side,
                                  double size, double entry_price,
                                  std::optional<double> stop_loss = std::nullopt,
                                  domain::Metadata metadata = domain::Metadata::object());

  std::optional<domain::Position> getPosition(const domain::PositionId& id);

  // -------------------------------------------------------------------------
  // updatePrice(id, price, metadata)
  // -------------------------------------------------------------------------
  // @brief  Marks the position to `price`: sets current_price, recomputes
  //         unrealized PnL and, for an Open position whose stop-loss is
  //         breached, moves it to Closing.
  //
  // @throws NotFoundError      if no such position exists.
  // @throws InvalidStateError  if the position is Closed.
  // @throws ValidationError    if price <= 0.
  // -------------------------------------------------------------------------
  domain::Position updatePrice(const domain::PositionId& id, double price,
                               std::optional<domain::Metadata> metadata = std::nullopt);

  // -------------------------------------------------------------------------
  // closePosition(id, close_price, metadata)
  // -------------------------------------------------------------------------
  // @brief  Moves the position to Closed, realizing PnL at close_price and
  //         zeroing unrealized PnL.
  //
  // @throws NotFoundError      if no such position exists.
  // @throws InvalidStateError  if the position is already Closed.
  // -------------------------------------------------------------------------
  domain::Position closePosition(const domain::PositionId& id, double close_price,
                                 std::optional<domain::Metadata> metadata = std::nullopt);

  // Cache-resident Open and Closing positions, optionally for one symbol,
  // ordered by entry_time then id.
  std::vector<domain::Position> openPositions(
      const std::optional<std::string>& symbol = std::nullopt) const;

  static bool transitionStatus(domain::PositionStatus current,
                               domain::PositionStatus next);

 private:
  domain::Position* findLocked(const domain::PositionId& id);
  void persist(const domain::Position& position);

  IStateStore& store_;
  const ITimeProvider& time_provider_;
  IdGenerator ids_;

  mutable std::shared_mutex mutex_;  // Protects positions_
  std::unordered_map<domain::PositionId, domain::Position> positions_;
};

}  // namespace autotrader
