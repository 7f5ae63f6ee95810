#include "autotrader/ledger/position_ledger.hpp"

#include "autotrader/domain/codec.hpp"
#include "autotrader/domain/errors.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>

namespace autotrader {

namespace {

void mergeMetadata(domain::Metadata& target,
                   const std::optional<domain::Metadata>& extra) {
  if (!extra || extra->is_null()) {
    return;
  }
  if (!extra->is_object()) {
    throw ValidationError("position metadata must be a JSON object");
  }
  target.update(*extra);
}

}  // namespace

PositionLedger::PositionLedger(IStateStore& store,
                               const ITimeProvider& time_provider)
    : store_(store), time_provider_(time_provider) {}

// -----------------------------------------------------------------------------
// transitionStatus: validate position status machine
// -----------------------------------------------------------------------------
bool PositionLedger::transitionStatus(domain::PositionStatus current,
                                      domain::PositionStatus next) {
  using S = domain::PositionStatus;

  switch (current) {
    case S::Open:
      return next == S::Open || next == S::Closing || next == S::Closed;

    case S::Closing:
      return next == S::Closing || next == S::Closed;

    case S::Closed:
      return false;
  }

  return false;
}

void PositionLedger::persist(const domain::Position& position) {
  const std::string key = positionKey(position.id);
  if (!store_.set(key, position)) {
    throw StoreUnavailableError("state store rejected write of '" + key + "'");
  }
}

domain::Position* PositionLedger::findLocked(const domain::PositionId& id) {
  auto it = positions_.find(id);
  if (it != positions_.end()) {
    return &it->second;
  }
  const std::string key = positionKey(id);
  auto raw = store_.get(key);
  if (!raw) {
    return nullptr;
  }
  domain::Position loaded;
  try {
    loaded = raw->get<domain::Position>();
  } catch (const nlohmann::json::exception& e) {
    throw ValidationError("corrupt record at '" + key + "': " + e.what());
  }
  auto [inserted, ok] = positions_.emplace(id, std::move(loaded));
  return &inserted->second;
}

// -----------------------------------------------------------------------------
// createPosition
// -----------------------------------------------------------------------------
domain::Position PositionLedger::createPosition(const std::string& symbol,
                                                domain::Side side, double size,
                                                double entry_price,
                                                std::optional<double> stop_loss,
                                                domain::Metadata metadata) {
  if (!(size > 0.0) || !(entry_price > 0.0)) {
    throw ValidationError("position size and entry price must be positive");
  }
  if (stop_loss && !(*stop_loss > 0.0)) {
    throw ValidationError("stop-loss must be positive");
  }
  if (metadata.is_null()) {
    metadata = domain::Metadata::object();
  }
  if (!metadata.is_object()) {
    throw ValidationError("position metadata must be a JSON object");
  }

  const Timestamp now = ms_to_timestamp(time_provider_.now_ms());

  domain::Position position;
  position.id = ids_.next(kPositionIdPrefix);
  position.symbol = symbol;
  position.side = side;
  position.size = size;
  position.entry_price = entry_price;
  position.current_price = entry_price;
  position.status = domain::PositionStatus::Open;
  position.stop_loss = stop_loss;
  position.entry_time = now;
  position.last_update_time = now;
  position.metadata = std::move(metadata);

  std::unique_lock lock(mutex_);
  persist(position);
  positions_[position.id] = position;

  std::cout << "[PositionLedger] Opened " << position.id << " "
            << domain::sideToString(side) << " " << size << " " << symbol
            << " @ " << entry_price << std::endl;
  return position;
}

std::optional<domain::Position> PositionLedger::getPosition(
    const domain::PositionId& id) {
  {
    std::shared_lock lock(mutex_);
    auto it = positions_.find(id);
    if (it != positions_.end()) {
      return it->second;
    }
  }

  std::unique_lock lock(mutex_);
  if (const domain::Position* position = findLocked(id)) {
    return *position;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// updatePrice
// -----------------------------------------------------------------------------
domain::Position PositionLedger::updatePrice(
    const domain::PositionId& id, double price,
    std::optional<domain::Metadata> metadata) {
  if (!(price > 0.0)) {
    throw ValidationError("mark price must be positive");
  }

  std::unique_lock lock(mutex_);

  domain::Position* current = findLocked(id);
  if (current == nullptr) {
    throw NotFoundError("position not found: " + id);
  }
  if (current->status == domain::PositionStatus::Closed) {
    throw InvalidStateError("position " + id + " is closed");
  }

  domain::Position next = *current;
  next.current_price = price;
  next.unrealized_pnl =
      domain::pnl(next.side, next.entry_price, price, next.size);
  next.last_update_time = ms_to_timestamp(time_provider_.now_ms());
  mergeMetadata(next.metadata, metadata);

  if (next.status == domain::PositionStatus::Open && next.stop_loss &&
      domain::stopLossBreached(next.side, *next.stop_loss, price)) {
    next.status = domain::PositionStatus::Closing;
    std::cout << "[PositionLedger] Stop-loss " << *next.stop_loss
              << " breached for " << id << " at " << price << std::endl;
  }

  persist(next);
  *current = next;
  return next;
}

// -----------------------------------------------------------------------------
// closePosition
// -----------------------------------------------------------------------------
domain::Position PositionLedger::closePosition(
    const domain::PositionId& id, double close_price,
    std::optional<domain::Metadata> metadata) {
  if (!(close_price > 0.0)) {
    throw ValidationError("close price must be positive");
  }

  std::unique_lock lock(mutex_);

  domain::Position* current = findLocked(id);
  if (current == nullptr) {
    throw NotFoundError("position not found: " + id);
  }
  if (!transitionStatus(current->status, domain::PositionStatus::Closed)) {
    throw InvalidStateError("position " + id + " is already closed");
  }

  domain::Position next = *current;
  next.status = domain::PositionStatus::Closed;
  next.current_price = close_price;
  next.realized_pnl =
      domain::pnl(next.side, next.entry_price, close_price, next.size);
  next.unrealized_pnl = 0.0;
  next.last_update_time = ms_to_timestamp(time_provider_.now_ms());
  mergeMetadata(next.metadata, metadata);

  persist(next);
  *current = next;

  std::cout << "[PositionLedger] Closed " << id << " @ " << close_price
            << " realized_pnl=" << next.realized_pnl << std::endl;
  return next;
}

// -----------------------------------------------------------------------------
// openPositions
// -----------------------------------------------------------------------------
std::vector<domain::Position> PositionLedger::openPositions(
    const std::optional<std::string>& symbol) const {
  std::vector<domain::Position> result;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, position] : positions_) {
      if (position.status == domain::PositionStatus::Closed) {
        continue;
      }
      if (symbol && position.symbol != *symbol) {
        continue;
      }
      result.push_back(position);
    }
  }

  std::sort(result.begin(), result.end(),
            [](const domain::Position& a, const domain::Position& b) {
              if (a.entry_time != b.entry_time) {
                return a.entry_time < b.entry_time;
              }
              return a.id < b.id;
            });
  return result;
}

}  // namespace autotrader
