#include "autotrader/engine/trading_engine.hpp"

#include "autotrader/domain/codec.hpp"
#include "autotrader/domain/errors.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <iostream>
#include <set>

namespace autotrader {

TradingEngine::TradingEngine(OrderLedger& orders, PositionLedger& positions,
                             IExecutionClient& execution, EventBus& bus)
    : orders_(orders),
      positions_(positions),
      execution_(execution),
      bus_(bus) {}

// -----------------------------------------------------------------------------
// splitSymbol: "SOL-USDC" -> {SOL, USDC}
// -----------------------------------------------------------------------------
TradingEngine::TokenPair TradingEngine::splitSymbol(const std::string& symbol) {
  const auto dash = symbol.find('-');
  if (dash == std::string::npos || dash == 0 || dash + 1 == symbol.size() ||
      symbol.find('-', dash + 1) != std::string::npos) {
    throw ValidationError("symbol must have the form BASE-QUOTE, got '" +
                          symbol + "'");
  }
  return TokenPair{symbol.substr(0, dash), symbol.substr(dash + 1)};
}

// -----------------------------------------------------------------------------
// CloseClaim
// -----------------------------------------------------------------------------
TradingEngine::CloseClaim::CloseClaim(TradingEngine& engine,
                                      domain::PositionId position_id)
    : engine_(engine), position_id_(std::move(position_id)) {
  std::unique_lock lock(engine_.closing_mutex_);
  engine_.closing_cv_.wait(lock, [this] {
    return engine_.closing_.count(position_id_) == 0;
  });
  engine_.closing_.insert(position_id_);
}

TradingEngine::CloseClaim::~CloseClaim() {
  {
    std::lock_guard lock(engine_.closing_mutex_);
    engine_.closing_.erase(position_id_);
  }
  engine_.closing_cv_.notify_all();
}

// -----------------------------------------------------------------------------
// Event helpers
// -----------------------------------------------------------------------------
void TradingEngine::publish(PendingEvents& pending) {
  for (auto& [type, payload] : pending) {
    bus_.emit(type, std::move(payload));
  }
  pending.clear();
}

nlohmann::json TradingEngine::systemError(const char* operation,
                                          const std::string& error,
                                          nlohmann::json context) {
  context["component"] = "trading_engine";
  context["operation"] = operation;
  context["error"] = error;
  return context;
}

void TradingEngine::emitSystemError(const char* operation,
                                    const std::string& error,
                                    nlohmann::json context) {
  bus_.emit(EventType::SystemError,
            systemError(operation, error, std::move(context)));
}

// -----------------------------------------------------------------------------
// execute: quote + swap, failing the order on any client error
// -----------------------------------------------------------------------------
SwapResult TradingEngine::execute(const domain::Order& order,
                                  const TokenPair& pair,
                                  const char* operation,
                                  PendingEvents& pending) {
  std::string error;
  try {
    Quote quote = execution_.getQuote(pair.base, pair.quote, order.size,
                                      order.side);
    return execution_.executeSwap(quote);
  } catch (const std::exception& e) {
    error = e.what();
  }

  std::cerr << "[TradingEngine] " << operation << " failed for order "
            << order.id << ": " << error << std::endl;

  OrderUpdate update;
  update.status = domain::OrderStatus::Failed;
  update.error = error;
  try {
    orders_.updateOrder(order.id, update);
  } catch (const Error& e) {
    // The order stays Pending in the store; the execution error is still
    // the one reported to the caller.
    std::cerr << "[TradingEngine] Could not mark order " << order.id
              << " failed: " << e.what() << std::endl;
  }

  pending.emplace_back(
      EventType::SystemError,
      systemError(operation, error,
                  {{"order_id", order.id}, {"symbol", order.symbol}}));
  throw ExecutionError(error);
}

// -----------------------------------------------------------------------------
// executeMarketOrder
// -----------------------------------------------------------------------------
domain::Order TradingEngine::executeMarketOrder(const std::string& symbol,
                                                domain::Side side, double size,
                                                std::optional<double> stop_loss,
                                                domain::Metadata metadata) {
  const TokenPair pair = splitSymbol(symbol);
  if (!(size > 0.0)) {
    throw ValidationError("order size must be positive, got " +
                          std::to_string(size));
  }
  if (metadata.is_null()) {
    metadata = domain::Metadata::object();
  }

  domain::Order order = orders_.createOrder(symbol, side, size,
                                            domain::OrderKind::Market,
                                            std::nullopt, metadata);
  bus_.emit(EventType::OrderPlaced, order);

  PendingEvents pending;
  SwapResult fill;
  try {
    fill = execute(order, pair, "execute_market_order", pending);
  } catch (const ExecutionError&) {
    publish(pending);
    throw;
  }

  domain::Trade trade = orders_.createTrade(order.id, std::nullopt, fill.price,
                                            fill.size, fill.fee, metadata);
  domain::Position position = positions_.createPosition(
      symbol, side, trade.size, trade.price, stop_loss, metadata);
  trade = orders_.attachPosition(trade.id, position.id);

  OrderUpdate update;
  update.status = domain::OrderStatus::Filled;
  update.filled_price = trade.price;
  update.filled_size = trade.size;
  domain::Order filled = orders_.updateOrder(order.id, update);

  bus_.emit(EventType::TradeExecuted, trade);
  bus_.emit(EventType::PositionOpened, position);

  std::cout << "[TradingEngine] Market order " << filled.id << " filled: "
            << domain::sideToString(side) << " " << trade.size << " "
            << symbol << " @ " << trade.price << " -> " << position.id
            << std::endl;
  return filled;
}

// -----------------------------------------------------------------------------
// closePosition
// -----------------------------------------------------------------------------
domain::Position TradingEngine::closePosition(const domain::PositionId& position_id,
                                              domain::Metadata metadata) {
  if (metadata.is_null()) {
    metadata = domain::Metadata::object();
  }

  PendingEvents pending;
  domain::Position closed;
  try {
    CloseClaim claim(*this, position_id);
    closed = closeClaimed(position_id, metadata, pending);
  } catch (const std::exception&) {
    publish(pending);
    throw;
  }
  publish(pending);

  std::cout << "[TradingEngine] Position " << position_id << " closed @ "
            << closed.current_price << " realized_pnl=" << closed.realized_pnl
            << std::endl;
  return closed;
}

domain::Position TradingEngine::closeClaimed(const domain::PositionId& position_id,
                                             const domain::Metadata& metadata,
                                             PendingEvents& pending) {
  // Re-read under the claim so a close that waited behind another observes
  // its result.
  std::optional<domain::Position> position = positions_.getPosition(position_id);
  if (!position) {
    throw NotFoundError("position not found: " + position_id);
  }
  if (position->status == domain::PositionStatus::Closed) {
    throw InvalidStateError("position already closed: " + position_id);
  }

  const TokenPair pair = splitSymbol(position->symbol);
  const domain::Side close_side = domain::opposite(position->side);

  domain::Order order = orders_.createOrder(position->symbol, close_side,
                                            position->size,
                                            domain::OrderKind::Market,
                                            std::nullopt, metadata);
  pending.emplace_back(EventType::OrderPlaced, order);

  const SwapResult fill = execute(order, pair, "close_position", pending);

  domain::Trade trade = orders_.createTrade(order.id, position_id, fill.price,
                                            fill.size, fill.fee, metadata);

  OrderUpdate update;
  update.status = domain::OrderStatus::Filled;
  update.filled_price = trade.price;
  update.filled_size = trade.size;
  orders_.updateOrder(order.id, update);

  domain::Position closed =
      positions_.closePosition(position_id, trade.price, metadata);

  pending.emplace_back(EventType::TradeExecuted, trade);
  pending.emplace_back(EventType::PositionClosed, closed);
  return closed;
}

// -----------------------------------------------------------------------------
// cancelOrder
// -----------------------------------------------------------------------------
domain::Order TradingEngine::cancelOrder(const domain::OrderId& order_id) {
  OrderUpdate update;
  update.status = domain::OrderStatus::Cancelled;
  domain::Order cancelled = orders_.updateOrder(order_id, update);
  bus_.emit(EventType::OrderCancelled, cancelled);
  return cancelled;
}

// -----------------------------------------------------------------------------
// updatePositions
// -----------------------------------------------------------------------------
BatchResult TradingEngine::updatePositions(const std::string& symbol,
                                           double current_price) {
  if (!(current_price > 0.0)) {
    throw ValidationError("current price must be positive");
  }

  BatchResult result;
  for (const domain::Position& open : positions_.openPositions(symbol)) {
    try {
      domain::Position updated = positions_.updatePrice(open.id, current_price);
      bus_.emit(EventType::PositionUpdated, updated);

      if (updated.status == domain::PositionStatus::Closing) {
        std::cout << "[TradingEngine] Stop-loss triggered for " << open.id
                  << " at " << current_price << std::endl;
        closePosition(open.id, {{"reason", "stop_loss"}});
      }
      result.succeeded.push_back(open.id);
    } catch (const std::exception& e) {
      result.failed.push_back(open.id);
      std::cerr << "[TradingEngine] Error updating position " << open.id
                << ": " << e.what() << std::endl;
      emitSystemError("update_positions", e.what(),
                      {{"position_id", open.id}, {"symbol", symbol}});
    }
  }
  return result;
}

// -----------------------------------------------------------------------------
// closeAllPositions
// -----------------------------------------------------------------------------
BatchResult TradingEngine::closeAllPositions(domain::Metadata metadata) {
  const std::vector<domain::Position> open = positions_.openPositions();

  std::vector<std::future<domain::Position>> tasks;
  tasks.reserve(open.size());
  for (const domain::Position& position : open) {
    tasks.push_back(std::async(std::launch::async,
                               [this, id = position.id, metadata] {
                                 return closePosition(id, metadata);
                               }));
  }

  BatchResult result;
  for (std::size_t i = 0; i < tasks.size(); ++i) {
    try {
      tasks[i].get();
      result.succeeded.push_back(open[i].id);
    } catch (const std::exception& e) {
      result.failed.push_back(open[i].id);
      std::cerr << "[TradingEngine] Error closing position " << open[i].id
                << ": " << e.what() << std::endl;
      emitSystemError("close_all_positions", e.what(),
                      {{"position_id", open[i].id}});
    }
  }

  std::cout << "[TradingEngine] Closed " << result.succeeded.size() << "/"
            << open.size() << " positions" << std::endl;
  return result;
}

// -----------------------------------------------------------------------------
// getPositionSummary
// -----------------------------------------------------------------------------
nlohmann::json TradingEngine::getPositionSummary() const {
  const std::vector<domain::Position> open = positions_.openPositions();

  double total_unrealized = 0.0;
  std::set<std::string> symbols;
  nlohmann::json positions = nlohmann::json::array();
  for (const domain::Position& position : open) {
    total_unrealized += position.unrealized_pnl;
    symbols.insert(position.symbol);
    positions.push_back(position);
  }

  return {
      {"total_positions", open.size()},
      {"total_unrealized_pnl", total_unrealized},
      {"active_symbols", symbols},
      {"positions", positions},
  };
}

std::vector<domain::Trade> TradingEngine::getTradeHistory(
    const TradeFilter& filter) const {
  return orders_.getTrades(filter);
}

std::size_t TradingEngine::closesInFlight() const {
  std::lock_guard lock(closing_mutex_);
  return closing_.size();
}

}  // namespace autotrader
