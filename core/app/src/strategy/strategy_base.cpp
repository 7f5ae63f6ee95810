#include "autotrader/strategy/strategy_base.hpp"

#include "autotrader/domain/errors.hpp"

#include <iostream>

namespace autotrader {

StrategyBase::StrategyBase(std::string id, std::string symbol,
                           StrategyStateStore& states,
                           const ITimeProvider& time_provider)
    : id_(std::move(id)),
      symbol_(std::move(symbol)),
      states_(states),
      time_provider_(time_provider) {
  if (id_.empty()) {
    throw ValidationError("strategy id must not be empty");
  }
  if (symbol_.empty()) {
    throw ValidationError("strategy " + id_ + ": symbol must not be empty");
  }
  state_.strategy_id = id_;
  state_.symbol = symbol_;
  state_.active = false;
}

void StrategyBase::initialize() {
  domain::StrategyState loaded = states_.loadOrCreate(id_, symbol_);

  std::lock_guard lock(state_mutex_);
  state_ = std::move(loaded);
  initialized_ = true;
  if (!state_.active) {
    std::cout << "[Strategy " << id_
              << "] Persisted state is inactive; signals paused" << std::endl;
  }
}

bool StrategyBase::isActive() const {
  std::lock_guard lock(state_mutex_);
  return initialized_ && state_.active;
}

void StrategyBase::setActive(bool active) {
  std::lock_guard lock(state_mutex_);
  domain::StrategyState next = state_;
  next.active = active;
  states_.save(next);
  state_ = std::move(next);
}

void StrategyBase::cleanup() {
  setActive(false);
  onCleanup();
  std::cout << "[Strategy " << id_ << "] Cleaned up" << std::endl;
}

domain::StrategyState StrategyBase::state() const {
  std::lock_guard lock(state_mutex_);
  return state_;
}

void StrategyBase::updateStateMetadata(const nlohmann::json& patch) {
  std::lock_guard lock(state_mutex_);
  domain::StrategyState next = state_;
  if (!next.metadata.is_object()) {
    next.metadata = nlohmann::json::object();
  }
  next.metadata.update(patch);
  states_.save(next);
  state_ = std::move(next);
}

}  // namespace autotrader
