#pragma once

#include "autotrader/strategy/i_strategy.hpp"
#include "autotrader/strategy/strategy_state_store.hpp"
#include "autotrader/time/i_time_provider.hpp"

#include <mutex>
#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// StrategyBase
// -----------------------------------------------------------------------------
//
// @brief  Shared StrategyState handling for concrete strategies: id and
//         symbol, the active flag, persistence through StrategyStateStore.
//
// @details
// Derived classes implement processData(), generateSignal() and
// dataRequirements(), and override onCleanup() to drop their indicator
// state. They record strategy-specific observations with
// updateStateMetadata().
//
// state_ is guarded by state_mutex_. The mutex is never held while calling
// into derived-class hooks.
// -----------------------------------------------------------------------------
class StrategyBase : public IStrategy {
 public:
  StrategyBase(std::string id, std::string symbol, StrategyStateStore& states,
               const ITimeProvider& time_provider);

  StrategyBase(const StrategyBase&) = delete;
  StrategyBase& operator=(const StrategyBase&) = delete;

  const std::string& id() const override { return id_; }
  const std::string& symbol() const override { return symbol_; }

  void initialize() override;
  bool isActive() const override;
  void setActive(bool active) override;
  void cleanup() override;
  domain::StrategyState state() const override;

 protected:
  // Called by cleanup() after the inactive state has been persisted.
  virtual void onCleanup() {}

  // Merges `patch` into the persisted state's metadata and saves it.
  void updateStateMetadata(const nlohmann::json& patch);

  const ITimeProvider& timeProvider() const { return time_provider_; }

 private:
  const std::string id_;
  const std::string symbol_;
  StrategyStateStore& states_;
  const ITimeProvider& time_provider_;

  mutable std::mutex state_mutex_;
  domain::StrategyState state_;
  bool initialized_{false};
};

}  // namespace autotrader
