#pragma once

#include "autotrader/domain/data_point.hpp"
#include "autotrader/domain/signal.hpp"
#include "autotrader/domain/strategy_state.hpp"

#include <optional>
#include <set>
#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// IStrategy: strategy capability interface
// -----------------------------------------------------------------------------
//
// @brief  Contract between the StrategyManager and one running strategy
//         instance.
//
// @details
// Lifecycle driven by the StrategyManager:
//
//   initialize()           once, after construction
//   processData(point)     for every routed DataPoint
//   generateSignal()       after every processData()
//   cleanup()              once, on removal
//
// A strategy never submits orders. It returns candidate Signals which the
// manager validates (validateSignal() then validateSignalHook()) and
// forwards to the TradingEngine.
//
// Thread model: processData(), generateSignal() and validateSignalHook()
// are called from the ingestion worker only. isActive(), setActive(),
// state() and cleanup() may be called from any thread.
// -----------------------------------------------------------------------------
class IStrategy {
 public:
  virtual ~IStrategy() = default;

  virtual const std::string& id() const = 0;
  virtual const std::string& symbol() const = 0;

  // Loads or creates the persisted StrategyState.
  virtual void initialize() = 0;

  virtual void processData(const domain::DataPoint& point) = 0;

  // A candidate signal for the data seen so far, or std::nullopt. Always
  // std::nullopt while inactive.
  virtual std::optional<domain::Signal> generateSignal() = 0;

  // DataPoint tags this strategy consumes ("candle", ...).
  virtual std::set<std::string> dataRequirements() const = 0;

  // Strategy-specific acceptance check run after the generic validation.
  virtual bool validateSignalHook(const domain::Signal& /*signal*/) const {
    return true;
  }

  virtual bool isActive() const = 0;

  // Pauses or resumes signal generation and persists the flag.
  virtual void setActive(bool active) = 0;

  // Persists active = false and drops indicator state.
  virtual void cleanup() = 0;

  // Copy of the current persisted state.
  virtual domain::StrategyState state() const = 0;
};

}  // namespace autotrader
