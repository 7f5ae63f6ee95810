#pragma once

#include "autotrader/domain/signal.hpp"
#include "autotrader/strategy/i_strategy.hpp"

namespace autotrader {

// -----------------------------------------------------------------------------
// validateSignal(strategy, signal, now)
// -----------------------------------------------------------------------------
// @brief  Generic acceptance check applied to every candidate signal.
//
// @details
// Rejects a signal whose price or size is not positive, or whose expiry
// lies before `now`, then defers to strategy.validateSignalHook(). Each
// rejection is logged to std::cerr with its reason; the caller drops the
// signal. An exception thrown by the hook counts as a rejection.
// -----------------------------------------------------------------------------
bool validateSignal(const IStrategy& strategy, const domain::Signal& signal,
                    Timestamp now);

}  // namespace autotrader
