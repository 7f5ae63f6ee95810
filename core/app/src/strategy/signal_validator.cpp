#include "autotrader/strategy/signal_validator.hpp"

#include "autotrader/domain/codec.hpp"

#include <exception>
#include <iostream>

namespace autotrader {

namespace {

void logRejection(const domain::Signal& signal, const std::string& reason) {
  std::cerr << "[SignalValidator] WARNING: rejected "
            << domain::sideToString(signal.side) << " signal from "
            << signal.strategy_id << " on " << signal.symbol << ": " << reason
            << std::endl;
}

}  // namespace

bool validateSignal(const IStrategy& strategy, const domain::Signal& signal,
                    Timestamp now) {
  if (!(signal.price > 0.0)) {
    logRejection(signal, "price must be positive");
    return false;
  }
  if (!(signal.size > 0.0)) {
    logRejection(signal, "size must be positive");
    return false;
  }
  if (signal.expiry && *signal.expiry < now) {
    logRejection(signal, "expired at " + to_iso8601(*signal.expiry));
    return false;
  }

  try {
    if (!strategy.validateSignalHook(signal)) {
      logRejection(signal, "strategy check failed");
      return false;
    }
  } catch (const std::exception& e) {
    logRejection(signal, std::string("strategy check threw: ") + e.what());
    return false;
  }
  return true;
}

}  // namespace autotrader
