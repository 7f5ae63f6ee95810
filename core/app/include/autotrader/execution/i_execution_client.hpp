#pragma once

#include "autotrader/domain/order.hpp"

#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// Quote
// -----------------------------------------------------------------------------
// Price commitment returned by IExecutionClient::getQuote(). For a symbol
// "BASE-QUOTE" the engine asks for input_token = BASE, output_token = QUOTE,
// amount = order size in BASE units. `price` is QUOTE per BASE.
// -----------------------------------------------------------------------------
struct Quote {
  std::string input_token;
  std::string output_token;
  domain::Side side{domain::Side::Buy};
  double amount{0.0};
  double price{0.0};
  double size{0.0};
  double fee{0.0};
};

// Fill reported by IExecutionClient::executeSwap().
struct SwapResult {
  double price{0.0};
  double size{0.0};
  double fee{0.0};
};

// -----------------------------------------------------------------------------
// IExecutionClient: quote/execute contract with the venue
// -----------------------------------------------------------------------------
//
// @brief  Abstract boundary to the exchange or DEX aggregator that actually
//         performs swaps.
//
// @details
// The TradingEngine calls getQuote() then executeSwap() for every order it
// submits, with no retry and no timeout. Implementations report failure by
// throwing; the engine treats any exception as an execution failure
// (ExecutionError is preferred so the message reaches the order record
// unchanged).
//
// Implementations:
//   - MockExecutionClient: fills at the last recorded market price
//                          (paper trading, tests).
//
// Thread-safety: Implementations must tolerate concurrent calls; the engine
//                closes positions concurrently at shutdown.
// -----------------------------------------------------------------------------
class IExecutionClient {
 public:
  virtual ~IExecutionClient() = default;

  virtual Quote getQuote(const std::string& input_token,
                         const std::string& output_token, double amount,
                         domain::Side side) = 0;

  virtual SwapResult executeSwap(const Quote& quote) = 0;
};

}  // namespace autotrader
