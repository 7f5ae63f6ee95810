#pragma once

#include "autotrader/execution/i_execution_client.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace autotrader {

// -----------------------------------------------------------------------------
// MockExecutionClient: paper-trading venue
// -----------------------------------------------------------------------------
//
// @brief  Fills every swap immediately at the last market price recorded for
//         the pair.
//
// @details
// Market prices are fed through setMarketPrice("SOL-USDC", 101.5), either by
// the executable's market data path or directly by tests. getQuote() fails
// with ExecutionError when no price is known for the pair or the amount is
// not positive. The fee is `amount * price * fee_rate`. executeSwap()
// returns the quoted price, size and fee unchanged.
//
// Thread-safety: All methods are guarded by one mutex.
// -----------------------------------------------------------------------------
class MockExecutionClient final : public IExecutionClient {
 public:
  explicit MockExecutionClient(double fee_rate = 0.0);

  MockExecutionClient(const MockExecutionClient&) = delete;
  MockExecutionClient& operator=(const MockExecutionClient&) = delete;

  Quote getQuote(const std::string& input_token,
                 const std::string& output_token, double amount,
                 domain::Side side) override;

  SwapResult executeSwap(const Quote& quote) override;

  // Records the price at which subsequent quotes for `symbol` fill.
  void setMarketPrice(const std::string& symbol, double price);

  std::optional<double> marketPrice(const std::string& symbol) const;

  std::size_t quoteCount() const;
  std::size_t swapCount() const;

 private:
  const double fee_rate_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, double> prices_;  // "BASE-QUOTE" -> price
  std::size_t quotes_{0};
  std::size_t swaps_{0};
};

}  // namespace autotrader
