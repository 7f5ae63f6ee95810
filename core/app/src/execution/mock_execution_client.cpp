#include "autotrader/execution/mock_execution_client.hpp"

#include "autotrader/domain/codec.hpp"
#include "autotrader/domain/errors.hpp"

#include <iostream>

namespace autotrader {

MockExecutionClient::MockExecutionClient(double fee_rate) : fee_rate_(fee_rate) {
  if (fee_rate < 0.0) {
    throw ValidationError("fee rate must not be negative");
  }
}

Quote MockExecutionClient::getQuote(const std::string& input_token,
                                    const std::string& output_token,
                                    double amount, domain::Side side) {
  const std::string symbol = input_token + "-" + output_token;
  if (!(amount > 0.0)) {
    throw ExecutionError("quote amount must be positive for " + symbol);
  }

  std::lock_guard lock(mutex_);
  auto it = prices_.find(symbol);
  if (it == prices_.end()) {
    throw ExecutionError("no market price for " + symbol);
  }
  ++quotes_;

  Quote quote;
  quote.input_token = input_token;
  quote.output_token = output_token;
  quote.side = side;
  quote.amount = amount;
  quote.price = it->second;
  quote.size = amount;
  quote.fee = amount * it->second * fee_rate_;
  return quote;
}

SwapResult MockExecutionClient::executeSwap(const Quote& quote) {
  if (!(quote.price > 0.0) || !(quote.size > 0.0)) {
    throw ExecutionError("invalid quote for " + quote.input_token + "-" +
                         quote.output_token);
  }

  {
    std::lock_guard lock(mutex_);
    ++swaps_;
  }
  std::cout << "[MockExecutionClient] Filled " << domain::sideToString(quote.side)
            << " " << quote.size << " " << quote.input_token << "-"
            << quote.output_token << " @ " << quote.price << std::endl;
  return SwapResult{quote.price, quote.size, quote.fee};
}

void MockExecutionClient::setMarketPrice(const std::string& symbol, double price) {
  if (!(price > 0.0)) {
    throw ValidationError("market price must be positive for " + symbol);
  }
  std::lock_guard lock(mutex_);
  prices_[symbol] = price;
}

std::optional<double> MockExecutionClient::marketPrice(const std::string& symbol) const {
  std::lock_guard lock(mutex_);
  auto it = prices_.find(symbol);
  if (it == prices_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t MockExecutionClient::quoteCount() const {
  std::lock_guard lock(mutex_);
  return quotes_;
}

std::size_t MockExecutionClient::swapCount() const {
  std::lock_guard lock(mutex_);
  return swaps_;
}

}  // namespace autotrader
