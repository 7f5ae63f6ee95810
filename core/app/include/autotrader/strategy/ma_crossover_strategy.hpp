#pragma once

#include "autotrader/strategy/strategy_base.hpp"

#include <nlohmann/json.hpp>

#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace autotrader {

// Registry tag for MaCrossoverStrategy.
inline constexpr const char* kMaCrossoverTag = "ma_crossover";

// -----------------------------------------------------------------------------
// MaCrossoverParams
// -----------------------------------------------------------------------------
// Parsed from the strategy's JSON params; every key is optional.
// -----------------------------------------------------------------------------
struct MaCrossoverParams {
  int fast_ma{10};
  int slow_ma{21};
  double min_volume{1'000'000.0};
  double risk_factor{0.02};
  double account_size{1000.0};
  double stop_loss_fraction{0.05};

  // @throws ValidationError for a wrongly typed key, a period <= 0,
  //         fast_ma >= slow_ma, or a non-positive sizing input.
  static MaCrossoverParams fromJson(const nlohmann::json& params);
};

// -----------------------------------------------------------------------------
// MaCrossoverStrategy: moving-average crossover
// -----------------------------------------------------------------------------
//
// @brief  Emits a buy entry when the fast SMA of closes crosses above the
//         slow SMA and a sell entry when it crosses below.
//
// @details
// Consumes "candle" points only (value: {"close": ..., "volume": ...}).
// Close and volume buffers keep at most 2 * max(fast_ma, slow_ma) samples.
// Once max(fast_ma, slow_ma) samples are buffered, both SMA series are
// recomputed over the buffer, aligned on their most recent sample.
//
// generateSignal() looks at the last two aligned samples of
// diff = fast - slow:
//   prev <= 0 && curr > 0  → bullish cross → buy
//   prev >= 0 && curr < 0  → bearish cross → sell
// A cross is emitted only if its direction differs from the last emitted
// cross, and only when the latest volume is at least min_volume.
//
// Sizing: size = account_size * risk_factor / (price * stop_loss_fraction).
//
// validateSignalHook() additionally requires enough samples, sufficient
// volume, and a last price move that agrees with the signal side.
//
// Thread model: buffers and indicators are guarded by data_mutex_.
// -----------------------------------------------------------------------------
class MaCrossoverStrategy final : public StrategyBase {
 public:
  MaCrossoverStrategy(std::string id, std::string symbol,
                      const nlohmann::json& params, StrategyStateStore& states,
                      const ITimeProvider& time_provider);

  void processData(const domain::DataPoint& point) override;
  std::optional<domain::Signal> generateSignal() override;
  std::set<std::string> dataRequirements() const override;
  bool validateSignalHook(const domain::Signal& signal) const override;

  const MaCrossoverParams& params() const { return params_; }

  // Position size for an entry at `price`.
  double positionSize(double price) const;

  // Buffered sample count.
  std::size_t sampleCount() const;

 protected:
  void onCleanup() override;

 private:
  enum class Cross { None, Up, Down };

  // Trailing simple moving averages over `data`, one per full window.
  static std::vector<double> movingAverage(const std::deque<double>& data,
                                           int period);

  std::size_t maxPeriod() const;

  const MaCrossoverParams params_;

  mutable std::mutex data_mutex_;  // Protects everything below
  std::deque<double> closes_;
  std::deque<double> volumes_;
  std::vector<double> fast_series_;
  std::vector<double> slow_series_;
  Cross last_cross_{Cross::None};
};

}  // namespace autotrader
