#include "autotrader/strategy/ma_crossover_strategy.hpp"

#include "autotrader/domain/codec.hpp"
#include "autotrader/domain/errors.hpp"

#include <algorithm>
#include <iostream>
#include <type_traits>

namespace autotrader {

namespace {

constexpr double kSignalConfidence = 0.8;

template <typename T>
T paramOr(const nlohmann::json& params, const char* key, T fallback) {
  auto it = params.find(key);
  if (it == params.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_number()) {
    throw ValidationError(std::string("ma_crossover: '") + key +
                          "' must be a number");
  }
  if constexpr (std::is_integral_v<T>) {
    if (!it->is_number_integer()) {
      throw ValidationError(std::string("ma_crossover: '") + key +
                            "' must be an integer, got " + it->dump());
    }
  }
  return it->get<T>();
}

}  // namespace

// -----------------------------------------------------------------------------
// MaCrossoverParams
// -----------------------------------------------------------------------------
MaCrossoverParams MaCrossoverParams::fromJson(const nlohmann::json& params) {
  MaCrossoverParams p;
  if (params.is_null()) {
    return p;
  }
  if (!params.is_object()) {
    throw ValidationError("ma_crossover: params must be a JSON object");
  }

  p.fast_ma = paramOr<int>(params, "fast_ma", p.fast_ma);
  p.slow_ma = paramOr<int>(params, "slow_ma", p.slow_ma);
  p.min_volume = paramOr<double>(params, "min_volume", p.min_volume);
  p.risk_factor = paramOr<double>(params, "risk_factor", p.risk_factor);
  p.account_size = paramOr<double>(params, "account_size", p.account_size);
  p.stop_loss_fraction =
      paramOr<double>(params, "stop_loss_fraction", p.stop_loss_fraction);

  if (p.fast_ma <= 0 || p.slow_ma <= 0) {
    throw ValidationError("ma_crossover: periods must be positive");
  }
  if (p.fast_ma >= p.slow_ma) {
    throw ValidationError("ma_crossover: fast_ma (" + std::to_string(p.fast_ma) +
                          ") must be less than slow_ma (" +
                          std::to_string(p.slow_ma) + ")");
  }
  if (p.min_volume < 0.0) {
    throw ValidationError("ma_crossover: min_volume must not be negative");
  }
  if (!(p.risk_factor > 0.0) || !(p.account_size > 0.0) ||
      !(p.stop_loss_fraction > 0.0)) {
    throw ValidationError(
        "ma_crossover: risk_factor, account_size and stop_loss_fraction must "
        "be positive");
  }
  return p;
}

// -----------------------------------------------------------------------------
// MaCrossoverStrategy
// -----------------------------------------------------------------------------
MaCrossoverStrategy::MaCrossoverStrategy(std::string id, std::string symbol,
                                         const nlohmann::json& params,
                                         StrategyStateStore& states,
                                         const ITimeProvider& time_provider)
    : StrategyBase(std::move(id), std::move(symbol), states, time_provider),
      params_(MaCrossoverParams::fromJson(params)) {}

std::set<std::string> MaCrossoverStrategy::dataRequirements() const {
  return {domain::kCandleData};
}

std::size_t MaCrossoverStrategy::maxPeriod() const {
  return static_cast<std::size_t>(std::max(params_.fast_ma, params_.slow_ma));
}

std::size_t MaCrossoverStrategy::sampleCount() const {
  std::lock_guard lock(data_mutex_);
  return closes_.size();
}

double MaCrossoverStrategy::positionSize(double price) const {
  const double risk_amount = params_.account_size * params_.risk_factor;
  return risk_amount / (price * params_.stop_loss_fraction);
}

std::vector<double> MaCrossoverStrategy::movingAverage(
    const std::deque<double>& data, int period) {
  const auto window = static_cast<std::size_t>(period);
  std::vector<double> out;
  if (data.size() < window) {
    return out;
  }
  out.reserve(data.size() - window + 1);

  double sum = 0.0;
  for (std::size_t i = 0; i < data.size(); ++i) {
    sum += data[i];
    if (i >= window) {
      sum -= data[i - window];
    }
    if (i + 1 >= window) {
      out.push_back(sum / static_cast<double>(period));
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// processData
// -----------------------------------------------------------------------------
void MaCrossoverStrategy::processData(const domain::DataPoint& point) {
  if (point.data_type != domain::kCandleData) {
    return;
  }
  if (!point.value.is_object()) {
    throw ValidationError("candle for " + point.symbol + " is not an object");
  }

  double close = 0.0;
  double volume = 0.0;
  try {
    close = point.value.at("close").get<double>();
    volume = point.value.at("volume").get<double>();
  } catch (const nlohmann::json::exception& e) {
    throw ValidationError("malformed candle for " + point.symbol + ": " +
                          e.what());
  }

  std::lock_guard lock(data_mutex_);
  closes_.push_back(close);
  volumes_.push_back(volume);

  const std::size_t keep = maxPeriod() * 2;
  while (closes_.size() > keep) {
    closes_.pop_front();
    volumes_.pop_front();
  }

  if (closes_.size() >= maxPeriod()) {
    fast_series_ = movingAverage(closes_, params_.fast_ma);
    slow_series_ = movingAverage(closes_, params_.slow_ma);
  }
}

// -----------------------------------------------------------------------------
// generateSignal
// -----------------------------------------------------------------------------
std::optional<domain::Signal> MaCrossoverStrategy::generateSignal() {
  if (!isActive()) {
    return std::nullopt;
  }

  domain::Signal signal;
  {
    std::lock_guard lock(data_mutex_);
    if (fast_series_.size() < 2 || slow_series_.size() < 2) {
      return std::nullopt;
    }
    if (volumes_.back() < params_.min_volume) {
      return std::nullopt;
    }

    // Both series end on the newest close, so the last two entries of each
    // are aligned.
    const std::size_t nf = fast_series_.size();
    const std::size_t ns = slow_series_.size();
    const double prev_diff = fast_series_[nf - 2] - slow_series_[ns - 2];
    const double curr_diff = fast_series_[nf - 1] - slow_series_[ns - 1];

    Cross cross = Cross::None;
    if (prev_diff <= 0.0 && curr_diff > 0.0) {
      cross = Cross::Up;
    } else if (prev_diff >= 0.0 && curr_diff < 0.0) {
      cross = Cross::Down;
    }
    if (cross == Cross::None || cross == last_cross_) {
      return std::nullopt;
    }
    last_cross_ = cross;

    const double price = closes_.back();
    signal.strategy_id = id();
    signal.symbol = symbol();
    signal.side = cross == Cross::Up ? domain::Side::Buy : domain::Side::Sell;
    signal.size = positionSize(price);
    signal.price = price;
    signal.type = domain::SignalType::Entry;
    signal.confidence = kSignalConfidence;
    signal.timestamp = ms_to_timestamp(timeProvider().now_ms());
    signal.metadata = {
        {"fast_ma", fast_series_.back()},
        {"slow_ma", slow_series_.back()},
        {"risk_factor", params_.risk_factor},
    };
  }

  updateStateMetadata({{"last_signal",
                        {{"side", domain::sideToString(signal.side)},
                         {"price", signal.price},
                         {"timestamp", to_iso8601(signal.timestamp)}}}});

  std::cout << "[Strategy " << id() << "] "
            << (signal.side == domain::Side::Buy ? "Bullish" : "Bearish")
            << " crossover on " << symbol() << " @ " << signal.price
            << std::endl;
  return signal;
}

// -----------------------------------------------------------------------------
// validateSignalHook
// -----------------------------------------------------------------------------
bool MaCrossoverStrategy::validateSignalHook(const domain::Signal& signal) const {
  std::lock_guard lock(data_mutex_);

  if (closes_.size() < maxPeriod() || closes_.size() < 2) {
    return false;
  }
  if (volumes_.back() < params_.min_volume) {
    return false;
  }

  const double previous = closes_[closes_.size() - 2];
  const double change = (closes_.back() - previous) / previous;
  if (signal.side == domain::Side::Buy && change < 0.0) {
    return false;
  }
  if (signal.side == domain::Side::Sell && change > 0.0) {
    return false;
  }
  return true;
}

void MaCrossoverStrategy::onCleanup() {
  std::lock_guard lock(data_mutex_);
  closes_.clear();
  volumes_.clear();
  fast_series_.clear();
  slow_series_.clear();
  last_cross_ = Cross::None;
}

}  // namespace autotrader
