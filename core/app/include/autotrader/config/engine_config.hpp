#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace autotrader {

// -----------------------------------------------------------------------------
// Engine configuration
// -----------------------------------------------------------------------------
//
// @brief  Plain structs with defaults, filled from a JSON document.
//
// @details
// Every key is optional; a missing key keeps its default. A key present
// with the wrong JSON type, or a value outside its valid range, raises
// ValidationError naming the key.
//
//   {
//     "trading":   {"default_stop_loss_percent": 0.05, "risk_factor": 0.02},
//     "execution": {"fee_rate": 0.0},
//     "gateway":   {"endpoint": "tcp://127.0.0.1:5555"},
//     "strategies": [
//       {"id": "sol_ma", "type": "ma_crossover", "symbol": "SOL-USDC",
//        "params": {"fast_ma": 10, "slow_ma": 21}}
//     ]
//   }
// -----------------------------------------------------------------------------
struct TradingConfig {
  // Stop distance applied to strategy entries, as a fraction of the entry
  // price. Must lie in (0, 1).
  double default_stop_loss_percent{0.05};
  // Injected into strategy params that do not set their own risk_factor.
  double risk_factor{0.02};
};

struct ExecutionConfig {
  double fee_rate{0.0};  // Paper-trading fee, fraction of notional
};

struct GatewayConfig {
  std::string endpoint{"tcp://127.0.0.1:5555"};
};

// One strategy started at boot.
struct StrategyConfig {
  std::string id;
  std::string type;
  std::string symbol;
  nlohmann::json params = nlohmann::json::object();
};

struct EngineConfig {
  TradingConfig trading;
  ExecutionConfig execution;
  GatewayConfig gateway;
  std::vector<StrategyConfig> strategies;
};

// @throws ValidationError for a malformed document.
EngineConfig parseEngineConfig(const nlohmann::json& document);

// Reads and parses the JSON file at `path`.
// @throws ValidationError if the file cannot be read or parsed.
EngineConfig loadEngineConfig(const std::string& path);

}  // namespace autotrader
