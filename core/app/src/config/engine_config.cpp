#include "autotrader/config/engine_config.hpp"

#include "autotrader/domain/errors.hpp"

#include <fstream>

namespace autotrader {

namespace {

using nlohmann::json;

const json* section(const json& document, const char* name) {
  auto it = document.find(name);
  if (it == document.end() || it->is_null()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw ValidationError(std::string("config: '") + name +
                          "' must be an object");
  }
  return &*it;
}

void readNumber(const json& object, const char* section_name, const char* key,
                double& out) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return;
  }
  if (!it->is_number()) {
    throw ValidationError(std::string("config: '") + section_name + "." + key +
                          "' must be a number");
  }
  out = it->get<double>();
}

std::string readString(const json& object, const std::string& where,
                       const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string() ||
      it->get<std::string>().empty()) {
    throw ValidationError("config: " + where + "." + key +
                          " must be a non-empty string");
  }
  return it->get<std::string>();
}

}  // namespace

EngineConfig parseEngineConfig(const json& document) {
  EngineConfig config;
  if (document.is_null()) {
    return config;
  }
  if (!document.is_object()) {
    throw ValidationError("config: document must be a JSON object");
  }

  if (const json* trading = section(document, "trading")) {
    readNumber(*trading, "trading", "default_stop_loss_percent",
               config.trading.default_stop_loss_percent);
    readNumber(*trading, "trading", "risk_factor", config.trading.risk_factor);
  }
  if (!(config.trading.default_stop_loss_percent > 0.0) ||
      !(config.trading.default_stop_loss_percent < 1.0)) {
    throw ValidationError(
        "config: trading.default_stop_loss_percent must be in (0, 1)");
  }
  if (!(config.trading.risk_factor > 0.0)) {
    throw ValidationError("config: trading.risk_factor must be positive");
  }

  if (const json* execution = section(document, "execution")) {
    readNumber(*execution, "execution", "fee_rate", config.execution.fee_rate);
  }
  if (config.execution.fee_rate < 0.0) {
    throw ValidationError("config: execution.fee_rate must not be negative");
  }

  if (const json* gateway = section(document, "gateway")) {
    auto it = gateway->find("endpoint");
    if (it != gateway->end() && !it->is_null()) {
      if (!it->is_string()) {
        throw ValidationError("config: 'gateway.endpoint' must be a string");
      }
      config.gateway.endpoint = it->get<std::string>();
    }
  }

  auto strategies = document.find("strategies");
  if (strategies != document.end() && !strategies->is_null()) {
    if (!strategies->is_array()) {
      throw ValidationError("config: 'strategies' must be an array");
    }
    for (std::size_t i = 0; i < strategies->size(); ++i) {
      const json& entry = (*strategies)[i];
      const std::string where = "strategies[" + std::to_string(i) + "]";
      if (!entry.is_object()) {
        throw ValidationError("config: " + where + " must be an object");
      }
      StrategyConfig strategy;
      strategy.id = readString(entry, where, "id");
      strategy.type = readString(entry, where, "type");
      strategy.symbol = readString(entry, where, "symbol");
      auto params = entry.find("params");
      if (params != entry.end() && !params->is_null()) {
        if (!params->is_object()) {
          throw ValidationError("config: " + where + ".params must be an object");
        }
        strategy.params = *params;
      }
      config.strategies.push_back(std::move(strategy));
    }
  }

  return config;
}

EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ValidationError("config: cannot open '" + path + "'");
  }

  json document;
  try {
    in >> document;
  } catch (const json::parse_error& e) {
    throw ValidationError("config: cannot parse '" + path + "': " + e.what());
  }
  return parseEngineConfig(document);
}

}  // namespace autotrader
