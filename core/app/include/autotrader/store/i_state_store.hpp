#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace autotrader {

// Store key helpers. Records are flat JSON objects under these keys.
inline std::string orderKey(const std::string& id) { return "order:" + id; }
inline std::string tradeKey(const std::string& id) { return "trade:" + id; }
inline std::string positionKey(const std::string& id) { return "position:" + id; }
inline std::string strategyStateKey(const std::string& id) {
  return "strategy:" + id + ":state";
}

// -----------------------------------------------------------------------------
// IStateStore: key/value persistence contract
// -----------------------------------------------------------------------------
//
// @brief  Backing store for the ledgers and strategy state.
//
// @details
// The ledgers treat the store as the source of truth and keep a
// write-through cache in front of it. Implementations are expected to be
// a thin adapter over a real key/value service; this process ships only
// InMemoryStateStore.
//
// Error contract:
//   - get() returns std::nullopt for a missing or expired key.
//   - set()/remove() return false when the store declined the write.
//   - Any call throws StoreUnavailableError when the store cannot be
//     reached at all.
//
// Thread-safety: Implementations must be safe to call from any thread.
// -----------------------------------------------------------------------------
class IStateStore {
 public:
  virtual ~IStateStore() = default;

  virtual std::optional<nlohmann::json> get(const std::string& key) = 0;

  // Stores `value` under `key`. With a ttl the key expires after that
  // duration; without one it never expires.
  virtual bool set(const std::string& key, const nlohmann::json& value,
                   std::optional<std::chrono::seconds> ttl = std::nullopt) = 0;

  // Returns false if the key did not exist.
  virtual bool remove(const std::string& key) = 0;
};

}  // namespace autotrader
