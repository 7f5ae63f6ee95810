#pragma once

#include "autotrader/store/i_state_store.hpp"
#include "autotrader/time/i_time_provider.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace autotrader {

// -----------------------------------------------------------------------------
// InMemoryStateStore
// -----------------------------------------------------------------------------
//
// @brief  Process-local IStateStore. Used by the paper-trading executable
//         and by every test.
//
// @details
// Values are held as JSON copies, so a caller mutating the object returned
// by get() never changes what is stored. TTL expiry is evaluated lazily
// against the injected ITimeProvider on get(); an expired key behaves
// exactly like a missing one.
//
// setAvailable(false) simulates an outage: every subsequent call throws
// StoreUnavailableError until availability is restored. Tests use this to
// check that a failed write leaves ledger caches untouched.
//
// Thread-safety: All methods are guarded by one mutex.
// -----------------------------------------------------------------------------
class InMemoryStateStore final : public IStateStore {
 public:
  explicit InMemoryStateStore(const ITimeProvider& time_provider);

  InMemoryStateStore(const InMemoryStateStore&) = delete;
  InMemoryStateStore& operator=(const InMemoryStateStore&) = delete;

  std::optional<nlohmann::json> get(const std::string& key) override;
  bool set(const std::string& key, const nlohmann::json& value,
           std::optional<std::chrono::seconds> ttl = std::nullopt) override;
  bool remove(const std::string& key) override;

  void setAvailable(bool available) { available_.store(available); }
  bool isAvailable() const { return available_.load(); }

  // Number of live (unexpired) keys.
  std::size_t size() const;

 private:
  struct Entry {
    nlohmann::json value;
    std::optional<std::int64_t> expires_at_ms;
  };

  void ensureAvailable(const char* operation, const std::string& key) const;
  bool expired(const Entry& entry, std::int64_t now_ms) const;

  const ITimeProvider& time_provider_;
  std::atomic<bool> available_{true};

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

}  // namespace autotrader
