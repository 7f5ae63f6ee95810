#pragma once

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace autotrader {

// Record id prefixes.
inline constexpr const char* kOrderIdPrefix = "ord_";
inline constexpr const char* kTradeIdPrefix = "trade_";
inline constexpr const char* kPositionIdPrefix = "pos_";

// -----------------------------------------------------------------------------
// IdGenerator: random record ids
// -----------------------------------------------------------------------------
//
// @brief  Produces ids of the form `<prefix><8 lowercase hex chars>`, e.g.
//         "ord_3fa09c1e".
//
// @details
// Ids must stay unique across process restarts because ledgers reload
// records from the state store, so a counter is not enough. 32 random bits
// per id are assumed unique; no collision check is made.
//
// Ownership: One generator per ledger, held as a value member.
//
// Thread-safety: next() is safe to call concurrently; the engine is guarded
//                by an internal mutex.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  IdGenerator() : engine_(std::random_device{}()) {}

  // Seeded generator, for tests that need a reproducible id sequence.
  explicit IdGenerator(std::uint64_t seed) : engine_(seed) {}

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;

  // -------------------------------------------------------------------------
  // next(prefix)
  // -------------------------------------------------------------------------
  // @brief  Returns `prefix` followed by 8 random hex characters.
  // -------------------------------------------------------------------------
  std::string next(const std::string& prefix) {
    static constexpr char kHex[] = "0123456789abcdef";

    std::uint32_t bits;
    {
      std::lock_guard lock(mutex_);
      bits = static_cast<std::uint32_t>(engine_());
    }

    std::string id = prefix;
    id.reserve(prefix.size() + 8);
    for (int shift = 28; shift >= 0; shift -= 4) {
      id.push_back(kHex[(bits >> shift) & 0xF]);
    }
    return id;
  }

 private:
  std::mutex mutex_;
  std::mt19937_64 engine_;
};

}  // namespace autotrader
