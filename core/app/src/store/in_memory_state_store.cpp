#include "autotrader/store/in_memory_state_store.hpp"

#include "autotrader/domain/errors.hpp"

namespace autotrader {

InMemoryStateStore::InMemoryStateStore(const ITimeProvider& time_provider)
    : time_provider_(time_provider) {}

void InMemoryStateStore::ensureAvailable(const char* operation,
                                         const std::string& key) const {
  if (!available_.load()) {
    throw StoreUnavailableError(std::string("state store unavailable (") +
                                operation + " " + key + ")");
  }
}

bool InMemoryStateStore::expired(const Entry& entry, std::int64_t now_ms) const {
  return entry.expires_at_ms && *entry.expires_at_ms <= now_ms;
}

std::optional<nlohmann::json> InMemoryStateStore::get(const std::string& key) {
  ensureAvailable("get", key);

  std::lock_guard lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  if (expired(it->second, time_provider_.now_ms())) {
    entries_.erase(it);
    return std::nullopt;
  }
  return it->second.value;
}

bool InMemoryStateStore::set(const std::string& key,
                             const nlohmann::json& value,
                             std::optional<std::chrono::seconds> ttl) {
  ensureAvailable("set", key);

  Entry entry{value, std::nullopt};
  if (ttl) {
    if (ttl->count() <= 0) {
      return false;
    }
    entry.expires_at_ms =
        time_provider_.now_ms() +
        std::chrono::duration_cast<std::chrono::milliseconds>(*ttl).count();
  }

  std::lock_guard lock(mutex_);
  entries_[key] = std::move(entry);
  return true;
}

bool InMemoryStateStore::remove(const std::string& key) {
  ensureAvailable("remove", key);

  std::lock_guard lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return false;
  }
  const bool was_live = !expired(it->second, time_provider_.now_ms());
  entries_.erase(it);
  return was_live;
}

std::size_t InMemoryStateStore::size() const {
  std::lock_guard lock(mutex_);
  const std::int64_t now = time_provider_.now_ms();
  std::size_t live = 0;
  for (const auto& [key, entry] : entries_) {
    if (!expired(entry, now)) {
      ++live;
    }
  }
  return live;
}

}  // namespace autotrader
