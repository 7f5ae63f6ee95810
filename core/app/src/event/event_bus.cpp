#include "autotrader/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <iostream>
#include <stdexcept>

namespace autotrader {

EventBus::EventBus(const ITimeProvider& time_provider)
    : time_provider_(time_provider) {}

std::size_t EventBus::indexOf(EventType type) {
  if (!isValidEventType(type)) {
    throw std::invalid_argument("event type out of range: " +
                                std::to_string(static_cast<int>(type)));
  }
  return static_cast<std::size_t>(type);
}

// -----------------------------------------------------------------------------
// subscribe(type, handler)
// -----------------------------------------------------------------------------
EventBus::SubscriptionId EventBus::subscribe(EventType type, Handler handler) {
  const std::size_t index = indexOf(type);
  if (!handler) {
    throw std::invalid_argument("EventBus::subscribe: empty handler");
  }

  std::lock_guard lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_[index].emplace_back(id, std::move(handler));
  return id;
}

// -----------------------------------------------------------------------------
// unsubscribe(type, id)
// -----------------------------------------------------------------------------
bool EventBus::unsubscribe(EventType type, SubscriptionId id) {
  const std::size_t index = indexOf(type);

  std::lock_guard lock(mutex_);
  auto& entries = subscribers_[index];
  auto it = std::remove_if(entries.begin(), entries.end(),
                           [id](const SubscriberEntry& e) { return e.first == id; });
  if (it == entries.end()) {
    return false;
  }
  entries.erase(it, entries.end());
  return true;
}

// -----------------------------------------------------------------------------
// emit(type, payload)
// -----------------------------------------------------------------------------
EventBus::EmitResult EventBus::emit(EventType type, nlohmann::json payload) {
  const std::size_t index = indexOf(type);

  if (!payload.is_object()) {
    payload = nlohmann::json{{"data", std::move(payload)}};
  }

  Event event;
  event.type = type;
  event.timestamp = ms_to_timestamp(time_provider_.now_ms());
  payload["timestamp"] = to_iso8601(event.timestamp);
  payload["event_type"] = eventTypeToString(type);
  event.payload = std::move(payload);

  std::vector<SubscriberEntry> copy;
  {
    // Record and snapshot under the lock; handlers run without it so a
    // handler that emits or unsubscribes cannot deadlock.
    std::lock_guard lock(mutex_);
    auto& history = history_[index];
    history.push_back(event);
    while (history.size() > kMaxHistory) {
      history.pop_front();
    }
    copy = subscribers_[index];
  }

  EmitResult result;
  if (copy.empty()) {
    return result;
  }

  std::vector<std::future<void>> tasks;
  tasks.reserve(copy.size());
  for (const auto& entry : copy) {
    const Handler& handler = entry.second;
    tasks.push_back(std::async(std::launch::async,
                               [&handler, &event] { handler(event.payload); }));
  }

  // Join every task before inspecting results so no task outlives `copy` or
  // `event`.
  for (auto& task : tasks) {
    task.wait();
  }

  for (std::size_t i = 0; i < tasks.size(); ++i) {
    try {
      tasks[i].get();
      ++result.delivered;
    } catch (const std::exception& e) {
      ++result.failed;
      std::cerr << "[EventBus] handler " << copy[i].first << " for "
                << eventTypeToString(type) << " failed: " << e.what()
                << std::endl;
    } catch (...) {
      ++result.failed;
      std::cerr << "[EventBus] handler " << copy[i].first << " for "
                << eventTypeToString(type)
                << " failed with a non-standard exception" << std::endl;
    }
  }
  return result;
}

// -----------------------------------------------------------------------------
// getHistory(type, limit)
// -----------------------------------------------------------------------------
std::vector<Event> EventBus::getHistory(EventType type,
                                        std::size_t limit) const {
  const std::size_t index = indexOf(type);

  std::lock_guard lock(mutex_);
  const auto& history = history_[index];
  std::size_t count = history.size();
  if (limit != 0 && limit < count) {
    count = limit;
  }
  return std::vector<Event>(history.end() - static_cast<std::ptrdiff_t>(count),
                            history.end());
}

void EventBus::clearHistory(std::optional<EventType> type) {
  std::lock_guard lock(mutex_);
  if (type) {
    history_[indexOf(*type)].clear();
    return;
  }
  for (auto& history : history_) {
    history.clear();
  }
}

std::size_t EventBus::subscriberCount(EventType type) const {
  const std::size_t index = indexOf(type);
  std::lock_guard lock(mutex_);
  return subscribers_[index].size();
}

}  // namespace autotrader
