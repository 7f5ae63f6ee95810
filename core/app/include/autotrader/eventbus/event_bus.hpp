#pragma once

#include "autotrader/events/event.hpp"
#include "autotrader/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace autotrader {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Central publish-subscribe channel keyed by EventType.
// Components emit JSON payloads; every handler subscribed to that type is
// invoked, and the stamped payload is appended to a bounded per-type
// history.
//
// Thread model: Thread-safe for concurrent subscribe, unsubscribe, emit and
// history access from any thread. Handlers of one emit run concurrently,
// one std::async task each; emit() joins all of them before returning. No
// ordering is guaranteed between handlers of the same emit.
//
// Failure isolation: a handler that throws is logged to std::cerr and
// counted in EmitResult::failed. It never propagates to the emitter and
// never prevents the other handlers from running.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  // Handlers receive the stamped payload.
  using Handler = std::function<void(const nlohmann::json&)>;

  // Opaque id returned by subscribe(); pass to unsubscribe() to remove.
  using SubscriptionId = std::size_t;

  // Per-type history capacity. The oldest entry is evicted first.
  static constexpr std::size_t kMaxHistory = 1000;

  // Default number of entries returned by getHistory().
  static constexpr std::size_t kDefaultHistoryLimit = 100;

  // Outcome of one emit(): how many handlers returned normally and how many
  // threw.
  struct EmitResult {
    std::size_t delivered{0};
    std::size_t failed{0};
  };

  explicit EventBus(const ITimeProvider& time_provider);

  // Non-copyable: the bus owns subscriber state and history.
  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(type, handler)
  // -------------------------------------------------------------------------
  // What: Registers `handler` for every future emit of `type`.
  // Thread-safety: Safe from any thread. A subscription added while an emit
  // is in flight may miss that emit.
  // Output: SubscriptionId to use with unsubscribe().
  // Throws: std::invalid_argument if `type` is outside the enumeration or
  // `handler` is empty.
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(EventType type, Handler handler);

  // -------------------------------------------------------------------------
  // unsubscribe(type, id)
  // -------------------------------------------------------------------------
  // What: Removes the subscription. Returns false if no such subscription
  // was registered for `type`. A handler already dispatched by an in-flight
  // emit still completes.
  // -------------------------------------------------------------------------
  bool unsubscribe(EventType type, SubscriptionId id);

  // -------------------------------------------------------------------------
  // emit(type, payload)
  // -------------------------------------------------------------------------
  // What: Stamps `payload` with "timestamp" and "event_type", appends it to
  // the history of `type`, then dispatches it to the current subscribers.
  // A non-object payload is wrapped as {"data": payload}.
  // Output: per-handler delivery counts.
  // -------------------------------------------------------------------------
  EmitResult emit(EventType type, nlohmann::json payload = nlohmann::json::object());

  // -------------------------------------------------------------------------
  // getHistory(type, limit)
  // -------------------------------------------------------------------------
  // What: Returns the most recent `limit` events of `type`, oldest first.
  // limit == 0 returns the whole retained history.
  // -------------------------------------------------------------------------
  std::vector<Event> getHistory(EventType type,
                                std::size_t limit = kDefaultHistoryLimit) const;

  // Clears the history of one type, or of every type when `type` is empty.
  void clearHistory(std::optional<EventType> type = std::nullopt);

  // Number of handlers currently registered for `type`.
  std::size_t subscriberCount(EventType type) const;

 private:
  // One entry: id (for unsubscribe) and the handler to invoke.
  using SubscriberEntry = std::pair<SubscriptionId, Handler>;

  static std::size_t indexOf(EventType type);

  const ITimeProvider& time_provider_;

  mutable std::mutex mutex_;      // Protects everything below
  SubscriptionId next_id_{0};     // Monotonically increasing id for new subs
  std::array<std::vector<SubscriberEntry>, kEventTypeCount> subscribers_;
  std::array<std::deque<Event>, kEventTypeCount> history_;
};

}  // namespace autotrader
