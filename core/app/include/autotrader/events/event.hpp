#pragma once

#include "autotrader/events/event_types.hpp"
#include "autotrader/time/time_utils.hpp"

#include <nlohmann/json.hpp>

namespace autotrader {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// One emitted notification as recorded in the EventBus history and handed to
// subscribers. `payload` is the emitter's JSON object after the bus has
// stamped it with "timestamp" (ISO-8601) and "event_type" (token).
// -----------------------------------------------------------------------------
struct Event {
  EventType type{EventType::SystemStatus};
  nlohmann::json payload = nlohmann::json::object();
  Timestamp timestamp{};
};

}  // namespace autotrader
