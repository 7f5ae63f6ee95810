#pragma once

namespace autotrader {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus: order lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Every state an order can occupy while the engine tracks it.
//
// @details
// The lifecycle is forward-only:
//
//   Pending ──> Filled
//      │
//      ├──────> Failed
//      │
//      └──────> Cancelled
//
// Terminal states: Filled, Failed, Cancelled. The OrderLedger rejects any
// transition out of a terminal state with InvalidStateError, so an observer
// of an order's status history always sees a subsequence of
// Pending, {Filled | Failed | Cancelled}.
//
// Canonical string tokens (state store, event payloads): "pending",
// "filled", "failed", "cancelled".
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,    // Created, not yet executed
  Filled,     // Swap executed (terminal)
  Failed,     // Quote or swap failed (terminal)
  Cancelled,  // Cancelled before execution (terminal)
};

// -----------------------------------------------------------------------------
// OrderKind
// -----------------------------------------------------------------------------
// Tokens: "market", "limit". The engine only submits market orders; limit is
// carried so records written by other tools still decode.
// -----------------------------------------------------------------------------
enum class OrderKind {
  Market,
  Limit,
};

}  // namespace domain
}  // namespace autotrader
