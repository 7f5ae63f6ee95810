#pragma once

#include <stdexcept>
#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Exception types raised by ledgers, the trading engine, the strategy
//         runtime and the state store.
//
// @details
// All types derive from Error (itself a std::runtime_error), so a caller
// that does not care about the category can catch Error or
// std::exception. Categories:
//
//   ValidationError       malformed arguments, rejected signals, bad
//                         config values.
//   NotFoundError         lookup by id found nothing.
//   InvalidStateError     transition attempted from a terminal or
//                         incompatible state.
//   ExecutionError        the execution client failed a quote or swap.
//   StoreUnavailableError the backing state store cannot be reached.
//
// Propagation policy: ledger and engine operations let these escape to the
// caller. Only the documented best-effort paths (EventBus handler fan-out,
// batched position updates, shutdown close-all, the ingestion loop) catch
// and log them.
// -----------------------------------------------------------------------------
class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ValidationError : public Error {
 public:
  using Error::Error;
};

class NotFoundError : public Error {
 public:
  using Error::Error;
};

class InvalidStateError : public Error {
 public:
  using Error::Error;
};

class ExecutionError : public Error {
 public:
  using Error::Error;
};

class StoreUnavailableError : public Error {
 public:
  using Error::Error;
};

}  // namespace autotrader
