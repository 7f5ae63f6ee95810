#pragma once

#include "autotrader/domain/data_point.hpp"
#include "autotrader/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// MarketDataGateway: ZeroMQ SUB bridge from an external feeder
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON-encoded DataPoints on a ZMQ SUB socket and hands
//         each decoded point to a sink (normally TradingSystem's ingestion
//         queue).
//
// @details
// Wire format, one message per point:
//
//   {"data_type": "candle", "symbol": "SOL-USDC", "timestamp_ms": 1700000000000,
//    "value": {"open": 101.2, "high": 101.9, "low": 100.8, "close": 101.5,
//              "volume": 2500000},
//    "metadata": {"source": "feeder"}}
//
// "timestamp" as an ISO-8601 string is accepted in place of "timestamp_ms".
// Malformed messages are logged to std::cerr, counted, and skipped.
//
// Replay mode: when constructed with a SimulationTimeProvider, the clock is
// advanced to each point's timestamp before the point reaches the sink, so
// every record stamped while handling it carries market time.
//
// Thread model: run() blocks the calling thread until stop() is called from
// another thread (or a signal handler). The receive timeout bounds how long
// stop() takes to be observed.
// -----------------------------------------------------------------------------
class MarketDataGateway {
 public:
  using Sink = std::function<void(domain::DataPoint)>;

  MarketDataGateway(Sink sink, const std::string& endpoint,
                    SimulationTimeProvider* replay_clock = nullptr);

  ~MarketDataGateway() = default;

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;
  MarketDataGateway(MarketDataGateway&&) = delete;
  MarketDataGateway& operator=(MarketDataGateway&&) = delete;

  // Blocking receive loop.
  void run();

  // Asks run() to return. Safe from any thread and from a signal handler.
  void stop() { stop_requested_.store(true); }

  std::size_t receivedCount() const { return received_.load(); }
  std::size_t rejectedCount() const { return rejected_.load(); }

  // -------------------------------------------------------------------------
  // decode(payload)
  // -------------------------------------------------------------------------
  // @brief  Parses one wire message into a DataPoint.
  // @throws ValidationError for invalid JSON or a missing/mistyped field.
  // -------------------------------------------------------------------------
  static domain::DataPoint decode(const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  Sink sink_;
  SimulationTimeProvider* replay_clock_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> stop_requested_{false};
  std::atomic<std::size_t> received_{0};
  std::atomic<std::size_t> rejected_{0};
};

}  // namespace autotrader
