#include "autotrader/gateway/market_data_gateway.hpp"

#include "autotrader/domain/codec.hpp"
#include "autotrader/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <stdexcept>

namespace autotrader {

// -----------------------------------------------------------------------------
// Constructor: SUB socket subscribed to everything, with a receive timeout so
// run() can observe stop().
// -----------------------------------------------------------------------------
MarketDataGateway::MarketDataGateway(Sink sink, const std::string& endpoint,
                                     SimulationTimeProvider* replay_clock)
    : sink_(std::move(sink)), replay_clock_(replay_clock) {
  if (!sink_) {
    throw std::invalid_argument("MarketDataGateway: empty sink");
  }
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
  std::cout << "[MarketDataGateway] Connected to " << endpoint << std::endl;
}

// -----------------------------------------------------------------------------
// decode
// -----------------------------------------------------------------------------
domain::DataPoint MarketDataGateway::decode(const std::string& payload) {
  try {
    auto json = nlohmann::json::parse(payload);
    domain::DataPoint point = json.get<domain::DataPoint>();
    if (point.data_type.empty() || point.symbol.empty()) {
      throw ValidationError("data_type and symbol must not be empty");
    }
    return point;
  } catch (const nlohmann::json::exception& e) {
    throw ValidationError(std::string("malformed market data: ") + e.what());
  }
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void MarketDataGateway::run() {
  while (!stop_requested_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      // EINTR when a signal lands during recv(); re-check the stop flag.
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }

    if (!result.has_value()) {
      continue;  // Timeout
    }

    std::string payload = msg.to_string();
    try {
      domain::DataPoint point = decode(payload);
      if (replay_clock_ != nullptr) {
        replay_clock_->advance_time(timestamp_to_ms(point.timestamp));
      }
      ++received_;
      sink_(std::move(point));
    } catch (const ValidationError& e) {
      ++rejected_;
      std::cerr << "[MarketDataGateway] Skipping message: " << e.what()
                << " payload: " << payload << std::endl;
    }
  }
  std::cout << "[MarketDataGateway] Stopped (received=" << received_.load()
            << ", rejected=" << rejected_.load() << ")" << std::endl;
}

}  // namespace autotrader
