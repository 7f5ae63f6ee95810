// -----------------------------------------------------------------------------
// autotrader: single executable entry point.
//
// Usage:
//   autotrader [config.json] [--replay]
//
//   1) Load the EngineConfig (defaults when no path is given).
//   2) Pick the clock: wall-clock time for live paper trading, or a
//      SimulationTimeProvider driven by the feed's timestamps (--replay).
//   3) Build the InMemoryStateStore, the MockExecutionClient and the
//      TradingSystem, then start the system (starts configured strategies).
//   4) Subscribe logging callbacks for fills, position changes and errors.
//   5) Run the MarketDataGateway receive loop on the main thread. Each point
//      is queued into the system's ingestion loop, which updates the mock
//      market price for its symbol when it processes the point.
//   6) On Ctrl-C: stop the gateway, then stop the system (closes every open
//      position) and print the final status.
//
// Thread layout:
//   main thread       → MarketDataGateway::run() (ZMQ recv loop)
//   ingestion thread  → strategies, order execution, position marking
//   event bus tasks   → subscriber callbacks (one async task per handler)
// -----------------------------------------------------------------------------

#include "autotrader/config/engine_config.hpp"
#include "autotrader/domain/errors.hpp"
#include "autotrader/engine/trading_system.hpp"
#include "autotrader/execution/mock_execution_client.hpp"
#include "autotrader/gateway/market_data_gateway.hpp"
#include "autotrader/store/in_memory_state_store.hpp"
#include "autotrader/time/live_time_provider.hpp"
#include "autotrader/time/simulation_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

// Set once before the handler is installed; lets SIGINT unblock run().
static autotrader::MarketDataGateway* g_gateway_ptr = nullptr;

static void sigint_handler(int /*signum*/) {
  if (g_gateway_ptr != nullptr) {
    g_gateway_ptr->stop();
  }
}

int main(int argc, char** argv) {
  std::string config_path;
  bool replay = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--replay") {
      replay = true;
    } else if (arg == "-h" || arg == "--help") {
      std::cout << "usage: " << argv[0] << " [config.json] [--replay]\n";
      return 0;
    } else {
      config_path = arg;
    }
  }

  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  autotrader::EngineConfig config;
  try {
    config = config_path.empty() ? autotrader::parseEngineConfig(
                                       nlohmann::json::object())
                                 : autotrader::loadEngineConfig(config_path);
  } catch (const autotrader::Error& e) {
    std::cerr << "[main] Invalid configuration: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Clock.
  // -------------------------------------------------------------------------
  autotrader::LiveTimeProvider live_clock;
  autotrader::SimulationTimeProvider replay_clock;
  const autotrader::ITimeProvider& clock =
      replay ? static_cast<const autotrader::ITimeProvider&>(replay_clock)
             : static_cast<const autotrader::ITimeProvider&>(live_clock);

  // -------------------------------------------------------------------------
  // 3) Store, execution client and system.
  // -------------------------------------------------------------------------
  autotrader::InMemoryStateStore store(clock);
  std::unique_ptr<autotrader::MockExecutionClient> execution;
  try {
    execution = std::make_unique<autotrader::MockExecutionClient>(
        config.execution.fee_rate);
  } catch (const autotrader::Error& e) {
    std::cerr << "[main] Invalid execution settings: " << e.what() << "\n";
    return 1;
  }

  autotrader::TradingSystem system(store, *execution, clock, config);

  // -------------------------------------------------------------------------
  // 4) Logging subscribers. They run on event bus tasks.
  // -------------------------------------------------------------------------
  auto& bus = system.eventBus();
  bus.subscribe(autotrader::EventType::TradeExecuted,
                [](const nlohmann::json& e) {
                  std::cout << "[TradeExecuted] " << e.value("side", "")
                            << " " << e.value("size", 0.0) << " "
                            << e.value("symbol", "") << " @ "
                            << e.value("price", 0.0) << "\n";
                });
  bus.subscribe(autotrader::EventType::PositionClosed,
                [](const nlohmann::json& e) {
                  std::cout << "[PositionClosed] " << e.value("position_id", "")
                            << " realized_pnl=" << e.value("realized_pnl", 0.0)
                            << "\n";
                });
  bus.subscribe(autotrader::EventType::SystemError,
                [](const nlohmann::json& e) {
                  std::cerr << "[SystemError] " << e.dump() << "\n";
                });

  system.start();

  // -------------------------------------------------------------------------
  // 5) Gateway. The sink only queues the point; it never runs strategies
  //    on the gateway thread. The mock venue's price follows the point the
  //    ingestion worker is processing, not the newest one received.
  // -------------------------------------------------------------------------
  system.setMarkPriceListener(
      [&execution](const std::string& symbol, double price) {
        execution->setMarketPrice(symbol, price);
      });

  autotrader::MarketDataGateway gateway(
      [&system](autotrader::domain::DataPoint point) {
        system.processMarketData(std::move(point));
      },
      config.gateway.endpoint, replay ? &replay_clock : nullptr);

  g_gateway_ptr = &gateway;
  std::signal(SIGINT, sigint_handler);

  std::cout << "[main] MarketDataGateway listening on "
            << config.gateway.endpoint << (replay ? " (replay)" : "") << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  gateway.run();

  // -------------------------------------------------------------------------
  // 6) Shutdown.
  // -------------------------------------------------------------------------
  std::cout << "[main] Gateway exited after " << gateway.receivedCount()
            << " messages (" << gateway.rejectedCount()
            << " rejected). Stopping system...\n";
  const autotrader::BatchResult closed = system.stop();
  g_gateway_ptr = nullptr;

  std::cout << "[main] Closed " << closed.succeeded.size()
            << " positions, " << closed.failed.size() << " failed\n"
            << system.getSystemStatus().dump(2) << "\n";
  return closed.failed.empty() ? 0 : 2;
}
