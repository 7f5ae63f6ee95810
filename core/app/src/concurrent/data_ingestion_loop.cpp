#include "autotrader/concurrent/data_ingestion_loop.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <stdexcept>

namespace autotrader {

namespace {

// How long the worker waits on an empty queue before re-checking running_.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

DataIngestionLoop::DataIngestionLoop(Handler handler)
    : handler_(std::move(handler)) {
  if (!handler_) {
    throw std::invalid_argument("DataIngestionLoop: empty handler");
  }
}

DataIngestionLoop::~DataIngestionLoop() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void DataIngestionLoop::start() {
  std::lock_guard lifecycle(lifecycle_mutex_);
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
  std::cout << "[DataIngestionLoop] Started" << std::endl;
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
std::size_t DataIngestionLoop::stop() {
  std::lock_guard lifecycle(lifecycle_mutex_);
  if (!thread_.joinable()) {
    return 0;
  }

  running_.store(false);
  wake_cv_.notify_all();
  thread_.join();

  const std::size_t discarded = queue_.clear();
  discarded_.fetch_add(discarded);
  std::cout << "[DataIngestionLoop] Stopped (processed=" << processed_.load()
            << ", failed=" << failed_.load() << ", discarded=" << discarded
            << ")" << std::endl;
  return discarded;
}

// -----------------------------------------------------------------------------
// push(point)
// -----------------------------------------------------------------------------
bool DataIngestionLoop::push(domain::DataPoint point) {
  if (!running_.load()) {
    discarded_.fetch_add(1);
    std::cerr << "[DataIngestionLoop] Not running, dropping "
              << point.data_type << " point for " << point.symbol
              << std::endl;
    return false;
  }
  queue_.push(std::move(point));
  wake_cv_.notify_one();
  return true;
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void DataIngestionLoop::run() {
  while (running_.load()) {
    std::optional<domain::DataPoint> point = queue_.try_pop();

    if (point) {
      try {
        handler_(*point);
        processed_.fetch_add(1);
      } catch (const std::exception& e) {
        failed_.fetch_add(1);
        std::cerr << "[DataIngestionLoop] Error processing " << point->data_type
                  << " point for " << point->symbol << ": " << e.what()
                  << std::endl;
      }
      continue;
    }

    std::unique_lock lock(wake_mutex_);
    wake_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load() || !queue_.empty(); });
  }
}

}  // namespace autotrader
