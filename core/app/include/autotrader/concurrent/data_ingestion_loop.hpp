#pragma once

#include "autotrader/concurrent/thread_safe_queue.hpp"
#include "autotrader/domain/data_point.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>

namespace autotrader {

// -----------------------------------------------------------------------------
// DataIngestionLoop
// -----------------------------------------------------------------------------
// Responsibility: Owns a single worker thread that drains a
// ThreadSafeQueue<DataPoint> strictly in FIFO order and hands each point to
// the handler given at construction, one at a time. Producers (the market
// data gateway, tests) call push() from any thread.
//
// Shutdown: stop() does not drain. The worker finishes the point it is
// currently handling, exits, and anything still queued is discarded and
// counted in discardedCount().
//
// Failure isolation: an exception thrown by the handler is logged to
// std::cerr and counted; the loop moves on to the next point.
//
// Thread model: start(), stop() and push() may be called from any thread.
// The handler always runs on the worker thread.
// -----------------------------------------------------------------------------
class DataIngestionLoop {
 public:
  using Handler = std::function<void(const domain::DataPoint&)>;

  explicit DataIngestionLoop(Handler handler);

  // Stops and joins the worker.
  ~DataIngestionLoop();

  DataIngestionLoop(const DataIngestionLoop&) = delete;
  DataIngestionLoop& operator=(const DataIngestionLoop&) = delete;
  DataIngestionLoop(DataIngestionLoop&&) = delete;
  DataIngestionLoop& operator=(DataIngestionLoop&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // What: Starts the worker thread. Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // What: Signals the worker to exit, joins it, then discards whatever is
  // still queued. Idempotent; start() may be called again afterwards.
  // Output: number of points discarded by this call.
  // -------------------------------------------------------------------------
  std::size_t stop();

  // -------------------------------------------------------------------------
  // push(point)
  // -------------------------------------------------------------------------
  // What: Enqueues one point for the worker. A point pushed while the loop
  // is not running is dropped with a warning.
  // Output: true if the point was queued.
  // -------------------------------------------------------------------------
  bool push(domain::DataPoint point);

  bool isRunning() const { return running_.load(); }

  std::size_t pendingCount() const { return queue_.size(); }
  std::size_t processedCount() const { return processed_.load(); }
  std::size_t failedCount() const { return failed_.load(); }
  std::size_t discardedCount() const { return discarded_.load(); }

 private:
  // Worker loop: try_pop(); handle; else wait_for() a short timeout and
  // re-check running_.
  void run();

  Handler handler_;
  ThreadSafeQueue<domain::DataPoint> queue_;

  std::atomic<bool> running_{false};
  std::atomic<std::size_t> processed_{0};  // Handler returned normally
  std::atomic<std::size_t> failed_{0};     // Handler threw
  std::atomic<std::size_t> discarded_{0};  // Dropped by stop() or push()

  std::mutex lifecycle_mutex_;  // Serializes start()/stop()
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;  // Signalled on push() and stop()
  std::thread thread_;
};

}  // namespace autotrader
