/**
 * @file task_queue.hpp
 * @brief Fixed-size worker pool executing independent units of work.
 *
 * Design:
 *  - Submission takes one mutex and never waits for a worker, so it is safe
 *    to call from a transport's receive path.
 *  - Two lanes: `run()` work is picked before `put()` work. The outbound
 *    manager's sends use `run()` so replies are not starved by inbound load.
 *  - A task's exception is captured and handed to its completion callback;
 *    it never escapes a worker thread.
 *  - Destruction drains queued tasks, then joins the workers.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "didagent/compat/expected.hpp"

namespace didagent::messaging {

/**
 * @brief Bookkeeping for one submitted task, handed to its completion callback.
 */
struct TaskInfo final {
  std::uint64_t id{0};
  std::string name;
  std::chrono::steady_clock::time_point queued{};
  std::chrono::steady_clock::time_point started{};
  std::chrono::steady_clock::time_point finished{};

  [[nodiscard]] std::chrono::nanoseconds run_time() const noexcept { return finished - started; }
};

using Task     = std::function<void()>;
/// Called on the worker after the task ran; @p error is null on success.
using TaskDone = std::function<void(const TaskInfo& info, std::exception_ptr error)>;

/// Factory errors (setup time only).
enum class TaskQueueError : std::uint8_t {
  NoWorkers = 1 ///< Worker count must not be zero
};

/// Raised when submitting to a queue that has been shut down.
class TaskQueueClosed : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class TaskQueue final {
public:
  /**
   * @brief Factory: validates the worker count and starts the pool.
   * @param workers Number of worker threads (> 0).
   */
  static didagent_detail::expected<std::unique_ptr<TaskQueue>, TaskQueueError>
  with_workers(std::size_t workers);

  /// @brief Start @p workers threads. Assumes a validated count; prefer with_workers().
  explicit TaskQueue(std::size_t workers);
  ~TaskQueue();

  TaskQueue(const TaskQueue&)            = delete;
  TaskQueue& operator=(const TaskQueue&) = delete;

  /// Submit on the priority lane. @return the task id.
  std::uint64_t run(std::string name, Task fn, TaskDone done = {});

  /// Submit on the regular lane. @return the task id.
  std::uint64_t put(std::string name, Task fn, TaskDone done = {});

  /**
   * @brief Wait until nothing is queued or running.
   * @return false if @p timeout elapsed first.
   */
  bool join(std::chrono::milliseconds timeout);

  /// Stop accepting work, finish what is queued, join the workers. Idempotent.
  void shutdown();

  [[nodiscard]] std::size_t   active() const noexcept { return active_.load(std::memory_order_relaxed); }
  [[nodiscard]] std::size_t   pending() const;
  [[nodiscard]] std::uint64_t completed() const noexcept { return completed_.load(std::memory_order_relaxed); }
  [[nodiscard]] std::uint64_t failed() const noexcept { return failed_.load(std::memory_order_relaxed); }
  [[nodiscard]] std::size_t   workers() const noexcept { return threads_.size(); }

private:
  struct Entry {
    TaskInfo info;
    Task fn;
    TaskDone done;
  };

  std::uint64_t submit(bool priority, std::string name, Task fn, TaskDone done);
  void worker_loop();

  mutable std::mutex mu_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<Entry> urgent_;
  std::deque<Entry> regular_;
  bool closing_{false};
  std::once_flag shutdown_once_;

  std::atomic<std::size_t>   active_{0};
  std::atomic<std::uint64_t> next_id_{1};
  std::atomic<std::uint64_t> completed_{0};
  std::atomic<std::uint64_t> failed_{0};

  std::vector<std::thread> threads_;
};

} // namespace didagent::messaging
