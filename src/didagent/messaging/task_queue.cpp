/**
 * @file task_queue.cpp
 * @brief Condition-variable worker pool.
 */
#include "didagent/messaging/task_queue.hpp"

#include <spdlog/spdlog.h>

namespace didagent::messaging {

didagent_detail::expected<std::unique_ptr<TaskQueue>, TaskQueueError>
TaskQueue::with_workers(std::size_t workers) {
  if (workers == 0) {
    return didagent_detail::unexpected(TaskQueueError::NoWorkers);
  }
  return std::make_unique<TaskQueue>(workers);
}

TaskQueue::TaskQueue(std::size_t workers) {
  threads_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads_.emplace_back([this] { worker_loop(); });
  }
}

TaskQueue::~TaskQueue() {
  shutdown();
}

std::uint64_t TaskQueue::run(std::string name, Task fn, TaskDone done) {
  return submit(true, std::move(name), std::move(fn), std::move(done));
}

std::uint64_t TaskQueue::put(std::string name, Task fn, TaskDone done) {
  return submit(false, std::move(name), std::move(fn), std::move(done));
}

std::uint64_t TaskQueue::submit(bool priority, std::string name, Task fn, TaskDone done) {
  Entry e;
  e.info.id = next_id_.fetch_add(1, std::memory_order_relaxed);
  e.info.name = std::move(name);
  e.info.queued = std::chrono::steady_clock::now();
  e.fn = std::move(fn);
  e.done = std::move(done);
  const auto id = e.info.id;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (closing_) {
      throw TaskQueueClosed("task queue is shut down; rejected task " + e.info.name);
    }
    (priority ? urgent_ : regular_).push_back(std::move(e));
  }
  work_cv_.notify_one();
  return id;
}

std::size_t TaskQueue::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return urgent_.size() + regular_.size();
}

bool TaskQueue::join(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  return idle_cv_.wait_for(lk, timeout, [this] {
    return urgent_.empty() && regular_.empty() && active_.load(std::memory_order_relaxed) == 0;
  });
}

void TaskQueue::shutdown() {
  std::call_once(shutdown_once_, [this] {
    {
      std::lock_guard<std::mutex> lk(mu_);
      closing_ = true;
    }
    work_cv_.notify_all();
    for (auto& t : threads_) {
      if (t.joinable()) t.join();
    }
  });
}

void TaskQueue::worker_loop() {
  for (;;) {
    Entry e;
    {
      std::unique_lock<std::mutex> lk(mu_);
      work_cv_.wait(lk, [this] { return closing_ || !urgent_.empty() || !regular_.empty(); });
      if (urgent_.empty() && regular_.empty()) return; // closing and drained
      auto& lane = urgent_.empty() ? regular_ : urgent_;
      e = std::move(lane.front());
      lane.pop_front();
      active_.fetch_add(1, std::memory_order_relaxed);
    }

    std::exception_ptr error;
    e.info.started = std::chrono::steady_clock::now();
    try {
      if (e.fn) e.fn();
    } catch (...) {
      error = std::current_exception();
    }
    e.info.finished = std::chrono::steady_clock::now();

    if (error) failed_.fetch_add(1, std::memory_order_relaxed);
    if (e.done) {
      try {
        e.done(e.info, error);
      } catch (const std::exception& ex) {
        spdlog::error("Completion callback for task {} ({}) threw: {}", e.info.id, e.info.name, ex.what());
      } catch (...) {
        spdlog::error("Completion callback for task {} ({}) threw a non-standard exception", e.info.id,
                      e.info.name);
      }
    } else if (error) {
      try {
        std::rethrow_exception(error);
      } catch (const std::exception& ex) {
        spdlog::error("Task {} ({}) failed: {}", e.info.id, e.info.name, ex.what());
      } catch (...) {
        spdlog::error("Task {} ({}) failed with a non-standard exception", e.info.id, e.info.name);
      }
    }
    completed_.fetch_add(1, std::memory_order_relaxed);

    {
      std::lock_guard<std::mutex> lk(mu_);
      active_.fetch_sub(1, std::memory_order_relaxed);
    }
    idle_cv_.notify_all();
  }
}

} // namespace didagent::messaging
