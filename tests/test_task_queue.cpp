/**
 * @file test_task_queue.cpp
 * @brief Worker pool and dispatcher scheduling.
 *
 * Validates:
 *  - Factory rejects a zero worker count
 *  - Every submitted task runs once and reports completion
 *  - Task exceptions reach the completion callback, never the worker
 *  - Exceptions thrown by completion callbacks are contained
 *  - Priority lane is served before the regular lane
 *  - shutdown() drains queued work and rejects new work
 *  - Dispatcher: one task per queue_message, handler receives the message
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "didagent/config/injection_context.hpp"
#include "didagent/dispatch/dispatcher.hpp"
#include "didagent/messaging/task_queue.hpp"
#include "didagent/stats/collector.hpp"

using namespace std::chrono_literals;
using namespace didagent;
using messaging::TaskInfo;
using messaging::TaskQueue;

namespace {

/// One-shot gate that tests use to hold a worker.
class Gate {
public:
  void open() {
    std::lock_guard<std::mutex> lk(mu_);
    open_ = true;
    cv_.notify_all();
  }
  void wait() {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [&] { return open_; });
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool open_{false};
};

} // namespace

// ------------------------------- TaskQueue ---------------------------------

/**
 * @test TaskQueue_Factory_Validation
 */
TEST(TaskQueue, TaskQueue_Factory_Validation) {
  auto bad = TaskQueue::with_workers(0);
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error(), messaging::TaskQueueError::NoWorkers);

  auto ok = TaskQueue::with_workers(2);
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ((*ok)->workers(), 2u);
}

/**
 * @test TaskQueue_Runs_All
 * @brief N tasks across both lanes all run and complete exactly once.
 */
TEST(TaskQueue, TaskQueue_Runs_All) {
  auto q = std::move(*TaskQueue::with_workers(4));
  std::atomic<int> ran{0};
  std::atomic<int> done{0};

  constexpr int N = 200;
  for (int i = 0; i < N; ++i) {
    auto fn = [&] { ran.fetch_add(1); };
    auto cb = [&](const TaskInfo&, std::exception_ptr e) {
      if (!e) done.fetch_add(1);
    };
    if (i % 2) q->run("r", fn, cb);
    else q->put("p", fn, cb);
  }

  ASSERT_TRUE(q->join(5s));
  EXPECT_EQ(ran.load(), N);
  EXPECT_EQ(done.load(), N);
  EXPECT_EQ(q->completed(), static_cast<std::uint64_t>(N));
  EXPECT_EQ(q->failed(), 0u);
}

/**
 * @test TaskQueue_Exception_To_Callback
 * @brief A throwing task is counted failed and its exception is delivered.
 */
TEST(TaskQueue, TaskQueue_Exception_To_Callback) {
  auto q = std::move(*TaskQueue::with_workers(1));
  std::string what;
  std::string name;

  q->put("boom", [] { throw std::runtime_error("handler failed"); },
         [&](const TaskInfo& info, std::exception_ptr e) {
           name = info.name;
           try {
             if (e) std::rethrow_exception(e);
           } catch (const std::exception& ex) {
             what = ex.what();
           }
         });
  // Failing task without a callback must not take the worker down.
  q->put("boom2", [] { throw std::runtime_error("ignored"); });

  std::atomic<bool> after{false};
  q->put("after", [&] { after = true; });

  ASSERT_TRUE(q->join(5s));
  EXPECT_EQ(name, "boom");
  EXPECT_EQ(what, "handler failed");
  EXPECT_EQ(q->failed(), 2u);
  EXPECT_TRUE(after.load());
}

/**
 * @test TaskQueue_Callback_Exception_Contained
 * @brief Completion callbacks throwing anything, standard or not, leave the worker alive.
 */
TEST(TaskQueue, TaskQueue_Callback_Exception_Contained) {
  auto q = std::move(*TaskQueue::with_workers(1));
  q->put("std", [] {}, [](const TaskInfo&, std::exception_ptr) { throw std::logic_error("callback bug"); });
  q->put("int", [] {}, [](const TaskInfo&, std::exception_ptr) { throw 7; });

  std::atomic<bool> after{false};
  q->put("after", [&] { after = true; });

  ASSERT_TRUE(q->join(5s));
  EXPECT_TRUE(after.load());
  EXPECT_EQ(q->completed(), 3u);
  EXPECT_EQ(q->failed(), 0u);
}

/**
 * @test TaskQueue_Priority_Lane_First
 * @brief With the only worker blocked, queued run() work overtakes put() work.
 */
TEST(TaskQueue, TaskQueue_Priority_Lane_First) {
  auto q = std::move(*TaskQueue::with_workers(1));
  Gate gate;
  std::mutex mu;
  std::vector<std::string> order;
  auto note = [&](std::string s) {
    std::lock_guard<std::mutex> lk(mu);
    order.push_back(std::move(s));
  };

  q->put("blocker", [&] { gate.wait(); });
  // Wait until the worker holds the blocker.
  for (int i = 0; i < 500 && q->active() == 0; ++i) std::this_thread::sleep_for(1ms);
  ASSERT_EQ(q->active(), 1u);

  q->put("regular", [&] { note("regular"); });
  q->run("urgent", [&] { note("urgent"); });
  EXPECT_EQ(q->pending(), 2u);

  gate.open();
  ASSERT_TRUE(q->join(5s));
  ASSERT_EQ(order.size(), 2u);
  EXPECT_EQ(order[0], "urgent");
  EXPECT_EQ(order[1], "regular");
}

/**
 * @test TaskQueue_Shutdown_Drains_And_Closes
 */
TEST(TaskQueue, TaskQueue_Shutdown_Drains_And_Closes) {
  auto q = std::move(*TaskQueue::with_workers(2));
  std::atomic<int> ran{0};
  for (int i = 0; i < 50; ++i) q->put("t", [&] { ran.fetch_add(1); });

  q->shutdown();
  EXPECT_EQ(ran.load(), 50);
  EXPECT_THROW(q->put("late", [] {}), messaging::TaskQueueClosed);
  q->shutdown(); // idempotent
}

/**
 * @test TaskQueue_Ids_Unique
 */
TEST(TaskQueue, TaskQueue_Ids_Unique) {
  auto q = std::move(*TaskQueue::with_workers(1));
  const auto a = q->put("a", [] {});
  const auto b = q->run("b", [] {});
  EXPECT_NE(a, b);
  ASSERT_TRUE(q->join(5s));
}

// ------------------------------- Dispatcher --------------------------------

namespace {

struct EchoHandler : dispatch::MessageHandler {
  std::atomic<int> calls{0};
  void handle(const messaging::InboundMessage& message, messaging::BaseResponder& responder) override {
    calls.fetch_add(1);
    messaging::OutboundMessage reply;
    reply.payload = "echo:" + message.payload;
    (void)responder.send_outbound(std::move(reply));
  }
};

std::shared_ptr<config::InjectionContext> make_context(std::int64_t workers = 2) {
  return std::make_shared<config::InjectionContext>(
    config::Settings{{"dispatch.workers", workers}});
}

} // namespace

/**
 * @test Dispatcher_Invalid_Workers
 */
TEST(Dispatcher, Dispatcher_Invalid_Workers) {
  EXPECT_THROW(dispatch::Dispatcher d(make_context(0)), dispatch::DispatcherError);
  EXPECT_THROW(dispatch::Dispatcher d(nullptr), dispatch::DispatcherError);
}

/**
 * @test Dispatcher_Queue_Message_Runs_Handler
 * @brief Handler sees the payload, replies through the router with the
 *        originating message attached, and completion fires once.
 */
TEST(Dispatcher, Dispatcher_Queue_Message_Runs_Handler) {
  auto ctx = make_context();
  auto handler = std::make_shared<EchoHandler>();
  ctx->injector().bind_instance<dispatch::MessageHandler>(handler);
  dispatch::Dispatcher d(ctx);

  std::mutex mu;
  std::vector<std::string> replies;
  std::string origin_payload;
  messaging::OutboundRouter router = [&](config::InjectionContext&, messaging::OutboundMessage out,
                                         const messaging::InboundMessage* origin) {
    std::lock_guard<std::mutex> lk(mu);
    replies.push_back(out.payload);
    if (origin) origin_payload = origin->payload;
    return messaging::OutboundStatus::Queued;
  };

  std::atomic<int> completions{0};
  messaging::InboundMessage m;
  m.payload = "ping";
  m.receipt.transport_type = "http";
  d.queue_message(m, router, [&](const messaging::InboundMessage& msg, const TaskInfo&, std::exception_ptr e) {
    EXPECT_EQ(msg.payload, "ping");
    EXPECT_TRUE(e == nullptr);
    completions.fetch_add(1);
  });

  ASSERT_TRUE(d.task_queue().join(5s));
  EXPECT_EQ(handler->calls.load(), 1);
  EXPECT_EQ(completions.load(), 1);
  ASSERT_EQ(replies.size(), 1u);
  EXPECT_EQ(replies[0], "echo:ping");
  EXPECT_EQ(origin_payload, "ping");
}

/**
 * @test Dispatcher_Handler_Exception_Reported
 */
TEST(Dispatcher, Dispatcher_Handler_Exception_Reported) {
  struct Throwing : dispatch::MessageHandler {
    void handle(const messaging::InboundMessage&, messaging::BaseResponder&) override {
      throw std::runtime_error("bad message");
    }
  };
  auto ctx = make_context();
  ctx->injector().bind_instance<dispatch::MessageHandler>(std::make_shared<Throwing>());
  dispatch::Dispatcher d(ctx);

  std::atomic<bool> got_error{false};
  d.queue_message(messaging::InboundMessage{}, [](auto&, auto, auto) { return messaging::OutboundStatus::Queued; },
                  [&](const messaging::InboundMessage&, const TaskInfo&, std::exception_ptr e) {
                    got_error = static_cast<bool>(e);
                  });

  ASSERT_TRUE(d.task_queue().join(5s));
  EXPECT_TRUE(got_error.load());
}

/**
 * @test Dispatcher_Handle_Message_Instrumented
 * @brief With a collector attached, each handled message is counted once.
 */
TEST(Dispatcher, Dispatcher_Handle_Message_Instrumented) {
  auto ctx = make_context();
  dispatch::Dispatcher d(ctx);
  auto collector = std::make_shared<stats::Collector>();
  collector->wrap(d.instrumentation(), {"handle_message"});

  for (int i = 0; i < 3; ++i) {
    d.queue_message(messaging::InboundMessage{}, [](auto&, auto, auto) { return messaging::OutboundStatus::Queued; },
                    {});
  }
  ASSERT_TRUE(d.task_queue().join(5s));
  EXPECT_EQ(collector->stats_for("Dispatcher.handle_message").count, 3u);
}
