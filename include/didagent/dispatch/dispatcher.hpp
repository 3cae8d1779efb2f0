#pragma once
/**
 * @file dispatcher.hpp
 * @brief Owns the task queue that processes inbound messages asynchronously.
 */

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "didagent/config/injection_context.hpp"
#include "didagent/messaging/inbound_message.hpp"
#include "didagent/messaging/responder.hpp"
#include "didagent/messaging/task_queue.hpp"
#include "didagent/stats/collector.hpp"

namespace didagent::dispatch {

    /// Raised when the dispatcher cannot be built from its settings.
    class DispatcherError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /** @class MessageHandler
     *  @brief Application protocol logic; bound in the context by the embedding app.
     */
    class MessageHandler {
    public:
        virtual ~MessageHandler() = default;

        /**
         * @brief Process one received message.
         * @param message The message.
         * @param responder Sends replies through the outbound router.
         */
        virtual void handle(const messaging::InboundMessage& message, messaging::BaseResponder& responder) = 0;
    };

    /// Reports the end of processing: (message, task bookkeeping, exception or null).
    using CompletionCallback = std::function<void(const messaging::InboundMessage&,
                                                  const messaging::TaskInfo&,
                                                  std::exception_ptr)>;

    /** @class Dispatcher
     *  @brief Queues inbound messages and exposes the scheduling primitives.
     */
    class Dispatcher {
    public:
        /// Build the worker pool sized by "dispatch.workers".
        explicit Dispatcher(std::shared_ptr<config::InjectionContext> context);
        /// Drains queued work and joins the workers before members go away.
        virtual ~Dispatcher();

        Dispatcher(const Dispatcher&)            = delete;
        Dispatcher& operator=(const Dispatcher&) = delete;

        /**
         * @brief Schedule processing of @p message. Exactly one task per call.
         * @param message Received message; the dispatcher owns it from here.
         * @param responder Router the handler uses to send replies.
         * @param on_complete Invoked on the worker once processing finished.
         * @return Task id.
         */
        virtual std::uint64_t queue_message(messaging::InboundMessage message,
                                            messaging::OutboundRouter responder,
                                            CompletionCallback on_complete);

        /// Run the bound MessageHandler for @p message (executed on a worker).
        virtual void handle_message(const messaging::InboundMessage& message,
                                    const messaging::OutboundRouter& responder);

        /// Schedule work on the priority lane (used by the outbound manager).
        std::uint64_t run_task(std::string name, messaging::Task fn, messaging::TaskDone done = {});

        /// Schedule work on the regular lane (used by the admin server).
        std::uint64_t put_task(std::string name, messaging::Task fn, messaging::TaskDone done = {});

        messaging::TaskQueue&       task_queue() noexcept { return *queue_; }
        const messaging::TaskQueue& task_queue() const noexcept { return *queue_; }

        /// Per-instance slot; "handle_message" is instrumentable.
        stats::Instrumentation& instrumentation() noexcept { return instr_; }

        const std::shared_ptr<config::InjectionContext>& context() const noexcept { return context_; }

    private:
        std::shared_ptr<config::InjectionContext> context_;
        std::unique_ptr<messaging::TaskQueue> queue_;
        stats::Instrumentation instr_{"Dispatcher"};
    };

} // namespace didagent::dispatch
