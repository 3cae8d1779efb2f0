/**
 * @file dispatcher.cpp
 * @brief Dispatcher: message tasks on the shared TaskQueue.
 */
#include "didagent/dispatch/dispatcher.hpp"

#include <spdlog/spdlog.h>

#include "didagent/config/constants.hpp"

namespace didagent::dispatch {

    using namespace didagent::config::constants;

    Dispatcher::Dispatcher(std::shared_ptr<config::InjectionContext> context)
        : context_(std::move(context)) {
        if (!context_) throw DispatcherError("Dispatcher requires a context");

        const auto workers = context_->settings().get_int_or(
            KEY_DISPATCH_WORKERS, static_cast<std::int64_t>(DISPATCH_WORKERS_DEFAULT));
        auto q = messaging::TaskQueue::with_workers(workers > 0 ? static_cast<std::size_t>(workers) : 0);
        if (!q) {
            throw DispatcherError("Invalid dispatch.workers: " + std::to_string(workers));
        }
        queue_ = std::move(*q);
        spdlog::debug("Dispatcher started with {} workers", queue_->workers());
    }

    Dispatcher::~Dispatcher() {
        if (queue_) queue_->shutdown();
    }

    std::uint64_t Dispatcher::queue_message(messaging::InboundMessage message,
                                            messaging::OutboundRouter responder,
                                            CompletionCallback on_complete) {
        auto msg = std::make_shared<const messaging::InboundMessage>(std::move(message));
        const auto name = "dispatch:" + (msg->receipt.transport_type.empty() ? std::string("inbound")
                                                                           : msg->receipt.transport_type);
        return queue_->put(
            name,
            [this, msg, responder = std::move(responder)] { handle_message(*msg, responder); },
            [msg, cb = std::move(on_complete)](const messaging::TaskInfo& info, std::exception_ptr error) {
                if (cb) cb(*msg, info, error);
            });
    }

    void Dispatcher::handle_message(const messaging::InboundMessage& message,
                                    const messaging::OutboundRouter& responder) {
        auto timer = instr_.time("handle_message");

        auto handler = context_->inject<MessageHandler>(/*required=*/false);
        if (!handler) {
            spdlog::debug("No message handler bound; discarding {} byte message from {}",
                          message.payload.size(), message.receipt.transport_type);
            return;
        }
        messaging::RouterResponder reply(context_, responder, message);
        handler->handle(message, reply);
    }

    std::uint64_t Dispatcher::run_task(std::string name, messaging::Task fn, messaging::TaskDone done) {
        return queue_->run(std::move(name), std::move(fn), std::move(done));
    }

    std::uint64_t Dispatcher::put_task(std::string name, messaging::Task fn, messaging::TaskDone done) {
        return queue_->put(std::move(name), std::move(fn), std::move(done));
    }

} // namespace didagent::dispatch
