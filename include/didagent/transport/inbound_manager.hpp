#pragma once
/**
 * @file inbound_manager.hpp
 * @brief Owns the listening transports and reports dispatch completion.
 */

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "didagent/config/injection_context.hpp"
#include "didagent/messaging/inbound_message.hpp"
#include "didagent/messaging/responder.hpp"
#include "didagent/messaging/task_queue.hpp"
#include "didagent/transport/transport_registry.hpp"

namespace didagent::transport {

    /// Raised when an inbound transport cannot be registered or started.
    class InboundTransportError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /** @class InboundTransportManager
     *  @brief Starts/stops inbound transports; routes every message to one callback.
     *
     *  Thread-safety: registration happens during setup only; the receive
     *  callback and dispatch_complete may run on any thread.
     */
    class InboundTransportManager {
    public:
        InboundTransportManager(std::shared_ptr<config::InjectionContext> context,
                                messaging::InboundRouter receive);
        virtual ~InboundTransportManager() = default;

        /// Load transports from the context's TransportRegistry (if bound).
        virtual void setup();

        /// Start every transport; the first failure raises InboundTransportError.
        virtual void start();

        /// Stop every transport (best effort; failures are logged).
        virtual void stop();

        /**
         * @brief Processing of @p message finished.
         * @param task Dispatcher bookkeeping for the processing task.
         * @param error Exception raised by processing, or null.
         */
        virtual void dispatch_complete(const messaging::InboundMessage& message,
                                       const messaging::TaskInfo& task,
                                       std::exception_ptr error);

        /// Descriptions of the registered transports, in registration order.
        virtual std::vector<std::string> registered_transports() const;

        /// True if a registered transport of @p transport_type can answer directly.
        virtual bool supports_direct_response(std::string_view transport_type) const;

        void register_transport(std::shared_ptr<InboundTransport> t);

        [[nodiscard]] std::uint64_t completed() const noexcept { return completed_.load(std::memory_order_relaxed); }
        [[nodiscard]] std::uint64_t failed() const noexcept { return failed_.load(std::memory_order_relaxed); }

    protected:
        std::shared_ptr<config::InjectionContext> context_;
        messaging::InboundRouter receive_;

    private:
        mutable std::mutex mu_;
        std::vector<std::shared_ptr<InboundTransport>> transports_;
        std::atomic<std::uint64_t> completed_{0};
        std::atomic<std::uint64_t> failed_{0};
    };

} // namespace didagent::transport
