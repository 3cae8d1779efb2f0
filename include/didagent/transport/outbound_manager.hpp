#pragma once
/**
 * @file outbound_manager.hpp
 * @brief Owns the sending transports and accepts messages for delivery.
 */

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "didagent/config/injection_context.hpp"
#include "didagent/messaging/outbound_message.hpp"
#include "didagent/messaging/task_queue.hpp"
#include "didagent/transport/transport_registry.hpp"

namespace didagent::transport {

    /// No registered transport serves any of the message's target endpoints.
    class OutboundDeliveryError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /// Registration or startup of an outbound transport failed.
    class OutboundTransportError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /// Background scheduler handed in by the dispatcher (fn(name, task, done) -> id).
    using TaskRunner = std::function<std::uint64_t(std::string, messaging::Task, messaging::TaskDone)>;

    /** @class OutboundTransportManager
     *  @brief Picks a transport by endpoint scheme and schedules the send.
     *
     *  Delivery is fire-and-forget: once `deliver` returns, the message belongs
     *  to a scheduled send task. A failing send is logged and counted, never
     *  retried.
     */
    class OutboundTransportManager {
    public:
        OutboundTransportManager(std::shared_ptr<config::InjectionContext> context, TaskRunner run_task);
        virtual ~OutboundTransportManager() = default;

        /// Load transports from the context's TransportRegistry (if bound).
        virtual void setup();

        /// Start every transport; the first failure raises OutboundTransportError.
        virtual void start();

        /// Stop every transport (best effort; failures are logged).
        virtual void stop();

        /**
         * @brief Accept @p message for sending.
         * @throws OutboundDeliveryError when no target endpoint has a transport.
         */
        virtual void deliver(config::InjectionContext& context, messaging::OutboundMessage message);

        /// Transport name -> URL schemes served.
        virtual std::map<std::string, std::vector<std::string>> registered_transports() const;

        /// Register @p t under @p name; rejects duplicates and scheme-less transports.
        void register_transport(std::string name, std::shared_ptr<OutboundTransport> t);

        /// Transport serving @p endpoint's scheme, or null.
        std::shared_ptr<OutboundTransport> transport_for(std::string_view endpoint) const;

        /// Lower-cased scheme of a URL ("HTTP://a" -> "http"); empty when none.
        static std::string scheme_of(std::string_view endpoint);

        [[nodiscard]] std::uint64_t queued() const noexcept { return queued_.load(std::memory_order_relaxed); }
        [[nodiscard]] std::uint64_t sent() const noexcept { return sent_.load(std::memory_order_relaxed); }
        [[nodiscard]] std::uint64_t failed() const noexcept { return failed_.load(std::memory_order_relaxed); }

    protected:
        std::shared_ptr<config::InjectionContext> context_;
        TaskRunner run_task_;

    private:
        struct Registered {
            std::string name;
            std::shared_ptr<OutboundTransport> transport;
            std::vector<std::string> schemes;
        };

        mutable std::mutex mu_;
        std::vector<Registered> transports_;
        std::atomic<std::uint64_t> queued_{0};
        std::atomic<std::uint64_t> sent_{0};
        std::atomic<std::uint64_t> failed_{0};
    };

} // namespace didagent::transport
