#pragma once
/**
 * @file transport_registry.hpp
 * @brief Transport interfaces and the registry the managers load them from.
 * @details Wire implementations (HTTP, WebSocket, ...) live with the embedding
 *          application; it binds a TransportRegistry in the context before
 *          the conductor runs setup.
 */

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "didagent/messaging/outbound_message.hpp"
#include "didagent/messaging/responder.hpp"

namespace didagent::transport {

    /** @class InboundTransport
     *  @brief A listener that turns network input into InboundMessages.
     */
    class InboundTransport {
    public:
        virtual ~InboundTransport() = default;

        /// Transport type reported in receipts, e.g. "http".
        virtual std::string scheme() const = 0;

        /// Banner description, e.g. "http://0.0.0.0:8020".
        virtual std::string describe() const { return scheme(); }

        /// Whether replies can travel back over the receiving connection.
        virtual bool supports_direct_response() const noexcept { return false; }

        /// Begin listening; every message is handed to @p receive synchronously.
        virtual void start(messaging::InboundRouter receive) = 0;

        virtual void stop() = 0;
    };

    /** @class OutboundTransport
     *  @brief A sender for one or more URL schemes.
     */
    class OutboundTransport {
    public:
        virtual ~OutboundTransport() = default;

        /// URL schemes served, e.g. {"http", "https"}.
        virtual std::vector<std::string> schemes() const = 0;

        virtual void start() {}
        virtual void stop() {}

        /// Transmit @p message to @p target. Runs on a dispatcher worker; may throw.
        virtual void send(const messaging::OutboundMessage& message,
                          const messaging::ConnectionTarget& target) = 0;
    };

    /** @class TransportRegistry
     *  @brief Transports configured for this agent, by direction.
     */
    class TransportRegistry {
    public:
        using NamedOutbound = std::pair<std::string, std::shared_ptr<OutboundTransport>>;

        void add_inbound(std::shared_ptr<InboundTransport> t);
        void add_outbound(std::string name, std::shared_ptr<OutboundTransport> t);

        std::vector<std::shared_ptr<InboundTransport>> inbound() const;
        std::vector<NamedOutbound> outbound() const;

    private:
        mutable std::mutex mu_;
        std::vector<std::shared_ptr<InboundTransport>> inbound_;
        std::vector<NamedOutbound> outbound_;
    };

} // namespace didagent::transport
