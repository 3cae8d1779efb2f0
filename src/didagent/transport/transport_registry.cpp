/**
 * @file transport_registry.cpp
 */
#include "didagent/transport/transport_registry.hpp"

namespace didagent::transport {

    void TransportRegistry::add_inbound(std::shared_ptr<InboundTransport> t) {
        if (!t) return;
        std::lock_guard<std::mutex> lk(mu_);
        inbound_.push_back(std::move(t));
    }

    void TransportRegistry::add_outbound(std::string name, std::shared_ptr<OutboundTransport> t) {
        if (!t) return;
        std::lock_guard<std::mutex> lk(mu_);
        outbound_.emplace_back(std::move(name), std::move(t));
    }

    std::vector<std::shared_ptr<InboundTransport>> TransportRegistry::inbound() const {
        std::lock_guard<std::mutex> lk(mu_);
        return inbound_;
    }

    std::vector<TransportRegistry::NamedOutbound> TransportRegistry::outbound() const {
        std::lock_guard<std::mutex> lk(mu_);
        return outbound_;
    }

} // namespace didagent::transport
