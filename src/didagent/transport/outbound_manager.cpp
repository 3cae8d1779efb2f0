/**
 * @file outbound_manager.cpp
 * @brief OutboundTransportManager implementation.
 */
#include "didagent/transport/outbound_manager.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

namespace didagent::transport {

    OutboundTransportManager::OutboundTransportManager(std::shared_ptr<config::InjectionContext> context,
                                                       TaskRunner run_task)
        : context_(std::move(context)), run_task_(std::move(run_task)) {
        if (!run_task_) throw OutboundTransportError("Outbound transport manager requires a task runner");
    }

    std::string OutboundTransportManager::scheme_of(std::string_view endpoint) {
        const auto pos = endpoint.find("://");
        if (pos == std::string_view::npos || pos == 0) return {};
        std::string s(endpoint.substr(0, pos));
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    void OutboundTransportManager::setup() {
        auto registry = context_ ? context_->inject<TransportRegistry>(/*required=*/false) : nullptr;
        if (!registry) {
            spdlog::debug("No transport registry bound; no outbound transports configured");
            return;
        }
        for (auto& [name, t] : registry->outbound()) register_transport(name, t);
    }

    void OutboundTransportManager::register_transport(std::string name, std::shared_ptr<OutboundTransport> t) {
        if (!t) throw OutboundTransportError("Cannot register a null outbound transport: " + name);
        auto schemes = t->schemes();
        if (schemes.empty()) throw OutboundTransportError("Outbound transport serves no schemes: " + name);
        for (auto& s : schemes) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        }

        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& r : transports_) {
            if (r.name == name) throw OutboundTransportError("Outbound transport already registered: " + name);
        }
        transports_.push_back(Registered{std::move(name), std::move(t), std::move(schemes)});
    }

    void OutboundTransportManager::start() {
        std::vector<Registered> ts;
        {
            std::lock_guard<std::mutex> lk(mu_);
            ts = transports_;
        }
        for (auto& r : ts) {
            try {
                r.transport->start();
            } catch (const std::exception& e) {
                throw OutboundTransportError("Failed to start outbound transport " + r.name + ": " + e.what());
            }
        }
    }

    void OutboundTransportManager::stop() {
        std::vector<Registered> ts;
        {
            std::lock_guard<std::mutex> lk(mu_);
            ts = transports_;
        }
        for (auto& r : ts) {
            try {
                r.transport->stop();
            } catch (const std::exception& e) {
                spdlog::error("Error stopping outbound transport {}: {}", r.name, e.what());
            }
        }
    }

    std::shared_ptr<OutboundTransport> OutboundTransportManager::transport_for(std::string_view endpoint) const {
        const auto scheme = scheme_of(endpoint);
        if (scheme.empty()) return nullptr;
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& r : transports_) {
            if (std::find(r.schemes.begin(), r.schemes.end(), scheme) != r.schemes.end()) return r.transport;
        }
        return nullptr;
    }

    void OutboundTransportManager::deliver(config::InjectionContext&, messaging::OutboundMessage message) {
        // Explicit target first, then the resolved list.
        std::vector<const messaging::ConnectionTarget*> candidates;
        if (message.target) candidates.push_back(&*message.target);
        if (message.target_list) {
            for (const auto& t : *message.target_list) candidates.push_back(&t);
        }

        std::shared_ptr<OutboundTransport> transport;
        messaging::ConnectionTarget chosen;
        for (const auto* c : candidates) {
            transport = transport_for(c->endpoint);
            if (transport) {
                chosen = *c;
                break;
            }
        }
        if (!transport) {
            throw OutboundDeliveryError(candidates.empty()
                ? std::string("Outbound message has no target")
                : "No transport for endpoint scheme of " + candidates.front()->endpoint);
        }

        auto owned = std::make_shared<const messaging::OutboundMessage>(std::move(message));
        queued_.fetch_add(1, std::memory_order_relaxed);
        run_task_(
            "deliver:" + chosen.endpoint,
            [transport, owned, chosen] { transport->send(*owned, chosen); },
            [this, endpoint = chosen.endpoint](const messaging::TaskInfo&, std::exception_ptr error) {
                if (!error) {
                    sent_.fetch_add(1, std::memory_order_relaxed);
                    return;
                }
                failed_.fetch_add(1, std::memory_order_relaxed);
                try {
                    std::rethrow_exception(error);
                } catch (const std::exception& e) {
                    spdlog::warn("Outbound message to {} failed; dropped: {}", endpoint, e.what());
                } catch (...) {
                    spdlog::warn("Outbound message to {} failed; dropped", endpoint);
                }
            });
    }

    std::map<std::string, std::vector<std::string>> OutboundTransportManager::registered_transports() const {
        std::lock_guard<std::mutex> lk(mu_);
        std::map<std::string, std::vector<std::string>> out;
        for (const auto& r : transports_) out.emplace(r.name, r.schemes);
        return out;
    }

} // namespace didagent::transport
