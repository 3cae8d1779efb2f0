/**
 * @file inbound_manager.cpp
 * @brief InboundTransportManager implementation.
 */
#include "didagent/transport/inbound_manager.hpp"

#include <spdlog/spdlog.h>

namespace didagent::transport {

    InboundTransportManager::InboundTransportManager(std::shared_ptr<config::InjectionContext> context,
                                                     messaging::InboundRouter receive)
        : context_(std::move(context)), receive_(std::move(receive)) {
        if (!receive_) throw InboundTransportError("Inbound transport manager requires a receive callback");
    }

    void InboundTransportManager::setup() {
        auto registry = context_ ? context_->inject<TransportRegistry>(/*required=*/false) : nullptr;
        if (!registry) {
            spdlog::debug("No transport registry bound; no inbound transports configured");
            return;
        }
        for (auto& t : registry->inbound()) register_transport(std::move(t));
    }

    void InboundTransportManager::register_transport(std::shared_ptr<InboundTransport> t) {
        if (!t) throw InboundTransportError("Cannot register a null inbound transport");
        std::lock_guard<std::mutex> lk(mu_);
        transports_.push_back(std::move(t));
    }

    void InboundTransportManager::start() {
        std::vector<std::shared_ptr<InboundTransport>> ts;
        {
            std::lock_guard<std::mutex> lk(mu_);
            ts = transports_;
        }
        for (auto& t : ts) {
            try {
                t->start(receive_);
            } catch (const std::exception& e) {
                throw InboundTransportError("Failed to start inbound transport " + t->describe() + ": " + e.what());
            }
            spdlog::debug("Inbound transport started: {}", t->describe());
        }
    }

    void InboundTransportManager::stop() {
        std::vector<std::shared_ptr<InboundTransport>> ts;
        {
            std::lock_guard<std::mutex> lk(mu_);
            ts = transports_;
        }
        for (auto& t : ts) {
            try {
                t->stop();
            } catch (const std::exception& e) {
                spdlog::error("Error stopping inbound transport {}: {}", t->describe(), e.what());
            }
        }
    }

    void InboundTransportManager::dispatch_complete(const messaging::InboundMessage& message,
                                                    const messaging::TaskInfo& task,
                                                    std::exception_ptr error) {
        completed_.fetch_add(1, std::memory_order_relaxed);
        if (!error) return;

        failed_.fetch_add(1, std::memory_order_relaxed);
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            spdlog::error("Exception in message handler (task {}, {} transport, session '{}'): {}",
                          task.id, message.receipt.transport_type, message.session_id, e.what());
        } catch (...) {
            spdlog::error("Unknown exception in message handler (task {}, {} transport)",
                          task.id, message.receipt.transport_type);
        }
    }

    std::vector<std::string> InboundTransportManager::registered_transports() const {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<std::string> out;
        out.reserve(transports_.size());
        for (const auto& t : transports_) out.push_back(t->describe());
        return out;
    }

    bool InboundTransportManager::supports_direct_response(std::string_view transport_type) const {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& t : transports_) {
            if (t->scheme() == transport_type && t->supports_direct_response()) return true;
        }
        return false;
    }

} // namespace didagent::transport
