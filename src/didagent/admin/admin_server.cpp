/**
 * @file admin_server.cpp
 * @brief AdminServer and AdminResponder.
 */
#include "didagent/admin/admin_server.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "didagent/messaging/outbound_message.hpp"

namespace didagent::admin {

    bool WebhookTargets::add(const std::string& url) {
        std::lock_guard<std::mutex> lk(mu_);
        if (std::find(urls_.begin(), urls_.end(), url) != urls_.end()) return false;
        urls_.push_back(url);
        return true;
    }

    std::vector<std::string> WebhookTargets::list() const {
        std::lock_guard<std::mutex> lk(mu_);
        return urls_;
    }

    AdminResponder::AdminResponder(std::shared_ptr<config::InjectionContext> context,
                                   messaging::OutboundRouter router,
                                   TaskEnqueue enqueue,
                                   std::shared_ptr<const WebhookTargets> targets)
        : RouterResponder(std::move(context), std::move(router)),
          enqueue_(std::move(enqueue)),
          targets_(std::move(targets)) {}

    void AdminResponder::send_webhook(std::string_view topic, std::string payload) {
        for (const auto& url : targets_->list()) {
            std::string endpoint = url;
            if (endpoint.empty() || endpoint.back() != '/') endpoint += '/';
            endpoint += "topics/" + std::string(topic) + "/";

            messaging::OutboundMessage msg;
            msg.payload = payload;
            msg.target = messaging::ConnectionTarget{};
            msg.target->endpoint = endpoint;
            msg.target->label = "webhook";

            enqueue_(
                "webhook:" + std::string(topic),
                [self = shared_from_this(), msg = std::move(msg)]() mutable {
                    const auto status = self->send_outbound(std::move(msg));
                    if (status != messaging::OutboundStatus::Queued) {
                        spdlog::debug("Webhook not queued: {}", messaging::to_string(status));
                    }
                },
                {});
        }
    }

    AdminServer::AdminServer(std::string host,
                             std::uint16_t port,
                             std::shared_ptr<config::InjectionContext> context,
                             messaging::OutboundRouter outbound_router,
                             TaskEnqueue task_enqueue)
        : host_(std::move(host)), port_(port), context_(std::move(context)) {
        if (host_.empty()) throw AdminSetupError("Admin server host must not be empty");
        if (!outbound_router) throw AdminSetupError("Admin server requires an outbound router");
        if (!task_enqueue) throw AdminSetupError("Admin server requires a task enqueue function");

        responder_ = std::make_shared<AdminResponder>(context_, std::move(outbound_router), std::move(task_enqueue),
                                                      webhook_targets_);
    }

    void AdminServer::add_webhook_target(const std::string& url) {
        if (url.find("://") == std::string::npos) {
            throw AdminSetupError("Webhook target is not an absolute URL: " + url);
        }
        if (!webhook_targets_->add(url)) {
            spdlog::debug("Webhook target already registered: {}", url);
        }
    }

    std::vector<std::string> AdminServer::webhook_targets() const {
        return webhook_targets_->list();
    }

    void AdminServer::start() {
        running_.store(true, std::memory_order_release);
        spdlog::info("Admin server started on {} ({} webhook targets)", describe(), webhook_targets().size());
    }

    void AdminServer::stop() {
        if (running_.exchange(false, std::memory_order_acq_rel)) {
            spdlog::info("Admin server stopped");
        }
    }

    std::string AdminServer::describe() const {
        return "http://" + host_ + ":" + std::to_string(port_);
    }

} // namespace didagent::admin
