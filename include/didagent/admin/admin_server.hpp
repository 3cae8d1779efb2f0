#pragma once
/**
 * @file admin_server.hpp
 * @brief Administrative endpoint: webhook emission and the default responder.
 * @details The HTTP API surface is provided by the embedding application;
 *          this server owns the webhook targets, the responder bound as the
 *          process-wide default once started, and the bind address.
 */

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "didagent/config/injection_context.hpp"
#include "didagent/messaging/responder.hpp"
#include "didagent/messaging/task_queue.hpp"

namespace didagent::admin {

    /// The admin server could not be configured.
    class AdminSetupError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /// Enqueue primitive handed in by the dispatcher (fn(name, task, done) -> id).
    using TaskEnqueue = std::function<std::uint64_t(std::string, messaging::Task, messaging::TaskDone)>;

    /** @class BaseAdminServer
     *  @brief Capability other components resolve the admin server by.
     */
    class BaseAdminServer {
    public:
        virtual ~BaseAdminServer() = default;

        virtual void add_webhook_target(const std::string& url) = 0;
        virtual std::vector<std::string> webhook_targets() const = 0;

        virtual void start() = 0;
        virtual void stop() = 0;

        /// Responder for messages originating outside the inbound/outbound flow.
        virtual std::shared_ptr<messaging::BaseResponder> responder() = 0;

        /// Bind address, e.g. "http://0.0.0.0:8031".
        virtual std::string describe() const = 0;
    };

    /** @class WebhookTargets
     *  @brief Registered webhook URLs, shared by the server and its responder.
     */
    class WebhookTargets {
    public:
        /// @return false if @p url was already present.
        bool add(const std::string& url);
        std::vector<std::string> list() const;

    private:
        mutable std::mutex mu_;
        std::vector<std::string> urls_;
    };

    /** @class AdminResponder
     *  @brief Routes outbound messages and fans webhooks out to every target.
     */
    class AdminResponder : public messaging::RouterResponder,
                           public std::enable_shared_from_this<AdminResponder> {
    public:
        AdminResponder(std::shared_ptr<config::InjectionContext> context,
                       messaging::OutboundRouter router,
                       TaskEnqueue enqueue,
                       std::shared_ptr<const WebhookTargets> targets);

        /// Sends (via the outbound path) to "<target>/topics/<topic>/" for each target.
        void send_webhook(std::string_view topic, std::string payload) override;

    private:
        TaskEnqueue enqueue_;
        std::shared_ptr<const WebhookTargets> targets_;
    };

    /** @class AdminServer
     *  @brief Default BaseAdminServer.
     */
    class AdminServer : public BaseAdminServer {
    public:
        /// @throws AdminSetupError on an empty host or a missing router/enqueue fn.
        AdminServer(std::string host,
                    std::uint16_t port,
                    std::shared_ptr<config::InjectionContext> context,
                    messaging::OutboundRouter outbound_router,
                    TaskEnqueue task_enqueue);

        /// @throws AdminSetupError when @p url is not an absolute URL.
        void add_webhook_target(const std::string& url) override;
        std::vector<std::string> webhook_targets() const override;

        void start() override;
        void stop() override;

        std::shared_ptr<messaging::BaseResponder> responder() override { return responder_; }
        std::string describe() const override;

        [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }
        [[nodiscard]] const std::string& host() const noexcept { return host_; }
        [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

    private:
        std::string host_;
        std::uint16_t port_;
        std::shared_ptr<config::InjectionContext> context_;

        std::shared_ptr<WebhookTargets> webhook_targets_{std::make_shared<WebhookTargets>()};
        std::shared_ptr<AdminResponder> responder_;
        std::atomic<bool> running_{false};
    };

} // namespace didagent::admin
