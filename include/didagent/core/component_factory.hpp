#pragma once
/**
 * @file component_factory.hpp
 * @brief Creates the collaborators the conductor sequences.
 * @details The default factory builds the reference implementations.
 *          Applications and tests override individual methods to plug in
 *          their own transports managers, admin servers or dispatchers.
 */

#include <cstdint>
#include <memory>
#include <string>

#include "didagent/admin/admin_server.hpp"
#include "didagent/config/injection_context.hpp"
#include "didagent/connections/connection_manager.hpp"
#include "didagent/dispatch/dispatcher.hpp"
#include "didagent/messaging/responder.hpp"
#include "didagent/transport/inbound_manager.hpp"
#include "didagent/transport/outbound_manager.hpp"

namespace didagent::core {

    class ComponentFactory {
    public:
        virtual ~ComponentFactory() = default;

        virtual std::shared_ptr<dispatch::Dispatcher>
        make_dispatcher(std::shared_ptr<config::InjectionContext> context);

        virtual std::shared_ptr<transport::InboundTransportManager>
        make_inbound_manager(std::shared_ptr<config::InjectionContext> context,
                             messaging::InboundRouter receive);

        virtual std::shared_ptr<transport::OutboundTransportManager>
        make_outbound_manager(std::shared_ptr<config::InjectionContext> context,
                              transport::TaskRunner run_task);

        virtual std::shared_ptr<admin::BaseAdminServer>
        make_admin_server(std::string host,
                          std::uint16_t port,
                          std::shared_ptr<config::InjectionContext> context,
                          messaging::OutboundRouter outbound_router,
                          admin::TaskEnqueue task_enqueue);

        /// Called per use; the manager must not outlive @p context.
        virtual std::unique_ptr<connections::ConnectionManager>
        make_connection_manager(config::InjectionContext& context);
    };

} // namespace didagent::core
