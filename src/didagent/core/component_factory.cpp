/**
 * @file component_factory.cpp
 * @brief Default collaborator construction.
 */
#include "didagent/core/component_factory.hpp"

namespace didagent::core {

    std::shared_ptr<dispatch::Dispatcher>
    ComponentFactory::make_dispatcher(std::shared_ptr<config::InjectionContext> context) {
        return std::make_shared<dispatch::Dispatcher>(std::move(context));
    }

    std::shared_ptr<transport::InboundTransportManager>
    ComponentFactory::make_inbound_manager(std::shared_ptr<config::InjectionContext> context,
                                           messaging::InboundRouter receive) {
        return std::make_shared<transport::InboundTransportManager>(std::move(context), std::move(receive));
    }

    std::shared_ptr<transport::OutboundTransportManager>
    ComponentFactory::make_outbound_manager(std::shared_ptr<config::InjectionContext> context,
                                            transport::TaskRunner run_task) {
        return std::make_shared<transport::OutboundTransportManager>(std::move(context), std::move(run_task));
    }

    std::shared_ptr<admin::BaseAdminServer>
    ComponentFactory::make_admin_server(std::string host,
                                        std::uint16_t port,
                                        std::shared_ptr<config::InjectionContext> context,
                                        messaging::OutboundRouter outbound_router,
                                        admin::TaskEnqueue task_enqueue) {
        return std::make_shared<admin::AdminServer>(std::move(host), port, std::move(context),
                                                    std::move(outbound_router), std::move(task_enqueue));
    }

    std::unique_ptr<connections::ConnectionManager>
    ComponentFactory::make_connection_manager(config::InjectionContext& context) {
        return std::make_unique<connections::ConnectionManager>(context);
    }

} // namespace didagent::core
