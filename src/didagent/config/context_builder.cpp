/**
 * @file context_builder.cpp
 * @brief DefaultContextBuilder.
 */
#include "didagent/config/context_builder.hpp"

#include <spdlog/spdlog.h>

#include "didagent/config/constants.hpp"
#include "didagent/connections/connection_store.hpp"
#include "didagent/stats/collector.hpp"

namespace didagent::config {

    using namespace didagent::config::constants;

    std::shared_ptr<InjectionContext> DefaultContextBuilder::build() {
        auto context = std::make_shared<InjectionContext>(settings_);

        context->injector().bind_instance<connections::ConnectionStore>(
            std::make_shared<connections::ConnectionStore>());

        if (settings_.truthy(KEY_COLLECT_STATS)) {
            context->injector().bind_instance<stats::Collector>(std::make_shared<stats::Collector>());
            spdlog::debug("Stats collection enabled");
        }

        if (customize_) customize_(*context);
        return context;
    }

} // namespace didagent::config
