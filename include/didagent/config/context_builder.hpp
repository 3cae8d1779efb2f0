#pragma once
/**
 * @file context_builder.hpp
 * @brief Builds the InjectionContext the conductor runs on.
 */

#include <functional>
#include <memory>

#include "didagent/config/injection_context.hpp"
#include "didagent/config/settings.hpp"

namespace didagent::config {

    /** @class ContextBuilder
     *  @brief Source of the agent's context; called once per conductor setup.
     */
    class ContextBuilder {
    public:
        virtual ~ContextBuilder() = default;
        virtual std::shared_ptr<InjectionContext> build() = 0;
    };

    /** @class DefaultContextBuilder
     *  @brief Settings + default bindings + an optional application hook.
     *
     *  Default bindings:
     *   - ConnectionStore (in-memory)
     *   - stats::Collector when "collect_stats" is truthy
     */
    class DefaultContextBuilder : public ContextBuilder {
    public:
        /// Application hook run after the defaults are bound.
        using Customizer = std::function<void(InjectionContext&)>;

        explicit DefaultContextBuilder(Settings settings, Customizer customize = {})
            : settings_(std::move(settings)), customize_(std::move(customize)) {}

        std::shared_ptr<InjectionContext> build() override;

        [[nodiscard]] const Settings& settings() const noexcept { return settings_; }

    private:
        Settings settings_;
        Customizer customize_;
    };

} // namespace didagent::config
