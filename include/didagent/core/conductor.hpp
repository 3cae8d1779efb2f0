#pragma once
/**
 * @file conductor.hpp
 * @brief Lifecycle owner of the agent and its two message-routing entry points.
 * @details
 *   State machine: Created -> Configured -> Starting -> Running -> Stopping -> Stopped.
 *
 *   - setup()  builds the context and every collaborator, exactly once.
 *   - start()  runs the ordered startup steps; fatal steps abort it.
 *   - stop()   stops the admin server and both transport managers in
 *              parallel and returns by the deadline.
 *
 *   The inbound router only enqueues; the outbound router resolves targets
 *   and hands the message to the outbound manager, or drops it with a log.
 *
 *   Threading: setup/start/stop are called from one control thread. The
 *   routers are called from transport and worker threads once setup returned.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "didagent/admin/admin_server.hpp"
#include "didagent/config/constants.hpp"
#include "didagent/config/context_builder.hpp"
#include "didagent/config/injection_context.hpp"
#include "didagent/config/wallet.hpp"
#include "didagent/connections/connection_record.hpp"
#include "didagent/core/component_factory.hpp"
#include "didagent/core/shutdown.hpp"
#include "didagent/crypto/keys.hpp"
#include "didagent/dispatch/dispatcher.hpp"
#include "didagent/messaging/inbound_message.hpp"
#include "didagent/messaging/outbound_message.hpp"
#include "didagent/messaging/responder.hpp"
#include "didagent/stats/collector.hpp"
#include "didagent/transport/inbound_manager.hpp"
#include "didagent/transport/outbound_manager.hpp"

namespace didagent::core {

    /// Lifecycle misuse (wrong state, routing before setup).
    class ConductorError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    enum class ConductorState : std::uint8_t { Created, Configured, Starting, Running, Stopping, Stopped };

    std::string_view to_string(ConductorState s) noexcept;

    /// How a startup step's failure is treated.
    enum class StepPolicy : std::uint8_t {
        Propagate,      ///< Fatal; exception escapes untouched
        LogAndRethrow,  ///< Fatal; logged with the step message, then rethrown
        LogAndContinue  ///< Recoverable; logged, startup goes on
    };

    /** @struct StartupStep
     *  @brief One entry of the ordered startup sequence.
     */
    struct StartupStep {
        std::string name;
        StepPolicy policy{StepPolicy::Propagate};
        std::string failure_message;
        std::function<void()> run;
    };

    /** @class Conductor
     *  @brief Constructs, sequences and routes between the agent's collaborators.
     *
     *  One per running agent. Collaborators call back into it only through the
     *  router callbacks handed to them during setup. Those callbacks hold a
     *  RouterGuard, not the conductor: once the destructor has cleared the
     *  guard, late calls (e.g. from a stop abandoned at the deadline) are
     *  dropped with a log line instead of reaching a destroyed conductor.
     */
    class Conductor {
    public:
        explicit Conductor(std::shared_ptr<config::ContextBuilder> builder,
                           std::shared_ptr<ComponentFactory> factory = std::make_shared<ComponentFactory>());
        ~Conductor();

        Conductor(const Conductor&)            = delete;
        Conductor& operator=(const Conductor&) = delete;

        /**
         * @brief Build the context and every collaborator.
         * @throws ConductorError if not in Created state.
         * @throws admin::AdminSetupError (after logging) when the admin server cannot be built.
         */
        void setup();

        /**
         * @brief Run the startup sequence.
         * @details A fatal step leaves the conductor in Starting; only stop() is
         *          meaningful afterwards.
         * @throws ConductorError if not in Configured state.
         */
        void start();

        /**
         * @brief Stop the admin server and both transport managers in parallel.
         * @details Failures are logged at error level; stops still running at
         *          the deadline are logged and abandoned. Never throws; a second
         *          call returns an empty report.
         */
        ShutdownReport stop(std::chrono::milliseconds timeout = config::constants::STOP_TIMEOUT_DEFAULT);

        /**
         * @brief Hand a received message to the dispatcher (one task per call).
         * @throws ConductorError before setup.
         */
        void inbound_message_router(messaging::InboundMessage message);

        /**
         * @brief Resolve targets for @p outbound if needed and deliver it.
         * @param context Context used for connection resolution.
         * @param outbound Populated with the resolved target list, if any.
         * @param inbound Message this one answers; correlation only.
         * @return Queued, or the reason the message was dropped.
         * @throws ConductorError before setup.
         */
        messaging::OutboundStatus outbound_message_router(config::InjectionContext& context,
                                                          messaging::OutboundMessage& outbound,
                                                          const messaging::InboundMessage* inbound = nullptr);

        /// Router callback form of outbound_message_router.
        messaging::OutboundRouter outbound_router();

        /// Where the banner and debug output go (std::cout by default).
        void set_console(std::ostream& out) noexcept { console_ = &out; }

        /// SHA-256 of the fixed test-subject and tester inputs.
        static std::pair<crypto::Digest, crypto::Digest> test_suite_seeds();

        [[nodiscard]] ConductorState state() const noexcept { return state_.load(std::memory_order_acquire); }

        const std::shared_ptr<config::InjectionContext>&            context() const noexcept { return context_; }
        const std::shared_ptr<dispatch::Dispatcher>&                dispatcher() const noexcept { return dispatcher_; }
        const std::shared_ptr<transport::InboundTransportManager>&  inbound_manager() const noexcept { return inbound_manager_; }
        const std::shared_ptr<transport::OutboundTransportManager>& outbound_manager() const noexcept { return outbound_manager_; }
        const std::shared_ptr<admin::BaseAdminServer>&              admin_server() const noexcept { return admin_server_; }

        /// Static connection created for the protocol test suite, if requested.
        const std::optional<connections::ConnectionRecord>& test_suite_connection() const noexcept {
            return test_suite_connection_;
        }
        /// Invitation URL printed at startup, if requested.
        const std::optional<std::string>& invitation_url() const noexcept { return invitation_url_; }

        /// Per-instance slot; "outbound_message_router" is instrumentable.
        stats::Instrumentation& instrumentation() noexcept { return instr_; }

    private:
        /// Liveness token shared by every router callback.
        struct RouterGuard {
            std::shared_mutex mu;
            Conductor* conductor{nullptr}; ///< Null once destruction began
        };

        void setup_admin_server();
        void instrument(stats::Collector& collector);
        std::vector<StartupStep> startup_steps();
        static void run_step(const StartupStep& step);

        void start_test_suite_connection();
        void print_invitation();

        std::shared_ptr<RouterGuard> guard_{std::make_shared<RouterGuard>()};
        std::shared_ptr<config::ContextBuilder> builder_;
        std::shared_ptr<ComponentFactory> factory_;

        std::shared_ptr<config::InjectionContext> context_;
        std::shared_ptr<dispatch::Dispatcher> dispatcher_;
        std::shared_ptr<transport::InboundTransportManager> inbound_manager_;
        std::shared_ptr<transport::OutboundTransportManager> outbound_manager_;
        std::shared_ptr<admin::BaseAdminServer> admin_server_;

        std::optional<config::PublicDid> public_did_;
        std::optional<connections::ConnectionRecord> test_suite_connection_;
        std::optional<std::string> invitation_url_;

        std::ostream* console_;
        std::atomic<ConductorState> state_{ConductorState::Created};
        stats::Instrumentation instr_{"Conductor"};
    };

} // namespace didagent::core
