/**
 * @file conductor.cpp
 * @brief Conductor lifecycle and routing.
 */
#include "didagent/core/conductor.hpp"

#include <iostream>
#include <limits>

#include <spdlog/spdlog.h>

#include "didagent/config/logging.hpp"
#include "didagent/connections/connection_manager.hpp"

namespace didagent::core {

    using namespace didagent::config::constants;

    namespace {
        // Accepts an integer or a numeric string.
        std::uint16_t admin_port(const config::Settings& settings) {
            if (!settings.contains(KEY_ADMIN_PORT)) return ADMIN_DEFAULT_PORT;
            const auto port = settings.get_int(KEY_ADMIN_PORT);
            if (!port) {
                throw admin::AdminSetupError("Invalid admin.port: " +
                                             config::to_string(*settings.find(KEY_ADMIN_PORT)));
            }
            if (*port < 1 || *port > std::numeric_limits<std::uint16_t>::max()) {
                throw admin::AdminSetupError("admin.port out of range: " + std::to_string(*port));
            }
            return static_cast<std::uint16_t>(*port);
        }
    } // namespace

    std::string_view to_string(ConductorState s) noexcept {
        switch (s) {
            case ConductorState::Created:    return "created";
            case ConductorState::Configured: return "configured";
            case ConductorState::Starting:   return "starting";
            case ConductorState::Running:    return "running";
            case ConductorState::Stopping:   return "stopping";
            case ConductorState::Stopped:    return "stopped";
        }
        return "unknown";
    }

    Conductor::Conductor(std::shared_ptr<config::ContextBuilder> builder, std::shared_ptr<ComponentFactory> factory)
        : builder_(std::move(builder)), factory_(std::move(factory)), console_(&std::cout) {
        if (!builder_) throw ConductorError("Conductor requires a context builder");
        if (!factory_) throw ConductorError("Conductor requires a component factory");
        guard_->conductor = this;
    }

    Conductor::~Conductor() {
        const auto s = state();
        if (s == ConductorState::Configured || s == ConductorState::Starting || s == ConductorState::Running) {
            stop();
        }
        // Waits for router calls in flight; later calls see a null conductor.
        {
            std::unique_lock<std::shared_mutex> lk(guard_->mu);
            guard_->conductor = nullptr;
        }
        if (dispatcher_) dispatcher_->task_queue().shutdown();
    }

    // ---------------------------------------------------------------------
    // setup
    // ---------------------------------------------------------------------

    void Conductor::setup() {
        if (state() != ConductorState::Created) {
            throw ConductorError("setup() called in state " + std::string(to_string(state())));
        }

        auto context = builder_->build();
        if (!context) throw ConductorError("Context builder returned no context");
        context_ = context;

        dispatcher_ = factory_->make_dispatcher(context);

        inbound_manager_ = factory_->make_inbound_manager(
            context, [guard = guard_](messaging::InboundMessage message) {
                std::shared_lock<std::shared_mutex> lk(guard->mu);
                if (!guard->conductor) {
                    spdlog::warn("Inbound message from {} received after shutdown; dropped",
                                 message.receipt.transport_type);
                    return;
                }
                guard->conductor->inbound_message_router(std::move(message));
            });
        inbound_manager_->setup();

        // The dispatcher may be released before a late delivery task is scheduled.
        std::weak_ptr<dispatch::Dispatcher> weak_dispatcher = dispatcher_;
        outbound_manager_ = factory_->make_outbound_manager(
            context,
            [weak_dispatcher](std::string name, messaging::Task fn, messaging::TaskDone done) -> std::uint64_t {
                auto d = weak_dispatcher.lock();
                if (!d) throw ConductorError("Dispatcher is no longer available");
                return d->run_task(std::move(name), std::move(fn), std::move(done));
            });
        outbound_manager_->setup();

        if (context->settings().truthy(KEY_ADMIN_ENABLED)) {
            setup_admin_server();
        }

        if (auto collector = context->inject<stats::Collector>(/*required=*/false)) {
            instrument(*collector);
        }

        state_.store(ConductorState::Configured, std::memory_order_release);
        spdlog::debug("Conductor configured");
    }

    void Conductor::setup_admin_server() {
        try {
            const auto& settings = context_->settings();
            const auto host = settings.get_string_or(KEY_ADMIN_HOST, ADMIN_DEFAULT_HOST);
            const auto port = admin_port(settings);

            std::weak_ptr<dispatch::Dispatcher> weak_dispatcher = dispatcher_;
            admin_server_ = factory_->make_admin_server(
                host, port, context_, outbound_router(),
                [weak_dispatcher](std::string name, messaging::Task fn, messaging::TaskDone done) -> std::uint64_t {
                    auto d = weak_dispatcher.lock();
                    if (!d) throw ConductorError("Dispatcher is no longer available");
                    return d->put_task(std::move(name), std::move(fn), std::move(done));
                });

            if (auto urls = settings.get_list(KEY_ADMIN_WEBHOOK_URLS)) {
                for (const auto& url : *urls) admin_server_->add_webhook_target(url);
            }
            context_->injector().bind_instance<admin::BaseAdminServer>(admin_server_);
        } catch (const std::exception& e) {
            spdlog::error("Unable to register admin server: {}", e.what());
            throw;
        }
    }

    void Conductor::instrument(stats::Collector& collector) {
        collector.wrap(instr_, {"outbound_message_router"});
        collector.wrap(dispatcher_->instrumentation(), {"handle_message"});
        // Class-level slot: a repeat wrap by the same collector is a no-op.
        collector.wrap(connections::ConnectionManager::instrumentation(),
                       {"get_connection_targets", "fetch_did_document", "find_message_connection"});
    }

    // ---------------------------------------------------------------------
    // start
    // ---------------------------------------------------------------------

    void Conductor::start() {
        if (state() != ConductorState::Configured) {
            throw ConductorError("start() called in state " + std::string(to_string(state())));
        }
        state_.store(ConductorState::Starting, std::memory_order_release);

        for (const auto& step : startup_steps()) {
            run_step(step);
        }

        state_.store(ConductorState::Running, std::memory_order_release);
        spdlog::info("Agent started");
    }

    void Conductor::run_step(const StartupStep& step) {
        switch (step.policy) {
            case StepPolicy::Propagate:
                step.run();
                return;
            case StepPolicy::LogAndRethrow:
                try {
                    step.run();
                } catch (const std::exception& e) {
                    spdlog::error("{}: {}", step.failure_message, e.what());
                    throw;
                } catch (...) {
                    spdlog::error("{}: unknown exception", step.failure_message);
                    throw;
                }
                return;
            case StepPolicy::LogAndContinue:
                try {
                    step.run();
                } catch (const std::exception& e) {
                    spdlog::error("{}: {}", step.failure_message, e.what());
                } catch (...) {
                    spdlog::error("{}: unknown exception", step.failure_message);
                }
                return;
        }
    }

    std::vector<StartupStep> Conductor::startup_steps() {
        std::vector<StartupStep> steps;

        steps.push_back({"wallet", StepPolicy::Propagate, {},
                         [this] { public_did_ = config::wallet_config(*context_); }});

        steps.push_back({"ledger", StepPolicy::Propagate, {},
                         [this] { config::ledger_config(*context_, public_did_); }});

        steps.push_back({"inbound transports", StepPolicy::LogAndRethrow, "Unable to start inbound transports",
                         [this] { inbound_manager_->start(); }});

        steps.push_back({"outbound transports", StepPolicy::LogAndRethrow, "Unable to start outbound transports",
                         [this] { outbound_manager_->start(); }});

        if (admin_server_) {
            steps.push_back({"admin server", StepPolicy::LogAndContinue, "Unable to start administration API",
                             [this] {
                                 admin_server_->start();
                                 // Default responder for messages raised outside a dispatch.
                                 context_->injector().bind_instance<messaging::BaseResponder>(
                                     admin_server_->responder());
                             }});
        }

        steps.push_back({"banner", StepPolicy::LogAndContinue, "Unable to print banner", [this] {
                             config::BannerInfo info;
                             info.label = context_->settings().get_string_or(KEY_DEFAULT_LABEL, "");
                             info.inbound_transports = inbound_manager_->registered_transports();
                             info.outbound_transports = outbound_manager_->registered_transports();
                             info.public_did = public_did_;
                             if (admin_server_) info.admin = admin_server_->describe();
                             config::print_banner(*console_, info);
                         }});

        if (!context_->settings().get_string_or(KEY_TEST_SUITE_ENDPOINT, "").empty()) {
            steps.push_back({"test suite connection", StepPolicy::Propagate, {},
                             [this] { start_test_suite_connection(); }});
        }

        if (context_->settings().truthy(KEY_PRINT_INVITATION)) {
            steps.push_back({"invitation", StepPolicy::LogAndContinue, "Error creating invitation",
                             [this] { print_invitation(); }});
        }

        return steps;
    }

    std::pair<crypto::Digest, crypto::Digest> Conductor::test_suite_seeds() {
        return {crypto::sha256(TEST_SUITE_SUBJECT_SEED_INPUT), crypto::sha256(TEST_SUITE_TESTER_SEED_INPUT)};
    }

    void Conductor::start_test_suite_connection() {
        const auto endpoint = context_->settings().get_string_or(KEY_TEST_SUITE_ENDPOINT, "");
        const auto [my_seed, their_seed] = test_suite_seeds();

        auto mgr = factory_->make_connection_manager(*context_);
        auto conn = mgr->create_static_connection(my_seed, their_seed, endpoint,
                                                  std::string(TEST_SUITE_THEIR_ROLE),
                                                  std::string(TEST_SUITE_ALIAS));

        auto& out = *console_;
        out << "Created static connection for test suite\n";
        out << " - My DID: " << conn.my_did << "\n";
        out << " - Their DID: " << conn.their_did << "\n";
        out << " - Their endpoint: " << endpoint << "\n\n";
        out.flush();

        test_suite_connection_ = std::move(conn);
    }

    void Conductor::print_invitation() {
        const auto& settings = context_->settings();
        auto mgr = factory_->make_connection_manager(*context_);
        auto result = mgr->create_invitation(settings.get_string_or(KEY_INVITE_ROLE, ""),
                                             settings.get_string_or(KEY_INVITE_LABEL, ""),
                                             settings.get_bool_or(KEY_INVITE_MULTI_USE, false),
                                             settings.get_bool_or(KEY_INVITE_PUBLIC, false));
        auto url = result.invitation.to_url(settings.get_string_or(KEY_INVITE_BASE_URL, ""));

        *console_ << "Invitation URL:\n" << url << "\n";
        console_->flush();
        invitation_url_ = std::move(url);
    }

    // ---------------------------------------------------------------------
    // stop
    // ---------------------------------------------------------------------

    ShutdownReport Conductor::stop(std::chrono::milliseconds timeout) {
        auto s = state();
        do {
            if (s == ConductorState::Stopping || s == ConductorState::Stopped) return {};
        } while (!state_.compare_exchange_weak(s, ConductorState::Stopping, std::memory_order_acq_rel));

        // Threads own a reference; an abandoned stop keeps its component alive.
        ShutdownTaskSet shutdown;
        if (admin_server_) shutdown.run("admin server", [a = admin_server_] { a->stop(); });
        if (inbound_manager_) shutdown.run("inbound transports", [m = inbound_manager_] { m->stop(); });
        if (outbound_manager_) shutdown.run("outbound transports", [m = outbound_manager_] { m->stop(); });

        auto report = shutdown.wait(timeout);
        state_.store(ConductorState::Stopped, std::memory_order_release);
        spdlog::info("Agent stopped ({} of {} completed, {} failed, {} timed out)",
                     report.completed.size(), shutdown.launched(), report.failed.size(), report.timed_out.size());
        return report;
    }

    // ---------------------------------------------------------------------
    // routing
    // ---------------------------------------------------------------------

    void Conductor::inbound_message_router(messaging::InboundMessage message) {
        if (!dispatcher_ || !inbound_manager_) {
            throw ConductorError("Inbound message routed before setup");
        }

        if (message.receipt.direct_response_requested() &&
            !inbound_manager_->supports_direct_response(message.receipt.transport_type)) {
            spdlog::warn("Direct response requested, but not supported by transport: {} (mode {})",
                         message.receipt.transport_type,
                         messaging::to_string(*message.receipt.direct_response_mode));
        }

        dispatcher_->queue_message(
            std::move(message), outbound_router(),
            [inbound = inbound_manager_](const messaging::InboundMessage& m, const messaging::TaskInfo& task,
                                         std::exception_ptr error) { inbound->dispatch_complete(m, task, error); });
    }

    messaging::OutboundRouter Conductor::outbound_router() {
        return [guard = guard_](config::InjectionContext& context, messaging::OutboundMessage outbound,
                                const messaging::InboundMessage* inbound) {
            std::shared_lock<std::shared_mutex> lk(guard->mu);
            if (!guard->conductor) {
                spdlog::warn("Outbound message routed after shutdown; dropped");
                return messaging::OutboundStatus::DroppedUndeliverable;
            }
            return guard->conductor->outbound_message_router(context, outbound, inbound);
        };
    }

    messaging::OutboundStatus Conductor::outbound_message_router(config::InjectionContext& context,
                                                                 messaging::OutboundMessage& outbound,
                                                                 [[maybe_unused]] const messaging::InboundMessage* inbound) {
        if (!outbound_manager_) {
            throw ConductorError("Outbound message routed before setup");
        }
        auto timer = instr_.time("outbound_message_router");

        const bool has_list = outbound.target_list && !outbound.target_list->empty();
        if (!outbound.target && !has_list && outbound.connection_id) {
            try {
                auto mgr = factory_->make_connection_manager(context);
                outbound.target_list = mgr->get_connection_targets(*outbound.connection_id);
            } catch (const connections::ConnectionManagerError& e) {
                spdlog::error("Error preparing outbound message for transmission: {}", e.what());
                return messaging::OutboundStatus::DroppedUnresolved;
            }
        }

        try {
            outbound_manager_->deliver(context, outbound);
        } catch (const transport::OutboundDeliveryError& e) {
            spdlog::warn("Cannot queue message for delivery, no supported transport: {}", e.what());
            return messaging::OutboundStatus::DroppedUndeliverable;
        }
        return messaging::OutboundStatus::Queued;
    }

} // namespace didagent::core
