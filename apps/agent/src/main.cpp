/**
 * @file main.cpp
 * @brief didagent: loads settings, runs the conductor until SIGINT/SIGTERM.
 *
 * Usage: didagent [--config FILE] [key=value ...]
 *
 * Overrides on the command line win over the file. Exit code 1 on a fatal
 * setup/start error.
 */

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include <pthread.h>
#include <spdlog/spdlog.h>

#include "didagent/config/config_loader.hpp"
#include "didagent/config/context_builder.hpp"
#include "didagent/config/logging.hpp"
#include "didagent/core/conductor.hpp"
#include "didagent/version.hpp"

using namespace didagent;

namespace {

    void usage(const char* argv0) {
        std::cerr << "usage: " << argv0 << " [--config FILE] [key=value ...]\n"
                  << "didagent " << version_string << "\n";
    }

    int wait_for_shutdown_signal(const sigset_t& set) {
        int sig = 0;
        if (sigwait(&set, &sig) != 0) return -1;
        return sig;
    }

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::vector<std::string> overrides;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        }
        if (arg == "--config") {
            if (i + 1 >= argc) {
                usage(argv[0]);
                return 1;
            }
            config_path = argv[++i];
        } else {
            overrides.push_back(arg);
        }
    }

    config::Settings settings;
    if (!config_path.empty()) {
        auto loaded = config::Loader::load_from_file(config_path);
        if (!loaded) {
            std::cerr << loaded.error().describe() << "\n";
            return 1;
        }
        settings = std::move(*loaded);
    }
    auto cli = config::Loader::from_overrides(overrides);
    if (!cli) {
        std::cerr << cli.error().describe() << "\n";
        return 1;
    }
    settings.merge(*cli);

    config::configure_logging(settings);

    const auto stop_timeout = core::stop_timeout_setting(settings);

    // Signals go to sigwait below, not to worker threads spawned from here on.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    core::Conductor conductor(std::make_shared<config::DefaultContextBuilder>(settings));
    try {
        conductor.setup();
        conductor.start();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error starting agent: {}", e.what());
        conductor.stop(stop_timeout);
        return 1;
    }

    const int sig = wait_for_shutdown_signal(signals);
    spdlog::info("Received signal {}, shutting down", sig);

    conductor.stop(stop_timeout);
    return 0;
}
