/**
 * @file shutdown.cpp
 * @brief ShutdownTaskSet.
 */
#include "didagent/core/shutdown.hpp"

#include <cmath>
#include <cstdint>
#include <exception>
#include <thread>

#include <spdlog/spdlog.h>

#include "didagent/config/constants.hpp"

namespace didagent::core {

    using namespace didagent::config::constants;

    std::chrono::milliseconds stop_timeout_setting(const config::Settings& settings) {
        if (!settings.contains(KEY_STOP_TIMEOUT)) return STOP_TIMEOUT_DEFAULT;

        const auto seconds = settings.get_double(KEY_STOP_TIMEOUT);
        if (!seconds || std::isnan(*seconds) || *seconds < 0.0) {
            spdlog::warn("Invalid stop_timeout {}; using {} ms",
                         config::to_string(*settings.find(KEY_STOP_TIMEOUT)), STOP_TIMEOUT_DEFAULT.count());
            return STOP_TIMEOUT_DEFAULT;
        }
        // Compare before converting; the cast is undefined above the int64 range.
        const double max_seconds = static_cast<double>(STOP_TIMEOUT_MAX.count()) / 1000.0;
        if (*seconds > max_seconds) {
            spdlog::warn("stop_timeout {}s exceeds {}s; clamped", *seconds, max_seconds);
            return STOP_TIMEOUT_MAX;
        }
        return std::chrono::milliseconds(static_cast<std::int64_t>(*seconds * 1000.0));
    }

    ShutdownTaskSet::ShutdownTaskSet() : state_(std::make_shared<State>()) {}

    void ShutdownTaskSet::run(std::string name, std::function<void()> stop) {
        {
            std::lock_guard<std::mutex> lk(state_->mu);
            ++state_->pending;
            state_->running.insert(name);
        }
        ++launched_;

        std::thread([state = state_, name = std::move(name), stop = std::move(stop)] {
            bool ok = true;
            try {
                if (stop) stop();
            } catch (const std::exception& e) {
                ok = false;
                spdlog::error("Error stopping {}: {}", name, e.what());
            } catch (...) {
                ok = false;
                spdlog::error("Error stopping {}: unknown exception", name);
            }

            std::lock_guard<std::mutex> lk(state->mu);
            auto it = state->running.find(name);
            if (it != state->running.end()) state->running.erase(it);
            (ok ? state->completed : state->failed).push_back(name);
            --state->pending;
            state->cv.notify_all();
        }).detach();
    }

    ShutdownReport ShutdownTaskSet::wait(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(state_->mu);
        state_->cv.wait_for(lk, timeout, [&] { return state_->pending == 0; });

        ShutdownReport report;
        report.completed = state_->completed;
        report.failed    = state_->failed;
        report.timed_out.assign(state_->running.begin(), state_->running.end());
        for (const auto& name : report.timed_out) {
            spdlog::warn("Shutdown deadline reached; abandoning stop of {}", name);
        }
        return report;
    }

} // namespace didagent::core
