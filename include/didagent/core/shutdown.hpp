#pragma once
/**
 * @file shutdown.hpp
 * @brief Parallel component stops bounded by one deadline.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "didagent/config/settings.hpp"

namespace didagent::core {

    /**
     * @brief "stop_timeout" (seconds, fractional allowed) as a deadline.
     * @details Absent, non-numeric, negative or NaN values give the default;
     *          values above STOP_TIMEOUT_MAX are clamped to it. Both cases log a warning.
     */
    std::chrono::milliseconds stop_timeout_setting(const config::Settings& settings);

    /** @struct ShutdownReport
     *  @brief Outcome of a deadline-bounded shutdown, by component name.
     */
    struct ShutdownReport {
        std::vector<std::string> completed;
        std::vector<std::string> failed;    ///< Stop threw; logged at error level
        std::vector<std::string> timed_out; ///< Still running at the deadline; abandoned

        [[nodiscard]] bool clean() const noexcept { return failed.empty() && timed_out.empty(); }
    };

    /** @class ShutdownTaskSet
     *  @brief Each stop runs on its own detached thread; wait() returns by the deadline.
     *
     *  Threads that outlive wait() keep the shared state alive and finish
     *  quietly whenever their stop returns. Nothing is retried.
     */
    class ShutdownTaskSet {
    public:
        ShutdownTaskSet();

        /// Launch @p stop immediately under @p name.
        void run(std::string name, std::function<void()> stop);

        /// Block until every stop finished or @p timeout elapsed.
        ShutdownReport wait(std::chrono::milliseconds timeout);

        [[nodiscard]] std::size_t launched() const noexcept { return launched_; }

    private:
        struct State {
            std::mutex mu;
            std::condition_variable cv;
            std::size_t pending{0};
            std::vector<std::string> completed;
            std::vector<std::string> failed;
            std::multiset<std::string> running;
        };

        std::shared_ptr<State> state_;
        std::size_t launched_{0};
    };

} // namespace didagent::core
