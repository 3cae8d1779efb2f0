#pragma once
/**
 * @file collector.hpp
 * @brief Optional timing/counting instrumentation for hot collaborator methods.
 * @details Components own an Instrumentation slot per class (or per instance)
 *          and open a ScopedTimer around each instrumentable method. A
 *          Collector bound in the context is attached to those slots once
 *          during conductor setup.
 */

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>

namespace didagent::stats {

    /** @struct OpStats
     *  @brief Cumulative figures for a single named operation.
     */
    struct OpStats {
        std::uint64_t            count{0}; ///< Completed calls
        std::chrono::nanoseconds total{0}; ///< Sum of wall time
        std::chrono::nanoseconds max{0};   ///< Slowest call
    };

    class Collector;

    /** @class ScopedTimer
     *  @brief Records elapsed time into a collector on destruction.
     *  A default-constructed timer is inert.
     */
    class ScopedTimer {
    public:
        ScopedTimer() = default;
        ScopedTimer(std::shared_ptr<Collector> c, std::string name);
        ScopedTimer(ScopedTimer&&) noexcept = default;
        ScopedTimer& operator=(ScopedTimer&&) noexcept = default;
        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;
        ~ScopedTimer();

        [[nodiscard]] bool active() const noexcept { return collector_ != nullptr; }

    private:
        std::shared_ptr<Collector> collector_;
        std::string name_;
        std::chrono::steady_clock::time_point start_{};
    };

    /** @class Instrumentation
     *  @brief Attachment point naming which methods of an owner are observed.
     *
     *  Re-attaching the same collector for methods it already observes is a
     *  no-op, so a slot shared by every instance of a class is never wrapped
     *  twice no matter how many conductors run setup.
     */
    class Instrumentation {
    public:
        explicit Instrumentation(std::string owner) : owner_(std::move(owner)) {}

        /// @return false when nothing changed (same collector, methods already wrapped).
        bool attach(std::shared_ptr<Collector> collector, std::initializer_list<std::string_view> methods);

        /// Drop the collector and all wrapped methods.
        void detach();

        /// Timer for @p method; inert when the method is not wrapped.
        [[nodiscard]] ScopedTimer time(std::string_view method) const;

        [[nodiscard]] bool wraps(std::string_view method) const;
        [[nodiscard]] const std::string& owner() const noexcept { return owner_; }

    private:
        const std::string owner_;
        mutable std::mutex mu_;
        std::shared_ptr<Collector> collector_;
        std::set<std::string, std::less<>> methods_;
    };

    /** @class Collector
     *  @brief Thread-safe sink of per-operation counters.
     */
    class Collector : public std::enable_shared_from_this<Collector> {
    public:
        /// Record one completed call of @p name.
        void record(std::string_view name, std::chrono::nanoseconds elapsed);

        /**
         * @brief Observe @p methods of @p target.
         * @return false if @p target was already wrapped for all of them by this collector.
         */
        bool wrap(Instrumentation& target, std::initializer_list<std::string_view> methods);

        /// Snapshot of all counters, keyed "Owner.method".
        std::map<std::string, OpStats> snapshot() const;

        /// Counters for one operation (zeroes when never seen).
        OpStats stats_for(std::string_view name) const;

        void reset();

    private:
        mutable std::mutex mu_;
        std::map<std::string, OpStats, std::less<>> ops_;
    };

} // namespace didagent::stats
