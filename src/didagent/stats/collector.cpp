/**
 * @file collector.cpp
 * @brief Mutex-backed Collector and Instrumentation slots.
 */
#include "didagent/stats/collector.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace didagent::stats {

    ScopedTimer::ScopedTimer(std::shared_ptr<Collector> c, std::string name)
        : collector_(std::move(c)), name_(std::move(name)), start_(std::chrono::steady_clock::now()) {}

    ScopedTimer::~ScopedTimer() {
        if (!collector_) return;
        collector_->record(name_, std::chrono::duration_cast<std::chrono::nanoseconds>(
                                      std::chrono::steady_clock::now() - start_));
    }

    bool Instrumentation::attach(std::shared_ptr<Collector> collector,
                                 std::initializer_list<std::string_view> methods) {
        std::lock_guard<std::mutex> lk(mu_);
        if (collector_ != collector) {
            collector_ = std::move(collector);
            methods_.clear();
        }
        bool changed = false;
        for (auto m : methods) {
            changed = methods_.emplace(m).second || changed;
        }
        return changed;
    }

    void Instrumentation::detach() {
        std::lock_guard<std::mutex> lk(mu_);
        collector_.reset();
        methods_.clear();
    }

    ScopedTimer Instrumentation::time(std::string_view method) const {
        std::lock_guard<std::mutex> lk(mu_);
        if (!collector_ || methods_.find(method) == methods_.end()) return {};
        return ScopedTimer(collector_, owner_ + "." + std::string(method));
    }

    bool Instrumentation::wraps(std::string_view method) const {
        std::lock_guard<std::mutex> lk(mu_);
        return collector_ && methods_.find(method) != methods_.end();
    }

    void Collector::record(std::string_view name, std::chrono::nanoseconds elapsed) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = ops_.find(name);
        if (it == ops_.end()) it = ops_.emplace(std::string(name), OpStats{}).first;
        auto& s = it->second;
        s.count++;
        s.total += elapsed;
        s.max = std::max(s.max, elapsed);
    }

    bool Collector::wrap(Instrumentation& target, std::initializer_list<std::string_view> methods) {
        const bool changed = target.attach(shared_from_this(), methods);
        if (!changed) {
            spdlog::debug("Instrumentation for {} already in place", target.owner());
        }
        return changed;
    }

    std::map<std::string, OpStats> Collector::snapshot() const {
        std::lock_guard<std::mutex> lk(mu_);
        return {ops_.begin(), ops_.end()};
    }

    OpStats Collector::stats_for(std::string_view name) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = ops_.find(name);
        return it == ops_.end() ? OpStats{} : it->second;
    }

    void Collector::reset() {
        std::lock_guard<std::mutex> lk(mu_);
        ops_.clear();
    }

} // namespace didagent::stats
