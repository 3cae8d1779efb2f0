// ServiceLocator: RCU snapshot-swap over the binding map.
//   Readers: atomic_load (ACQUIRE), consistent and non-blocking.
//   Writers: copy current map, mutate, atomic_store (RELEASE).
// Old snapshots stay alive until the last reader drops its reference.

#include "didagent/config/injection_context.hpp"

#include <spdlog/spdlog.h>

namespace didagent::config {

std::shared_ptr<const ServiceLocator::Map> ServiceLocator::snapshot() const noexcept {
    return std::atomic_load_explicit(&map_, std::memory_order_acquire);
}

std::size_t ServiceLocator::size() const noexcept {
    auto snap = snapshot();
    return snap ? snap->size() : 0;
}

std::shared_ptr<void> ServiceLocator::lookup(std::type_index key) const noexcept {
    auto snap = snapshot();
    if (!snap) return nullptr;
    auto it = snap->find(key);
    return it == snap->end() ? nullptr : it->second;
}

void ServiceLocator::bind(std::type_index key, std::shared_ptr<void> instance, const char* name) {
    std::lock_guard<std::mutex> lk(writer_mu_);
    auto next = std::make_shared<Map>(*snapshot()); // copy-on-write
    const bool replaced = next->count(key) != 0;
    (*next)[key] = std::move(instance);
    std::shared_ptr<const Map> cnext = std::move(next);
    std::atomic_store_explicit(&map_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("{} instance for capability {}", replaced ? "Rebound" : "Bound", name);
}

bool ServiceLocator::unbind(std::type_index key) {
    std::lock_guard<std::mutex> lk(writer_mu_);
    auto snap = snapshot();
    if (!snap || snap->find(key) == snap->end()) return false;
    auto next = std::make_shared<Map>(*snap);
    next->erase(key);
    std::shared_ptr<const Map> cnext = std::move(next);
    std::atomic_store_explicit(&map_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

} // namespace didagent::config
