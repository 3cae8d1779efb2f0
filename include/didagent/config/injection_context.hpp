#pragma once
/**
 * @file injection_context.hpp
 * @brief Settings + service locator shared by the conductor and its collaborators.
 *
 * Concurrency model for the locator: RCU via atomic shared_ptr snapshot swap.
 *   - Bindings are written during setup/start and read from every worker thread.
 *   - Readers take a snapshot (ACQUIRE) and never block.
 *   - Writers copy the whole map, insert, and publish (RELEASE); writers are
 *     serialized by a mutex so concurrent binds do not lose each other.
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "didagent/config/settings.hpp"

namespace didagent::config {

/// Raised when a required capability has no binding.
class InjectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @class ServiceLocator
 *  @brief Capability type -> singleton instance.
 */
class ServiceLocator final {
public:
    using Map = std::unordered_map<std::type_index, std::shared_ptr<void>>;

    /// Bind (or rebind) @p instance under capability @p Capability.
    template <class Capability>
    void bind_instance(std::shared_ptr<Capability> instance) {
        bind(std::type_index(typeid(Capability)), std::static_pointer_cast<void>(std::move(instance)),
             typeid(Capability).name());
    }

    /**
     * @brief Fetch the instance bound under @p Capability.
     * @param required Throw InjectionError instead of returning null when unbound.
     */
    template <class Capability>
    std::shared_ptr<Capability> inject(bool required = true) const {
        auto p = lookup(std::type_index(typeid(Capability)));
        if (!p) {
            if (required) {
                throw InjectionError(std::string("No instance bound for capability ") + typeid(Capability).name());
            }
            return nullptr;
        }
        return std::static_pointer_cast<Capability>(std::move(p));
    }

    /// Remove a binding. Returns true if one existed.
    template <class Capability>
    bool clear_binding() { return unbind(std::type_index(typeid(Capability))); }

    /// Consistent view of all bindings.
    std::shared_ptr<const Map> snapshot() const noexcept;

    [[nodiscard]] std::size_t size() const noexcept;

    /// Monotonic version counter. Increments on every successful mutation.
    [[nodiscard]] std::uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

private:
    void bind(std::type_index key, std::shared_ptr<void> instance, const char* name);
    bool unbind(std::type_index key);
    std::shared_ptr<void> lookup(std::type_index key) const noexcept;

    std::shared_ptr<const Map> map_{std::make_shared<Map>()};
    std::atomic<std::uint64_t> version_{0};
    std::mutex writer_mu_;
};

/** @class InjectionContext
 *  @brief Immutable settings plus the service locator.
 */
class InjectionContext {
public:
    explicit InjectionContext(Settings settings) : settings_(std::move(settings)) {}

    InjectionContext(const InjectionContext&)            = delete;
    InjectionContext& operator=(const InjectionContext&) = delete;

    [[nodiscard]] const Settings& settings() const noexcept { return settings_; }

    ServiceLocator&       injector() noexcept { return injector_; }
    const ServiceLocator& injector() const noexcept { return injector_; }

    template <class Capability>
    std::shared_ptr<Capability> inject(bool required = true) const {
        return injector_.template inject<Capability>(required);
    }

private:
    const Settings settings_;
    ServiceLocator injector_;
};

} // namespace didagent::config
