#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "ivy/di/container.hpp"

namespace ivy::di {

/**
 * @brief Unit of work owning the scoped instances resolved through it
 *
 * Created by Container::begin_scope(). Registration calls are forwarded to
 * the container; resolutions run with this scope active. Scoped instances
 * are released when the scope is destroyed.
 */
class LifetimeScope {
public:
    explicit LifetimeScope(Container& container);
    ~LifetimeScope();

    LifetimeScope(const LifetimeScope&) = delete;
    LifetimeScope& operator=(const LifetimeScope&) = delete;

    Container& container() { return container_; }

    template <typename TService, typename TImplementation = TService>
    void register_type(ServiceLifetime lifetime = ServiceLifetime::TRANSIENT) {
        container_.register_type<TService, TImplementation>(lifetime);
    }

    template <typename TService, typename TImplementation = TService>
    void register_type(ServiceLifetime lifetime, const ServiceKey& key) {
        container_.register_type<TService, TImplementation>(lifetime, key);
    }

    template <template <class...> class TService,
              template <class...> class TImplementation>
    void register_open_generic(
        ServiceLifetime lifetime = ServiceLifetime::TRANSIENT) {
        container_.register_open_generic<TService, TImplementation>(lifetime);
    }

    template <typename TService>
    void register_instance(std::shared_ptr<TService> instance) {
        container_.register_instance<TService>(std::move(instance));
    }

    template <typename TService>
    void register_factory(
        std::function<std::shared_ptr<TService>(Container&)> factory,
        ServiceLifetime lifetime = ServiceLifetime::TRANSIENT) {
        container_.register_factory<TService>(std::move(factory), lifetime);
    }

    std::shared_ptr<void> resolve(const TypeInfo& service,
                                  const ServiceKey& key = {},
                                  const ParameterOverrides& overrides = {}) {
        return container_.resolve(service, this, key, overrides);
    }

    template <typename T>
    std::shared_ptr<T> resolve() {
        return std::static_pointer_cast<T>(resolve(type_of<T>()));
    }

    template <typename T>
    std::shared_ptr<T> resolve(const ServiceKey& key) {
        return std::static_pointer_cast<T>(resolve(type_of<T>(), key));
    }

    template <typename T>
    std::shared_ptr<T> resolve(const ParameterOverrides& overrides) {
        return std::static_pointer_cast<T>(
            resolve(type_of<T>(), {}, overrides));
    }

    template <typename T>
    std::vector<std::shared_ptr<T>> resolve_all() {
        return *resolve<std::vector<std::shared_ptr<T>>>();
    }

    std::shared_ptr<void> find_instance(const Registration& registration) const;

    /**
     * @brief Cache the instance built for registration in this scope
     * @return the instance already cached for it, if another one won, else
     * instance
     */
    std::shared_ptr<void> add_instance(
        std::shared_ptr<Registration> registration,
        std::shared_ptr<void> instance);

    size_t instance_count() const;

private:
    struct Entry {
        std::shared_ptr<Registration> registration;
        std::shared_ptr<void> instance;
    };

    Container& container_;
    mutable std::mutex mutex_;
    std::unordered_map<const Registration*, Entry> instances_;
};

}  // namespace ivy::di
