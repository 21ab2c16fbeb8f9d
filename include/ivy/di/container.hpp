#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <boost/any.hpp>

#include "ivy/di/container_config.hpp"
#include "ivy/di/interceptor.hpp"
#include "ivy/di/lifetime.hpp"
#include "ivy/di/registration.hpp"
#include "ivy/di/registration_store.hpp"
#include "ivy/di/resolution_context.hpp"
#include "ivy/di/service_key.hpp"
#include "ivy/di/type_builder.hpp"

namespace ivy::di {

class LifetimeScope;

/**
 * @brief Constructor arguments supplied by name for the top-level instance
 *
 * Values are passed to the constructor verbatim: a std::string parameter
 * takes std::string or const char*, a std::shared_ptr<U> parameter takes
 * exactly std::shared_ptr<U>.
 */
using ParameterOverrides = std::unordered_map<std::string, boost::any>;

/**
 * @brief Dependency injection container
 *
 * Holds registrations and builds object graphs on demand: constructor and
 * property injection driven by TypeInfo metadata, transient, singleton and
 * scoped lifetimes, keyed and open generic registrations, collections and
 * an interception chain. All operations are safe to call concurrently.
 */
class Container {
public:
    Container();
    explicit Container(std::shared_ptr<ContainerConfig> config);
    ~Container();

    Container(const Container&) = delete;
    Container& operator=(const Container&) = delete;

    // Descriptor API

    /**
     * @brief Map service to implementation
     * @throws ConfigurationError when implementation is not assignable to
     * service or only one of them is an open generic
     */
    void register_type(const TypeInfo& service, const TypeInfo& implementation,
                       ServiceLifetime lifetime = ServiceLifetime::TRANSIENT);

    /**
     * @brief Keyed mapping; keyed registrations are separate from the
     * unkeyed one
     * @throws ConfigurationError for the null key
     */
    void register_type(const TypeInfo& service, const TypeInfo& implementation,
                       ServiceLifetime lifetime, const ServiceKey& key);

    /**
     * @param instance pointer to an object of the service type
     */
    void register_instance(const TypeInfo& service,
                           std::shared_ptr<void> instance);

    void register_factory(const TypeInfo& service, Factory factory,
                          ServiceLifetime lifetime = ServiceLifetime::TRANSIENT);

    void register_factory(const TypeInfo& service, Factory factory,
                          ServiceLifetime lifetime, const ServiceKey& key);

    /**
     * @brief Map the interfaces of scanned types to the types themselves
     *
     * Every concrete candidate accepted by predicate contributes a transient
     * registration for each interface it implements that has no unkeyed
     * registration yet. Candidates are visited in source order, so the first
     * implementation of an interface wins.
     *
     * @return number of registrations added
     */
    size_t register_assembly_types(
        const TypeSource& source,
        const std::function<bool(const TypeInfo&)>& predicate = {});

    /**
     * @brief Resolve service, optionally keyed, within an optional scope
     * @return pointer to an object of the service type
     * @throws NotRegisteredError, LifetimeViolationError, ConstructionError,
     * PropertyInjectionError or CircularDependencyError
     */
    std::shared_ptr<void> resolve(const TypeInfo& service,
                                  LifetimeScope* scope = nullptr,
                                  const ServiceKey& key = {},
                                  const ParameterOverrides& overrides = {});

    /**
     * A closed generic counts as registered when its definition is and the
     * matching closed implementation has been described.
     */
    bool is_registered(const TypeInfo& service,
                       const ServiceKey& key = {}) const;

    // Typed API

    template <typename TService, typename TImplementation = TService>
    void register_type(ServiceLifetime lifetime = ServiceLifetime::TRANSIENT) {
        static_assert(
            std::is_base_of_v<TService, TImplementation> ||
                std::is_same_v<TService, TImplementation>,
            "Implementation must inherit from or be the same as Service");
        register_type(type_of<TService>(), type_of<TImplementation>(),
                      lifetime);
    }

    template <typename TService, typename TImplementation = TService>
    void register_type(ServiceLifetime lifetime, const ServiceKey& key) {
        static_assert(
            std::is_base_of_v<TService, TImplementation> ||
                std::is_same_v<TService, TImplementation>,
            "Implementation must inherit from or be the same as Service");
        register_type(type_of<TService>(), type_of<TImplementation>(),
                      lifetime, key);
    }

    /**
     * @brief Map every closed instance of TService to the matching instance
     * of TImplementation
     *
     * Closed implementations are found in the TypeRegistry; describe them
     * with reflect_types<>() or IVY_GENERIC_IMPLEMENTATIONS.
     */
    template <template <class...> class TService,
              template <class...> class TImplementation>
    void register_open_generic(
        ServiceLifetime lifetime = ServiceLifetime::TRANSIENT) {
        register_type(generic_definition_of<TService>(),
                      generic_definition_of<TImplementation>(), lifetime);
    }

    template <typename TService>
    void register_instance(std::shared_ptr<TService> instance) {
        register_instance(type_of<TService>(),
                          std::static_pointer_cast<void>(std::move(instance)));
    }

    template <typename TService>
    void register_factory(
        std::function<std::shared_ptr<TService>(Container&)> factory,
        ServiceLifetime lifetime = ServiceLifetime::TRANSIENT) {
        register_factory(type_of<TService>(), wrap_factory(std::move(factory)),
                         lifetime);
    }

    template <typename TService>
    void register_factory(
        std::function<std::shared_ptr<TService>(Container&)> factory,
        ServiceLifetime lifetime, const ServiceKey& key) {
        register_factory(type_of<TService>(), wrap_factory(std::move(factory)),
                         lifetime, key);
    }

    template <typename T>
    std::shared_ptr<T> resolve() {
        return std::static_pointer_cast<T>(resolve(type_of<T>()));
    }

    template <typename T>
    std::shared_ptr<T> resolve(const ServiceKey& key) {
        return std::static_pointer_cast<T>(resolve(type_of<T>(), nullptr, key));
    }

    template <typename T>
    std::shared_ptr<T> resolve(const ParameterOverrides& overrides) {
        return std::static_pointer_cast<T>(
            resolve(type_of<T>(), nullptr, {}, overrides));
    }

    /**
     * @brief Unkeyed registration of T, if any, followed by every keyed one
     */
    template <typename T>
    std::vector<std::shared_ptr<T>> resolve_all() {
        return *resolve<std::vector<std::shared_ptr<T>>>();
    }

    template <typename T>
    bool is_registered(const ServiceKey& key = {}) const {
        return is_registered(type_of<T>(), key);
    }

    std::unique_ptr<LifetimeScope> begin_scope();

    // Appends to the interception chain
    void add_interceptor(std::shared_ptr<IInterceptor> interceptor);

    const ContainerConfig& config() const { return *config_; }

    size_t registration_count() const { return store_.size(); }

private:
    template <typename TService>
    static Factory wrap_factory(
        std::function<std::shared_ptr<TService>(Container&)> factory) {
        if (!factory) {
            return nullptr;
        }
        return [factory = std::move(factory)](
                   Container& container) -> std::shared_ptr<void> {
            return std::static_pointer_cast<void>(factory(container));
        };
    }

    void add_registration(std::shared_ptr<Registration> registration);
    void add_keyed_registration(const ServiceKey& key,
                                std::shared_ptr<Registration> registration);

    std::shared_ptr<void> resolve_sequence(const TypeInfo& sequence,
                                           LifetimeScope* scope);

    std::shared_ptr<void> resolve_registration(
        const std::shared_ptr<Registration>& registration,
        ResolutionContext& context, LifetimeScope* scope,
        const ParameterOverrides& overrides);

    std::shared_ptr<void> construct(const Registration& registration,
                                    LifetimeScope* scope,
                                    const ParameterOverrides& overrides);

    void inject_properties(const TypeInfo& type,
                           const std::shared_ptr<void>& instance,
                           LifetimeScope* scope,
                           std::unordered_set<std::string>& injected);

    std::shared_ptr<void> apply_interceptors(const TypeInfo& service,
                                             std::shared_ptr<void> instance);

    std::shared_ptr<ContainerConfig> config_;
    RegistrationStore store_;

    mutable std::shared_mutex interceptors_mutex_;
    std::vector<std::shared_ptr<IInterceptor>> interceptors_;

    // Serializes first construction of singleton and scoped instances
    std::recursive_mutex construction_mutex_;
};

}  // namespace ivy::di
