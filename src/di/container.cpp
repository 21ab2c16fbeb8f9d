#include "ivy/di/container.hpp"

#include <boost/any.hpp>

#include "ivy/di/exceptions.hpp"
#include "ivy/di/lifetime_scope.hpp"
#include "ivy/di/type_registry.hpp"
#include "ivy/log/logger.hpp"

namespace ivy::di {

Container::Container() : Container(std::make_shared<ContainerConfig>()) {}

Container::Container(std::shared_ptr<ContainerConfig> config)
    : config_(config ? std::move(config)
                     : std::make_shared<ContainerConfig>()) {
    config_->validate();
    store_.set_allow_implicit(config_->allow_implicit_registration);
}

Container::~Container() = default;

void Container::add_registration(std::shared_ptr<Registration> registration) {
    auto description = registration->description();
    if (auto previous = store_.add(std::move(registration))) {
        IVY_LOG_WARN << "Replaced registration " << previous->description()
                     << " with " << description;
    } else {
        IVY_LOG_DEBUG << "Registered " << description;
    }
}

void Container::add_keyed_registration(
    const ServiceKey& key, std::shared_ptr<Registration> registration) {
    auto description = registration->description();
    if (auto previous = store_.add_keyed(key, std::move(registration))) {
        IVY_LOG_WARN << "Replaced registration " << previous->description()
                     << " with " << description << " for key '"
                     << key.to_string() << "'";
    } else {
        IVY_LOG_DEBUG << "Registered " << description << " with key '"
                      << key.to_string() << "'";
    }
}

void Container::register_type(const TypeInfo& service,
                              const TypeInfo& implementation,
                              ServiceLifetime lifetime) {
    add_registration(
        std::make_shared<Registration>(service, implementation, lifetime));
}

void Container::register_type(const TypeInfo& service,
                              const TypeInfo& implementation,
                              ServiceLifetime lifetime, const ServiceKey& key) {
    if (service.is_generic_definition()) {
        throw ConfigurationError("Open generic service '" + service.name() +
                                 "' cannot be registered with a key");
    }
    add_keyed_registration(
        key, std::make_shared<Registration>(service, implementation, lifetime));
}

void Container::register_instance(const TypeInfo& service,
                                  std::shared_ptr<void> instance) {
    add_registration(Registration::for_instance(service, std::move(instance)));
}

void Container::register_factory(const TypeInfo& service, Factory factory,
                                 ServiceLifetime lifetime) {
    add_registration(
        std::make_shared<Registration>(service, std::move(factory), lifetime));
}

void Container::register_factory(const TypeInfo& service, Factory factory,
                                 ServiceLifetime lifetime,
                                 const ServiceKey& key) {
    add_keyed_registration(
        key,
        std::make_shared<Registration>(service, std::move(factory), lifetime));
}

size_t Container::register_assembly_types(
    const TypeSource& source,
    const std::function<bool(const TypeInfo&)>& predicate) {
    size_t added = 0;
    for (const TypeInfo* type : source.types()) {
        if (!type->is_class() || type->is_abstract() ||
            type->is_generic_definition() || type->is_sequence()) {
            continue;
        }
        if (predicate && !predicate(*type)) {
            continue;
        }
        for (const TypeInfo* service : type->interfaces()) {
            if (store_.contains(*service)) {
                continue;
            }
            register_type(*service, *type, ServiceLifetime::TRANSIENT);
            ++added;
        }
    }
    IVY_LOG_INFO << "Assembly scan added " << added << " registrations";
    return added;
}

bool Container::is_registered(const TypeInfo& service,
                              const ServiceKey& key) const {
    if (!key.is_null()) {
        return store_.find_keyed(service, key) != nullptr;
    }
    if (store_.contains(service)) {
        return true;
    }
    if (service.is_generic_instance()) {
        // Only when the closed implementation can actually be produced
        const TypeInfo* definition = service.generic_definition();
        auto open = definition ? store_.find(*definition) : nullptr;
        return open && open->implementation() &&
               TypeRegistry::instance().close_generic(
                   *open->implementation(), service.argument_ids()) != nullptr;
    }
    return false;
}

std::unique_ptr<LifetimeScope> Container::begin_scope() {
    return std::make_unique<LifetimeScope>(*this);
}

void Container::add_interceptor(std::shared_ptr<IInterceptor> interceptor) {
    if (!interceptor) {
        throw ConfigurationError("Interceptor cannot be null");
    }
    std::unique_lock lock(interceptors_mutex_);
    interceptors_.push_back(std::move(interceptor));
}

std::shared_ptr<void> Container::resolve(const TypeInfo& service,
                                         LifetimeScope* scope,
                                         const ServiceKey& key,
                                         const ParameterOverrides& overrides) {
    ResolutionContext::Activation activation(
        static_cast<size_t>(config_->max_resolution_depth), scope);
    ResolutionContext& context = activation.context();
    if (!scope) {
        scope = context.scope();
    }

    if (config_->trace_resolution) {
        IVY_LOG_TRACE << "Resolving " << service.name()
                      << (key.is_null() ? "" : " [" + key.to_string() + "]")
                      << " at depth " << context.depth();
    }

    if (service.is_sequence() && key.is_null()) {
        return resolve_sequence(service, scope);
    }

    std::shared_ptr<Registration> registration;
    if (!key.is_null()) {
        registration = store_.find_keyed(service, key);
        if (!registration) {
            throw NotRegisteredError(service.name(), key.to_string(),
                                     "No registration found for service '" +
                                         service.name() + "' with key '" +
                                         key.to_string() + "'");
        }
    } else {
        registration = store_.lookup(service);
        if (!registration) {
            throw NotRegisteredError(
                service.name(), "",
                "Service '" + service.name() + "' is not registered");
        }
    }

    return resolve_registration(registration, context, scope, overrides);
}

std::shared_ptr<void> Container::resolve_sequence(const TypeInfo& sequence,
                                                  LifetimeScope* scope) {
    const TypeInfo& element = *sequence.sequence_element();
    std::vector<std::shared_ptr<void>> elements;

    std::shared_ptr<Registration> unkeyed;
    try {
        unkeyed = store_.lookup(element);
    } catch (const NotRegisteredError& e) {
        IVY_LOG_DEBUG << "Skipping unkeyed " << element.name()
                      << " in collection: " << e.what();
    }
    if (unkeyed) {
        elements.push_back(resolve(element, scope));
    }

    for (const auto& keyed : store_.keyed(element)) {
        elements.push_back(resolve(element, scope, keyed.first));
    }

    return sequence.make_sequence(elements);
}

std::shared_ptr<void> Container::resolve_registration(
    const std::shared_ptr<Registration>& registration,
    ResolutionContext& context, LifetimeScope* scope,
    const ParameterOverrides& overrides) {
    if (registration->is_open_generic()) {
        throw ConstructionError("Cannot create an instance of open generic " +
                                registration->service().name());
    }

    switch (registration->lifetime()) {
        case ServiceLifetime::SINGLETON: {
            if (auto instance = registration->singleton_instance()) {
                return instance;
            }
            ResolutionGuard guard(context, registration.get());
            std::lock_guard<std::recursive_mutex> lock(construction_mutex_);
            if (auto instance = registration->singleton_instance()) {
                return instance;
            }
            registration->set_singleton_instance(
                construct(*registration, scope, overrides));
            IVY_LOG_DEBUG << "Created singleton " << registration->description();
            return registration->singleton_instance();
        }
        case ServiceLifetime::SCOPED: {
            if (!scope) {
                throw LifetimeViolationError(
                    "Attempting to resolve scoped service '" +
                    registration->service().name() +
                    "' outside of a lifetime scope");
            }
            if (auto instance = scope->find_instance(*registration)) {
                return instance;
            }
            ResolutionGuard guard(context, registration.get());
            std::lock_guard<std::recursive_mutex> lock(construction_mutex_);
            if (auto instance = scope->find_instance(*registration)) {
                return instance;
            }
            return scope->add_instance(
                registration, construct(*registration, scope, overrides));
        }
        case ServiceLifetime::TRANSIENT:
            break;
    }

    ResolutionGuard guard(context, registration.get());
    return construct(*registration, scope, overrides);
}

std::shared_ptr<void> Container::construct(
    const Registration& registration, LifetimeScope* scope,
    const ParameterOverrides& overrides) {
    const TypeInfo& service = registration.service();

    if (registration.is_factory_backed()) {
        std::shared_ptr<void> instance;
        try {
            instance = registration.factory()(*this);
        } catch (const DiError&) {
            throw;
        } catch (const std::exception& e) {
            throw ConstructionError("Factory for '" + service.name() +
                                    "' failed: " + e.what());
        }
        if (!instance) {
            throw ConstructionError("Factory for '" + service.name() +
                                    "' returned null");
        }
        return apply_interceptors(service, std::move(instance));
    }

    const TypeInfo& implementation = *registration.implementation();
    const ConstructorInfo* constructor = registration.constructor();
    if (!constructor) {
        throw ConstructionError("No public constructors found for type '" +
                                implementation.name() + "'");
    }

    Arguments arguments;
    arguments.reserve(constructor->parameters.size());
    for (const auto& parameter : constructor->parameters) {
        if (!parameter.name.empty()) {
            auto it = overrides.find(parameter.name);
            if (it != overrides.end()) {
                arguments.push_back(it->second);
                continue;
            }
        }
        const TypeInfo& type = parameter.type();
        arguments.push_back(type.box(resolve(type, scope)));
    }

    std::shared_ptr<void> instance;
    try {
        instance = constructor->invoke(arguments);
    } catch (const boost::bad_any_cast&) {
        throw ConstructionError("Argument type mismatch while constructing '" +
                                implementation.name() + "'");
    } catch (const DiError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConstructionError("Constructor of '" + implementation.name() +
                                "' failed: " + e.what());
    }

    std::unordered_set<std::string> injected;
    inject_properties(implementation, instance, scope, injected);

    return apply_interceptors(service, registration.to_service(instance));
}

void Container::inject_properties(const TypeInfo& type,
                                  const std::shared_ptr<void>& instance,
                                  LifetimeScope* scope,
                                  std::unordered_set<std::string>& injected) {
    for (const auto& property : type.properties()) {
        if (!injected.insert(property.name).second) {
            continue;
        }
        try {
            const TypeInfo& property_type = property.type();
            boost::any value = property_type.box(resolve(property_type, scope));
            property.assign(instance, value);
        } catch (const CircularDependencyError&) {
            throw;
        } catch (const ResolutionError& e) {
            throw PropertyInjectionError(
                property.name, "Failed to inject property '" + property.name +
                                   "' of '" + type.name() + "': " + e.what());
        } catch (const boost::bad_any_cast&) {
            throw PropertyInjectionError(
                property.name, "Type mismatch injecting property '" +
                                   property.name + "' of '" + type.name() +
                                   "'");
        }
    }

    for (const auto& base : type.bases()) {
        inject_properties(base.type(), base.upcast(instance), scope, injected);
    }
}

std::shared_ptr<void> Container::apply_interceptors(
    const TypeInfo& service, std::shared_ptr<void> instance) {
    std::vector<std::shared_ptr<IInterceptor>> chain;
    {
        std::shared_lock lock(interceptors_mutex_);
        chain = interceptors_;
    }
    for (const auto& interceptor : chain) {
        instance = interceptor->intercept(service, std::move(instance));
        if (!instance) {
            throw ConstructionError("Interceptor returned null for '" +
                                    service.name() + "'");
        }
    }
    return instance;
}

}  // namespace ivy::di
