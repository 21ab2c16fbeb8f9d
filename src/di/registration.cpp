#include "ivy/di/registration.hpp"

#include "ivy/di/exceptions.hpp"

namespace ivy::di {

Registration::Registration(const TypeInfo& service,
                           const TypeInfo& implementation,
                           ServiceLifetime lifetime)
    : service_(service), implementation_(&implementation), lifetime_(lifetime) {
    if (service.is_generic_definition()) {
        if (!implementation.is_generic_definition()) {
            throw ConfigurationError(
                "Implementation type must be open generic when service type '" +
                service.name() + "' is open generic, got '" +
                implementation.name() + "'");
        }
        return;
    }
    if (implementation.is_generic_definition()) {
        throw ConfigurationError("Open generic implementation '" +
                                 implementation.name() +
                                 "' cannot satisfy closed service '" +
                                 service.name() + "'");
    }

    auto path = implementation.find_upcast_path(service);
    if (!path) {
        throw ConfigurationError("Type '" + implementation.name() +
                                 "' does not implement service '" +
                                 service.name() + "'");
    }
    upcast_path_ = std::move(*path);
    constructor_ = implementation.greediest_constructor();
}

Registration::Registration(const TypeInfo& service, Factory factory,
                           ServiceLifetime lifetime)
    : service_(service),
      implementation_(nullptr),
      lifetime_(lifetime),
      factory_(std::move(factory)) {
    if (service.is_generic_definition()) {
        throw ConfigurationError("Open generic service '" + service.name() +
                                 "' requires an implementation type");
    }
    if (!factory_) {
        throw ConfigurationError("Factory for service '" + service.name() +
                                 "' cannot be empty");
    }
}

std::shared_ptr<Registration> Registration::for_instance(
    const TypeInfo& service, std::shared_ptr<void> instance) {
    if (service.is_generic_definition()) {
        throw ConfigurationError("Open generic service '" + service.name() +
                                 "' requires an implementation type");
    }
    if (!instance) {
        throw ConfigurationError("Instance registered for service '" +
                                 service.name() + "' cannot be null");
    }
    auto registration = std::make_shared<Registration>(
        service, service, ServiceLifetime::SINGLETON);
    registration->singleton_instance_ = std::move(instance);
    return registration;
}

std::shared_ptr<void> Registration::to_service(
    const std::shared_ptr<void>& implementation_instance) const {
    std::shared_ptr<void> instance = implementation_instance;
    for (const BaseInfo* base : upcast_path_) {
        instance = base->upcast(instance);
    }
    return instance;
}

std::shared_ptr<void> Registration::singleton_instance() const {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    return singleton_instance_;
}

void Registration::set_singleton_instance(std::shared_ptr<void> instance) {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (!singleton_instance_) {
        singleton_instance_ = std::move(instance);
    }
}

std::string Registration::description() const {
    std::string text = service_.name() + " -> ";
    text += implementation_ ? implementation_->name() : "<factory>";
    text += " (" + to_string(lifetime_) + ")";
    return text;
}

}  // namespace ivy::di
