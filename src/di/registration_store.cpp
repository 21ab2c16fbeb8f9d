#include "ivy/di/registration_store.hpp"

#include <iterator>
#include <mutex>

#include "ivy/di/exceptions.hpp"
#include "ivy/di/type_registry.hpp"
#include "ivy/log/logger.hpp"

namespace ivy::di {

std::shared_ptr<Registration> RegistrationStore::add(
    std::shared_ptr<Registration> registration) {
    std::unique_lock lock(mutex_);
    if (registration->service().is_generic_definition()) {
        drop_synthesized(registration->service().id());
    }
    auto& slot = services_[registration->service().id()];
    auto previous = std::move(slot);
    slot = std::move(registration);
    return previous;
}

std::shared_ptr<Registration> RegistrationStore::add_keyed(
    const ServiceKey& key, std::shared_ptr<Registration> registration) {
    if (key.is_null()) {
        throw ConfigurationError("Service key for '" +
                                 registration->service().name() +
                                 "' cannot be null");
    }

    std::unique_lock lock(mutex_);
    auto& keyed = keyed_[registration->service().id()];
    auto it = keyed.entries.find(key);
    if (it == keyed.entries.end()) {
        keyed.order.push_back(key);
        keyed.entries.emplace(key, std::move(registration));
        return nullptr;
    }
    auto previous = std::move(it->second);
    it->second = std::move(registration);
    return previous;
}

bool RegistrationStore::contains(const TypeInfo& service) const {
    std::shared_lock lock(mutex_);
    return services_.count(service.id()) > 0;
}

std::shared_ptr<Registration> RegistrationStore::find(
    const TypeInfo& service) const {
    std::shared_lock lock(mutex_);
    auto it = services_.find(service.id());
    return it != services_.end() ? it->second : nullptr;
}

std::shared_ptr<Registration> RegistrationStore::find_keyed(
    const TypeInfo& service, const ServiceKey& key) const {
    std::shared_lock lock(mutex_);
    auto it = keyed_.find(service.id());
    if (it == keyed_.end()) {
        return nullptr;
    }
    auto entry = it->second.entries.find(key);
    return entry != it->second.entries.end() ? entry->second : nullptr;
}

bool RegistrationStore::has_keyed(const TypeInfo& service) const {
    std::shared_lock lock(mutex_);
    auto it = keyed_.find(service.id());
    return it != keyed_.end() && !it->second.order.empty();
}

std::shared_ptr<Registration> RegistrationStore::find_cached(
    const TypeInfo& service) const {
    auto it = services_.find(service.id());
    if (it != services_.end()) {
        return it->second;
    }

    auto closed = closed_.find(service.id());
    if (closed != closed_.end()) {
        return closed->second;
    }

    auto implicit = implicit_.find(service.id());
    if (implicit != implicit_.end()) {
        return implicit->second;
    }
    return nullptr;
}

std::shared_ptr<Registration> RegistrationStore::close_open_generic(
    const TypeInfo& service) {
    auto open_it = services_.find(service.generic_definition_id());
    if (open_it == services_.end()) {
        return nullptr;
    }
    const auto& open = open_it->second;

    const TypeInfo* implementation = TypeRegistry::instance().close_generic(
        *open->implementation(), service.argument_ids());
    if (!implementation) {
        throw NotRegisteredError(
            service.name(), "",
            "No metadata for the implementation of '" + service.name() +
                "' from open generic registration " + open->description() +
                "; describe the closed implementation with reflect_types<>() "
                "or IVY_GENERIC_IMPLEMENTATIONS");
    }

    auto closed = std::make_shared<Registration>(service, *implementation,
                                                 open->lifetime());
    closed_[service.id()] = closed;
    IVY_LOG_DEBUG << "Closed open generic registration: "
                  << closed->description();
    return closed;
}

void RegistrationStore::drop_synthesized(std::type_index definition) {
    auto from_definition = [definition](const auto& entry) {
        return entry.second->service().generic_definition_id() == definition;
    };
    for (auto it = closed_.begin(); it != closed_.end();) {
        it = from_definition(*it) ? closed_.erase(it) : std::next(it);
    }
    for (auto it = implicit_.begin(); it != implicit_.end();) {
        it = from_definition(*it) ? implicit_.erase(it) : std::next(it);
    }
}

std::shared_ptr<Registration> RegistrationStore::lookup(
    const TypeInfo& service) {
    {
        std::shared_lock lock(mutex_);
        if (auto found = find_cached(service)) {
            return found;
        }
    }

    std::unique_lock lock(mutex_);
    if (auto found = find_cached(service)) {
        return found;
    }

    if (service.is_generic_instance()) {
        if (auto closed = close_open_generic(service)) {
            return closed;
        }
    }

    if (allow_implicit_ && service.is_class() && !service.is_abstract() &&
        !service.is_sequence() && !service.is_generic_definition()) {
        auto registration = std::make_shared<Registration>(
            service, service, ServiceLifetime::TRANSIENT);
        implicit_.emplace(service.id(), registration);
        IVY_LOG_DEBUG << "Implicit self-registration: "
                      << registration->description();
        return registration;
    }
    return nullptr;
}

std::vector<RegistrationStore::KeyedRegistration> RegistrationStore::keyed(
    const TypeInfo& service) const {
    std::shared_lock lock(mutex_);
    std::vector<KeyedRegistration> result;
    auto it = keyed_.find(service.id());
    if (it == keyed_.end()) {
        return result;
    }
    result.reserve(it->second.order.size());
    for (const auto& key : it->second.order) {
        result.emplace_back(key, it->second.entries.at(key));
    }
    return result;
}

size_t RegistrationStore::size() const {
    std::shared_lock lock(mutex_);
    size_t count = services_.size();
    for (const auto& [id, keyed] : keyed_) {
        count += keyed.order.size();
    }
    return count;
}

void RegistrationStore::clear() {
    std::unique_lock lock(mutex_);
    services_.clear();
    keyed_.clear();
    closed_.clear();
    implicit_.clear();
}

}  // namespace ivy::di
