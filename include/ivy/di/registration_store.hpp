#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ivy/di/registration.hpp"
#include "ivy/di/service_key.hpp"

namespace ivy::di {

/**
 * @brief Registrations indexed by service type and by (service type, key)
 *
 * A later registration for the same service or (service, key) replaces the
 * earlier one. Keyed registrations keep the order in which their key was
 * first added.
 */
class RegistrationStore {
public:
    using KeyedRegistration =
        std::pair<ServiceKey, std::shared_ptr<Registration>>;

    /**
     * @brief Add or replace the unkeyed registration of its service
     *
     * Registering a generic definition drops every closed and implicit
     * registration synthesized for its instances.
     *
     * @return the registration that was replaced, if any
     */
    std::shared_ptr<Registration> add(std::shared_ptr<Registration> registration);

    /**
     * @return the registration that was replaced, if any
     * @throws ConfigurationError for the null key
     */
    std::shared_ptr<Registration> add_keyed(
        const ServiceKey& key, std::shared_ptr<Registration> registration);

    bool contains(const TypeInfo& service) const;

    // Exact unkeyed match only; nullptr when absent
    std::shared_ptr<Registration> find(const TypeInfo& service) const;

    std::shared_ptr<Registration> find_keyed(const TypeInfo& service,
                                             const ServiceKey& key) const;

    bool has_keyed(const TypeInfo& service) const;

    /**
     * @brief Registration that serves an unkeyed request
     *
     * Tries an exact match, then a registration of the generic definition
     * closed over the requested arguments, then an implicit transient
     * self-registration for concrete classes when allowed. Synthesized
     * registrations are cached so that repeated lookups return the same
     * object.
     *
     * @return nullptr when nothing applies
     * @throws NotRegisteredError when an open generic registration matches but
     * the closed implementation was never described
     */
    std::shared_ptr<Registration> lookup(const TypeInfo& service);

    // Keyed registrations of service in key insertion order
    std::vector<KeyedRegistration> keyed(const TypeInfo& service) const;

    size_t size() const;

    void clear();

    void set_allow_implicit(bool allow) {
        std::unique_lock lock(mutex_);
        allow_implicit_ = allow;
    }
    bool allow_implicit() const {
        std::shared_lock lock(mutex_);
        return allow_implicit_;
    }

private:
    struct KeyedEntries {
        std::vector<ServiceKey> order;
        std::unordered_map<ServiceKey, std::shared_ptr<Registration>> entries;
    };

    std::shared_ptr<Registration> find_cached(const TypeInfo& service) const;
    std::shared_ptr<Registration> close_open_generic(const TypeInfo& service);
    void drop_synthesized(std::type_index definition);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::shared_ptr<Registration>> services_;
    std::unordered_map<std::type_index, KeyedEntries> keyed_;

    // Closed registrations synthesized from open generic ones
    std::unordered_map<std::type_index, std::shared_ptr<Registration>> closed_;

    // Implicit self-registrations
    std::unordered_map<std::type_index, std::shared_ptr<Registration>> implicit_;

    bool allow_implicit_ = true;
};

}  // namespace ivy::di
