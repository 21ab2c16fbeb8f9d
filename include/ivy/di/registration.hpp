#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "ivy/di/lifetime.hpp"
#include "ivy/di/type_info.hpp"

namespace ivy::di {

class Container;

/**
 * @brief Produces a service instance; the pointer must address the service
 * type itself
 */
using Factory = std::function<std::shared_ptr<void>(Container&)>;

/**
 * @brief How to produce one service: implementation or factory, lifetime
 * and the construction plan chosen when the registration was made
 *
 * Only the singleton slot changes after construction.
 */
class Registration {
public:
    /**
     * @brief Type-backed registration
     * @throws ConfigurationError when the implementation cannot stand in for
     * the service
     */
    Registration(const TypeInfo& service, const TypeInfo& implementation,
                 ServiceLifetime lifetime);

    /**
     * @brief Factory-backed registration
     * @throws ConfigurationError when factory is empty
     */
    Registration(const TypeInfo& service, Factory factory,
                 ServiceLifetime lifetime);

    /**
     * @brief Realized singleton around an existing instance
     * @throws ConfigurationError when instance is null
     */
    static std::shared_ptr<Registration> for_instance(
        const TypeInfo& service, std::shared_ptr<void> instance);

    Registration(const Registration&) = delete;
    Registration& operator=(const Registration&) = delete;

    const TypeInfo& service() const { return service_; }

    // nullptr for factory-backed registrations
    const TypeInfo* implementation() const { return implementation_; }

    ServiceLifetime lifetime() const { return lifetime_; }

    bool is_factory_backed() const { return static_cast<bool>(factory_); }
    const Factory& factory() const { return factory_; }

    bool is_open_generic() const { return service_.is_generic_definition(); }

    // Greediest constructor of the implementation, nullptr if it has none
    const ConstructorInfo* constructor() const { return constructor_; }

    // Converts a pointer to the implementation into a pointer to the service
    std::shared_ptr<void> to_service(
        const std::shared_ptr<void>& implementation_instance) const;

    std::shared_ptr<void> singleton_instance() const;
    void set_singleton_instance(std::shared_ptr<void> instance);

    std::string description() const;

private:
    const TypeInfo& service_;
    const TypeInfo* implementation_;
    ServiceLifetime lifetime_;
    Factory factory_;
    const ConstructorInfo* constructor_ = nullptr;
    UpcastPath upcast_path_;

    mutable std::mutex instance_mutex_;
    std::shared_ptr<void> singleton_instance_;
};

}  // namespace ivy::di
