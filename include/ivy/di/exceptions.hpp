#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace ivy::di {

/**
 * @brief Base class of every error raised by the container
 */
class DiError : public std::runtime_error {
public:
    explicit DiError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid registration or module setup
 */
class ConfigurationError : public DiError {
public:
    explicit ConfigurationError(const std::string& message)
        : DiError(message) {}
};

/**
 * @brief Base class of errors raised while resolving a service
 */
class ResolutionError : public DiError {
public:
    explicit ResolutionError(const std::string& message) : DiError(message) {}
};

class NotRegisteredError : public ResolutionError {
public:
    NotRegisteredError(std::string service_name, std::string key,
                       const std::string& message)
        : ResolutionError(message),
          service_name_(std::move(service_name)),
          key_(std::move(key)) {}

    const std::string& service_name() const { return service_name_; }

    // Empty for unkeyed lookups
    const std::string& key() const { return key_; }

private:
    std::string service_name_;
    std::string key_;
};

/**
 * @brief A scoped service was requested outside of a lifetime scope
 */
class LifetimeViolationError : public ResolutionError {
public:
    explicit LifetimeViolationError(const std::string& message)
        : ResolutionError(message) {}
};

class ConstructionError : public ResolutionError {
public:
    explicit ConstructionError(const std::string& message)
        : ResolutionError(message) {}
};

class PropertyInjectionError : public ResolutionError {
public:
    PropertyInjectionError(std::string property_name,
                           const std::string& message)
        : ResolutionError(message),
          property_name_(std::move(property_name)) {}

    const std::string& property_name() const { return property_name_; }

private:
    std::string property_name_;
};

/**
 * @brief A registration was reached again while it was still being resolved
 */
class CircularDependencyError : public ResolutionError {
public:
    explicit CircularDependencyError(std::vector<std::string> chain)
        : ResolutionError(build_message(chain)), chain_(std::move(chain)) {}

    /**
     * @brief Services on the resolution stack, outermost first, ending with
     * the service that closed the cycle
     */
    const std::vector<std::string>& chain() const { return chain_; }

private:
    static std::string build_message(const std::vector<std::string>& chain) {
        std::string message = "Circular dependency detected: ";
        for (size_t i = 0; i < chain.size(); ++i) {
            if (i > 0) {
                message += " -> ";
            }
            message += chain[i];
        }
        return message;
    }

    std::vector<std::string> chain_;
};

}  // namespace ivy::di
