#pragma once

#include <string>

namespace ivy::di {

/**
 * @brief Service lifetime
 */
enum class ServiceLifetime {
    TRANSIENT,  // New instance every time
    SINGLETON,  // Single instance for the container
    SCOPED      // Single instance per lifetime scope
};

inline std::string to_string(ServiceLifetime lifetime) {
    switch (lifetime) {
        case ServiceLifetime::TRANSIENT:
            return "transient";
        case ServiceLifetime::SINGLETON:
            return "singleton";
        case ServiceLifetime::SCOPED:
            return "scoped";
    }
    return "unknown";
}

}  // namespace ivy::di
