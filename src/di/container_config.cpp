#include "ivy/di/container_config.hpp"

#include <stdexcept>

namespace ivy::di {

void ContainerConfig::from_ptree(const boost::property_tree::ptree& pt) {
    allow_implicit_registration = get_value(pt, "allow_implicit_registration",
                                            allow_implicit_registration);
    max_resolution_depth =
        get_value(pt, "max_resolution_depth", max_resolution_depth);
    trace_resolution = get_value(pt, "trace_resolution", trace_resolution);
    load_vector(pt, "modules", modules);
}

void ContainerConfig::validate() const {
    if (max_resolution_depth <= 0) {
        throw std::invalid_argument(
            "Container max_resolution_depth must be greater than 0");
    }

    for (const auto& name : modules) {
        if (name.empty()) {
            throw std::invalid_argument("Container module names cannot be empty");
        }
    }
}

}  // namespace ivy::di
