#pragma once

#include <string>
#include <vector>

#include "ivy/config/config.hpp"

namespace ivy::di {

/**
 * @brief Container settings, section "container"
 */
class ContainerConfig : public config::ConfigurationProperties {
public:
    // Synthesize transient self-registrations for unregistered concrete types
    bool allow_implicit_registration = true;

    // Upper bound on nested resolutions within one resolve call
    int max_resolution_depth = 128;

    // Log every resolution step at trace level
    bool trace_resolution = false;

    // Modules loaded by ModuleManager::load_all; empty loads every module
    std::vector<std::string> modules;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "container"; }
};

}  // namespace ivy::di
