#include "ivy/di/module.hpp"

#include "ivy/di/container.hpp"
#include "ivy/di/exceptions.hpp"
#include "ivy/log/logger.hpp"

namespace ivy::di {

void ModuleManager::register_module(std::unique_ptr<Module> module) {
    if (!module) {
        throw ConfigurationError("Cannot register null Module");
    }

    const std::string name = module->name();
    if (has_module(name)) {
        throw ConfigurationError("Module with name '" + name +
                                 "' already registered");
    }

    size_t index = modules_.size();
    module_name_to_index_[name] = index;
    modules_.push_back(std::move(module));

    IVY_LOG_DEBUG << "Registered Module: " << name;
}

bool ModuleManager::has_module(const std::string& name) const {
    return module_name_to_index_.find(name) != module_name_to_index_.end();
}

bool ModuleManager::is_loaded(const std::string& name) const {
    auto it = module_name_to_index_.find(name);
    return it != module_name_to_index_.end() && loaded_.count(it->second) > 0;
}

void ModuleManager::load_all(Container& container) {
    if (modules_.empty()) {
        IVY_LOG_INFO << "No Modules registered";
        return;
    }

    std::vector<size_t> load_order = resolve_load_order(container.config());

    size_t pending = 0;
    for (size_t index : load_order) {
        if (!loaded_.count(index)) {
            ++pending;
        }
    }
    IVY_LOG_INFO << "Loading " << pending << " Modules";

    for (size_t index : load_order) {
        if (loaded_.count(index)) {
            continue;
        }
        auto& module = modules_[index];

        try {
            IVY_LOG_INFO << "Loading Module: " << module->name();
            module->load(container);
            loaded_.insert(index);
        } catch (const std::exception& e) {
            IVY_LOG_ERROR << "Failed to load Module '" << module->name()
                          << "': " << e.what();
            throw;
        }
    }

    IVY_LOG_INFO << "All Modules loaded successfully";
}

std::vector<size_t> ModuleManager::resolve_load_order(
    const ContainerConfig& config) {
    std::vector<size_t> order;
    std::unordered_set<size_t> visited;
    std::unordered_set<size_t> visiting;

    if (config.modules.empty()) {
        for (size_t i = 0; i < modules_.size(); ++i) {
            topological_sort(i, visited, visiting, order);
        }
        return order;
    }

    for (const std::string& name : config.modules) {
        auto it = module_name_to_index_.find(name);
        if (it == module_name_to_index_.end()) {
            throw ConfigurationError("Configured Module is not registered: " +
                                     name);
        }
        topological_sort(it->second, visited, visiting, order);
    }
    return order;
}

void ModuleManager::topological_sort(size_t module_index,
                                     std::unordered_set<size_t>& visited,
                                     std::unordered_set<size_t>& visiting,
                                     std::vector<size_t>& order) {
    if (visiting.find(module_index) != visiting.end()) {
        throw ConfigurationError(
            "Circular dependency detected involving Module: " +
            modules_[module_index]->name());
    }

    if (visited.find(module_index) != visited.end()) {
        return;
    }

    visiting.insert(module_index);

    // Dependencies land in the order before their dependents
    for (const std::string& dep_name : modules_[module_index]->depends_on()) {
        auto it = module_name_to_index_.find(dep_name);
        if (it == module_name_to_index_.end()) {
            throw ConfigurationError("Module '" +
                                     modules_[module_index]->name() +
                                     "' depends on unknown Module: " + dep_name);
        }
        topological_sort(it->second, visited, visiting, order);
    }

    visiting.erase(module_index);
    visited.insert(module_index);
    order.push_back(module_index);
}

}  // namespace ivy::di
