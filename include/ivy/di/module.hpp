#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ivy::di {

class Container;
class ContainerConfig;

/**
 * Base interface for groups of related registrations.
 * A Module performs registration calls on the container it is loaded into
 * and has no resolution logic of its own.
 */
class Module {
public:
    virtual ~Module() = default;

    /**
     * Register the services provided by this Module.
     */
    virtual void load(Container& container) = 0;

    /**
     * Returns the name of this Module for identification and logging purposes.
     */
    virtual std::string name() const = 0;

    /**
     * Returns the names of Modules that must be loaded before this one.
     */
    virtual std::vector<std::string> depends_on() const { return {}; }
};

/**
 * Loads registered Modules into a container in dependency order, each at
 * most once.
 */
class ModuleManager {
public:
    /**
     * @throws ConfigurationError for a null Module or a duplicate name
     */
    void register_module(std::unique_ptr<Module> module);

    /**
     * Load every Module not loaded yet, dependencies first.
     *
     * When the container's configuration lists modules, only those and the
     * Modules they depend on are loaded.
     *
     * @throws ConfigurationError for an unknown dependency, a dependency
     * cycle or an unknown configured module
     */
    void load_all(Container& container);

    size_t module_count() const { return modules_.size(); }

    bool has_module(const std::string& name) const;

    bool is_loaded(const std::string& name) const;

private:
    std::vector<std::unique_ptr<Module>> modules_;
    std::unordered_map<std::string, size_t> module_name_to_index_;
    std::unordered_set<size_t> loaded_;

    std::vector<size_t> resolve_load_order(const ContainerConfig& config);

    void topological_sort(size_t module_index,
                          std::unordered_set<size_t>& visited,
                          std::unordered_set<size_t>& visiting,
                          std::vector<size_t>& order);
};

}  // namespace ivy::di
