#include "ivy/config/config.hpp"

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <filesystem>
#include <fstream>

#include "ivy/log/logger.hpp"

namespace ivy::config {

boost::property_tree::ptree ConfigManager::yaml_to_ptree(
    const YAML::Node& node) {
    boost::property_tree::ptree pt;
    if (node.IsMap()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.add_child(it->first.as<std::string>(),
                         yaml_to_ptree(it->second));
        }
    } else if (node.IsSequence()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.push_back(std::make_pair("", yaml_to_ptree(*it)));
        }
    } else if (node.IsScalar()) {
        pt.put_value(node.as<std::string>());
    }
    return pt;
}

boost::property_tree::ptree ConfigManager::read_tree(const std::string& file,
                                                     ConfigFormat format) {
    boost::property_tree::ptree tree;
    switch (format) {
        case ConfigFormat::YAML: {
            YAML::Node yaml_node = YAML::LoadFile(file);
            tree = yaml_to_ptree(yaml_node);
            break;
        }
        case ConfigFormat::JSON: {
            std::ifstream ifs(file);
            if (!ifs) {
                throw std::runtime_error("Cannot open " + file);
            }
            boost::property_tree::read_json(ifs, tree);
            break;
        }
        case ConfigFormat::INI: {
            std::ifstream ifs(file);
            if (!ifs) {
                throw std::runtime_error("Cannot open " + file);
            }
            boost::property_tree::read_ini(ifs, tree);
            break;
        }
    }
    return tree;
}

void ConfigManager::load_config(const std::string& config_file,
                                ConfigFormat format) {
    IVY_LOG_INFO << "Loading config file: " << config_file;

    try {
        auto tree = read_tree(config_file, format);
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            config_tree_ = std::move(tree);
        }
        load_component_configs();
        IVY_LOG_INFO << "Successfully loaded config file: " << config_file;
    } catch (const std::exception& e) {
        IVY_LOG_ERROR << "Failed to load config file: " << config_file
                      << ", Error: " << e.what();
        throw std::runtime_error("Failed to load config file: " + config_file +
                                 ", Error: " + e.what());
    }
}

void ConfigManager::load_config_with_profile(const std::string& base_file,
                                             const std::string& profile,
                                             ConfigFormat format) {
    boost::property_tree::ptree base_ptree;
    try {
        base_ptree = read_tree(base_file, format);
        IVY_LOG_INFO << "Loaded base configuration: " << base_file;
    } catch (const std::exception& e) {
        IVY_LOG_ERROR << "Failed to load base config: " << base_file
                      << ", Error: " << e.what();
        throw std::runtime_error("Failed to load base config: " +
                                 std::string(e.what()));
    }

    if (!profile.empty()) {
        std::string profile_file =
            ConfigPaths::get_profile_config_file(profile);
        auto base_dir = std::filesystem::path(base_file).parent_path();
        if (!base_dir.empty()) {
            profile_file =
                (base_dir / std::filesystem::path(profile_file).filename())
                    .string();
        }

        if (!std::filesystem::exists(profile_file)) {
            throw std::runtime_error("Profile config file not found: " +
                                     profile_file);
        }

        try {
            auto profile_ptree = read_tree(profile_file, format);
            IVY_LOG_INFO << "Loaded profile configuration: " << profile_file;
            base_ptree = merge_ptrees(base_ptree, profile_ptree);
        } catch (const std::exception& e) {
            IVY_LOG_ERROR << "Failed to load profile config: " << profile_file
                          << ", Error: " << e.what();
            throw std::runtime_error("Failed to load profile config: " +
                                     profile_file + ", Error: " + e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_tree_ = std::move(base_ptree);
    }
    load_component_configs();
    IVY_LOG_INFO << "Configuration loaded successfully"
                 << (profile.empty() ? "" : " with profile: " + profile);
}

boost::property_tree::ptree ConfigManager::merge_ptrees(
    const boost::property_tree::ptree& base,
    const boost::property_tree::ptree& override) {
    boost::property_tree::ptree result = base;

    for (const auto& item : override) {
        if (result.count(item.first) && !item.second.empty() &&
            !result.get_child(item.first).empty()) {
            result.put_child(
                item.first,
                merge_ptrees(result.get_child(item.first), item.second));
        } else {
            result.put_child(item.first, item.second);
        }
    }

    return result;
}

void ConfigManager::load_component_configs() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    for (auto& [type_id, config] : configs_) {
        const std::string& properties_name = config->properties_name();

        try {
            config->from_ptree(config_tree_.get_child(properties_name));
            config->validate();
            IVY_LOG_DEBUG << "Loaded configuration for properties: "
                          << properties_name;
        } catch (const boost::property_tree::ptree_bad_path& e) {
            IVY_LOG_WARN << "No configuration found for properties: "
                         << properties_name
                         << ", using defaults. Error: " << e.what();
        } catch (const std::exception& e) {
            IVY_LOG_ERROR << "Failed to load configuration for properties "
                          << properties_name << ": " << e.what();
            throw;
        }
    }
}

}  // namespace ivy::config
