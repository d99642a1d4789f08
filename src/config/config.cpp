#include "btoon/config/config.hpp"

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <fstream>
#include <stdexcept>

#include "btoon/log/logger.hpp"

namespace btoon::config {

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
            pt.add_child("", yaml_to_ptree(*it));
        }
    } else if (node.IsScalar()) {
        pt.put("", node.as<std::string>());
    }
    return pt;
}

boost::property_tree::ptree ConfigManager::parse_file(
    const std::string& config_file, ConfigFormat format) {
    boost::property_tree::ptree tree;
    switch (format) {
        case ConfigFormat::YAML: {
            YAML::Node yaml_node = YAML::LoadFile(config_file);
            tree = yaml_to_ptree(yaml_node);
            break;
        }
        case ConfigFormat::JSON: {
            std::ifstream ifs(config_file);
            if (!ifs) {
                throw std::runtime_error("Cannot open " + config_file);
            }
            boost::property_tree::read_json(ifs, tree);
            break;
        }
        case ConfigFormat::INI: {
            std::ifstream ifs(config_file);
            if (!ifs) {
                throw std::runtime_error("Cannot open " + config_file);
            }
            boost::property_tree::read_ini(ifs, tree);
            break;
        }
    }
    return tree;
}

void ConfigManager::load_config(const std::string& config_file,
                                ConfigFormat format) {
    BTOON_LOG_INFO << "Loading config file: " << config_file;

    try {
        auto tree = parse_file(config_file, format);
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_tree_ = std::move(tree);
        load_component_configs();
        BTOON_LOG_INFO << "Successfully loaded config file: " << config_file;
    } catch (const std::exception& e) {
        BTOON_LOG_ERROR << "Failed to load config file: " << config_file
                        << ", Error: " << e.what();
        throw std::runtime_error("Failed to load config file: " + config_file +
                                 ", Error: " + e.what());
    }
}

void ConfigManager::load_component_configs() {
    for (auto& [type_id, config] : configs_) {
        const std::string properties_name = config->properties_name();
        auto subtree = config_tree_.get_child_optional(properties_name);
        if (!subtree) {
            BTOON_LOG_DEBUG << "No configuration found for properties: "
                            << properties_name << ", using defaults";
            continue;
        }

        try {
            config->from_ptree(*subtree);
            config->validate();
            BTOON_LOG_DEBUG << "Loaded configuration for properties: "
                            << properties_name;
        } catch (const std::exception& e) {
            BTOON_LOG_ERROR << "Failed to load configuration for properties "
                            << properties_name << ": " << e.what();
            throw;
        }
    }
}

void ConfigManager::reload_config(const std::string& config_file,
                                  ConfigFormat format) {
    BTOON_LOG_INFO << "Attempting to reload config from: " << config_file;

    boost::property_tree::ptree new_config_tree;
    try {
        new_config_tree = parse_file(config_file, format);
    } catch (const std::exception& e) {
        BTOON_LOG_ERROR << "Failed to parse new config file, aborting reload: "
                        << e.what();
        return;
    }

    // Populate and validate clones first so a bad file changes nothing.
    std::unordered_map<std::type_index,
                       std::shared_ptr<ConfigurationProperties>>
        validated_new_configs;
    try {
        std::lock_guard<std::mutex> lock(config_mutex_);
        for (const auto& [type_id, current_config] : configs_) {
            if (!current_config->supports_hot_reload()) {
                continue;
            }

            auto new_config_clone = current_config->clone();
            if (auto subtree = new_config_tree.get_child_optional(
                    new_config_clone->properties_name())) {
                new_config_clone->from_ptree(*subtree);
            }
            new_config_clone->validate();
            validated_new_configs[type_id] = std::move(new_config_clone);
        }
    } catch (const std::exception& e) {
        BTOON_LOG_ERROR
            << "Failed to validate new configuration, aborting reload: "
            << e.what();
        return;
    }

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_tree_ = new_config_tree;
        for (const auto& [type_id, new_config] : validated_new_configs) {
            configs_[type_id] = new_config;
        }
        BTOON_LOG_INFO << "Successfully applied new configuration.";
    }

    std::vector<std::pair<ReloadCallback,
                          std::shared_ptr<const ConfigurationProperties>>>
        callbacks_to_run;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        for (const auto& [type_id, new_config] : validated_new_configs) {
            auto it = reload_subscribers_.find(type_id);
            if (it != reload_subscribers_.end()) {
                for (const auto& callback : it->second) {
                    callbacks_to_run.push_back({callback, new_config});
                }
            }
        }
    }

    for (const auto& [callback, config_ptr] : callbacks_to_run) {
        try {
            callback(*config_ptr);
        } catch (const std::exception& e) {
            BTOON_LOG_ERROR
                << "Exception in config reload callback for properties '"
                << config_ptr->properties_name() << "': " << e.what();
        }
    }
}

}  // namespace btoon::config
