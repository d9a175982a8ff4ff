#include "devicehost/config/config.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

#include "devicehost/log/logger.hpp"

namespace devicehost::config {

ConfigFormat format_from_path(const std::string& config_file) {
    std::string ext = std::filesystem::path(config_file).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (ext == ".json") return ConfigFormat::JSON;
    if (ext == ".ini") return ConfigFormat::INI;
    return ConfigFormat::YAML;
}

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
            pt.add_child("",
                         yaml_to_ptree(*it));  // Empty key for array elements
        }
    } else if (node.IsScalar()) {
        pt.put("", node.as<std::string>());
    }
    return pt;
}

void ConfigManager::load_config(const std::string& config_file,
                                ConfigFormat format) {
    DEVICEHOST_LOG_INFO << "Loading config file: " << config_file;

    if (!std::filesystem::exists(config_file)) {
        throw std::runtime_error("Config file not found: " + config_file);
    }

    try {
        boost::property_tree::ptree tree;
        switch (format) {
            case ConfigFormat::YAML: {
                YAML::Node yaml_node = YAML::LoadFile(config_file);
                tree = yaml_to_ptree(yaml_node);
                break;
            }
            case ConfigFormat::JSON: {
                std::ifstream ifs(config_file);
                boost::property_tree::read_json(ifs, tree);
                break;
            }
            case ConfigFormat::INI: {
                std::ifstream ifs(config_file);
                boost::property_tree::read_ini(ifs, tree);
                break;
            }
        }
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            config_tree_ = std::move(tree);
        }
        load_component_configs();
        DEVICEHOST_LOG_INFO << "Successfully loaded config file: "
                            << config_file;
    } catch (const std::exception& e) {
        DEVICEHOST_LOG_ERROR << "Failed to load config file: " << config_file
                             << ", Error: " << e.what();
        throw std::runtime_error("Failed to load config file: " + config_file +
                                 ", Error: " + e.what());
    }
}

void ConfigManager::load_yaml_string(const std::string& yaml_content) {
    try {
        auto tree = yaml_to_ptree(YAML::Load(yaml_content));
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            config_tree_ = std::move(tree);
        }
        load_component_configs();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Failed to parse YAML: ") +
                                 e.what());
    }
}

void ConfigManager::load_component_configs() {
    std::vector<std::shared_ptr<ConfigurationProperties>> targets;
    boost::property_tree::ptree tree;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        for (auto& [type_id, config] : configs_) {
            targets.push_back(config);
        }
        tree = config_tree_;
    }

    for (auto& config : targets) {
        const std::string properties_name = config->properties_name();
        auto subtree = tree.get_child_optional(properties_name);
        if (!subtree) {
            DEVICEHOST_LOG_WARN << "No configuration found for properties: "
                                << properties_name << ", using defaults";
            continue;
        }
        try {
            config->from_ptree(*subtree);
            config->validate();
            DEVICEHOST_LOG_DEBUG << "Loaded configuration for properties: "
                                 << properties_name;
        } catch (const std::exception& e) {
            DEVICEHOST_LOG_ERROR
                << "Failed to load configuration for properties "
                << properties_name << ": " << e.what();
            throw;
        }
    }
}

}  // namespace devicehost::config
