// =================================================================
// src/Quill/ConfigParser.cpp
// =================================================================
// Implementation for the YAML configuration loader.

#include "Quill/ConfigParser.hpp"
#include "Quill/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace Quill {

ConfigParser::ConfigParser(const std::string& config_path) {
    std::error_code ec;
    if (config_path.empty() || !std::filesystem::is_regular_file(config_path, ec)) {
        // It's okay if the file doesn't exist
        return;
    }

    try {
        YAML::Node root = YAML::LoadFile(config_path);
        if (!root.IsMap()) {
            if (!root.IsNull()) {
                Logger::getInstance().error("ConfigParser",
                    "Configuration root must be a mapping", config_path);
            }
            return;
        }

        for (YAML::const_iterator it = root.begin(); it != root.end(); ++it) {
            std::string key = it->first.as<std::string>();
            const YAML::Node& value = it->second;

            if (value.IsSequence()) {
                std::vector<std::string> items;
                for (const auto& item : value) {
                    items.push_back(item.as<std::string>());
                }
                m_config_lists[key] = items;
            } else if (value.IsScalar()) {
                m_config_values[key] = value.as<std::string>();
            } else if (!value.IsNull()) {
                Logger::getInstance().warning("ConfigParser",
                    "Ignoring nested configuration key", key);
            }
        }
        m_loaded = true;
        Logger::getInstance().debug("ConfigParser", "Loaded configuration", config_path);

    } catch (const YAML::Exception& e) {
        m_config_values.clear();
        m_config_lists.clear();
        Logger::getInstance().error("ConfigParser",
            "Failed to parse configuration file " + config_path, e.what());
    }
}

std::string ConfigParser::getStringValue(const std::string& key) const {
    auto it = m_config_values.find(key);
    if (it != m_config_values.end()) {
        return it->second;
    }
    return ""; // Return empty string if key not found
}

std::optional<bool> ConfigParser::getBoolValue(const std::string& key) const {
    auto it = m_config_values.find(key);
    if (it == m_config_values.end()) {
        return std::nullopt;
    }

    std::string value = it->second;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "true" || value == "yes" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "0") {
        return false;
    }
    Logger::getInstance().warning("ConfigParser", "Expected a boolean for '" + key + "'", it->second);
    return std::nullopt;
}

std::vector<std::string> ConfigParser::getStringList(const std::string& key) const {
    auto list = m_config_lists.find(key);
    if (list != m_config_lists.end()) {
        return list->second;
    }
    auto scalar = m_config_values.find(key);
    if (scalar != m_config_values.end() && !scalar->second.empty()) {
        return {scalar->second};
    }
    return {};
}

bool ConfigParser::hasKey(const std::string& key) const {
    return m_config_values.count(key) > 0 || m_config_lists.count(key) > 0;
}

} // namespace Quill
