// =================================================================
// include/Quill/ConfigParser.hpp
// =================================================================
// Defines the loader for the .quill/config.yml file.

#pragma once

#include <string>
#include <map>
#include <optional>
#include <vector>

namespace Quill {

class ConfigParser {
public:
    /**
     * @brief Constructs the parser and loads the configuration file.
     * @param config_path The path to the config.yml file. A missing file
     *        leaves the parser empty; a malformed one is logged and ignored.
     */
    explicit ConfigParser(const std::string& config_path);

    /**
     * @brief True when a configuration file was found and parsed.
     */
    bool isLoaded() const { return m_loaded; }

    /**
     * @brief Retrieves a scalar value for a given key.
     * @param key The configuration key (e.g., "cwd").
     * @return The corresponding value, or an empty string if not found.
     */
    std::string getStringValue(const std::string& key) const;

    /**
     * @brief Retrieves a boolean value ("true"/"false", "yes"/"no", "1"/"0").
     * @return The value, or std::nullopt if absent or not a boolean.
     */
    std::optional<bool> getBoolValue(const std::string& key) const;

    /**
     * @brief Retrieves a sequence of scalars; a single scalar yields one entry.
     */
    std::vector<std::string> getStringList(const std::string& key) const;

    bool hasKey(const std::string& key) const;

private:
    std::map<std::string, std::string> m_config_values;
    std::map<std::string, std::vector<std::string>> m_config_lists;
    bool m_loaded = false;
};

} // namespace Quill
