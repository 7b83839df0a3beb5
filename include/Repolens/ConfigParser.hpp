// =================================================================
// include/Repolens/ConfigParser.hpp
// =================================================================
// Defines a reader for the .repolens/config.yml file.

#pragma once

#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <string>
#include <vector>

namespace Repolens {

/**
 * @brief Read-only view of a YAML configuration file
 *
 * Keys are dotted paths into nested maps, e.g. "scan.workers". A missing
 * file is not an error and behaves like an empty document.
 */
class ConfigParser {
public:
    /**
     * @brief Constructs the parser and loads the configuration file.
     * @param config_path The path to the config.yml file.
     * @throws std::runtime_error if the file exists but is not valid YAML.
     */
    explicit ConfigParser(const std::string& config_path);

    /**
     * @brief Whether a configuration file was found and loaded.
     */
    bool isLoaded() const { return m_loaded; }

    const std::string& getPath() const { return m_path; }

    bool hasKey(const std::string& key) const;

    /**
     * @brief Retrieves a string value for a given key.
     * @return The corresponding value, or an empty string if not found.
     */
    std::string getStringValue(const std::string& key) const;

    /**
     * @brief Retrieves a list of strings; a single scalar becomes a one-element list.
     * @return The values, or an empty vector if not found.
     */
    std::vector<std::string> getStringList(const std::string& key) const;

    /**
     * @brief Retrieves an unsigned integer value.
     * @throws std::runtime_error if the value is present but not an unsigned integer.
     */
    std::uintmax_t getUnsignedValue(const std::string& key, std::uintmax_t default_value) const;

    /**
     * @brief Retrieves a boolean value (true/false, yes/no, on/off).
     * @throws std::runtime_error if the value is present but not a boolean.
     */
    bool getBoolValue(const std::string& key, bool default_value) const;

private:
    std::string m_path;
    YAML::Node m_root;
    bool m_loaded;

    bool lookup(const std::string& key, YAML::Node& node) const;
};

} // namespace Repolens
