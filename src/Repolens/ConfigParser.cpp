// =================================================================
// src/Repolens/ConfigParser.cpp
// =================================================================
// Implementation for the YAML configuration reader.

#include "Repolens/ConfigParser.hpp"
#include "Repolens/Logger.hpp"
#include <fstream>
#include <stdexcept>

namespace Repolens {

ConfigParser::ConfigParser(const std::string& config_path)
    : m_path(config_path),
      m_loaded(false)
{
    std::ifstream config_file(config_path);
    if (!config_file.is_open()) {
        // It's okay if the file doesn't exist; defaults apply.
        return;
    }

    try {
        m_root = YAML::Load(config_file);
        m_loaded = true;
    } catch (const YAML::Exception& e) {
        Logger::getInstance().error("ConfigParser", "Failed to parse configuration file",
                                    config_path + ": " + e.what());
        throw std::runtime_error("Invalid configuration file " + config_path + ": " + e.what());
    }
}

bool ConfigParser::hasKey(const std::string& key) const {
    YAML::Node node;
    return lookup(key, node);
}

std::string ConfigParser::getStringValue(const std::string& key) const {
    YAML::Node node;
    if (!lookup(key, node) || node.IsNull()) {
        return "";
    }
    if (!node.IsScalar()) {
        throw std::runtime_error("Configuration key '" + key + "' must be a string");
    }
    return node.Scalar();
}

std::vector<std::string> ConfigParser::getStringList(const std::string& key) const {
    std::vector<std::string> values;
    YAML::Node node;
    if (!lookup(key, node) || node.IsNull()) {
        return values;
    }

    if (node.IsScalar()) {
        values.push_back(node.Scalar());
        return values;
    }
    if (!node.IsSequence()) {
        throw std::runtime_error("Configuration key '" + key + "' must be a list of strings");
    }

    for (const auto& item : node) {
        if (!item.IsScalar()) {
            throw std::runtime_error("Configuration key '" + key + "' must be a list of strings");
        }
        values.push_back(item.Scalar());
    }
    return values;
}

std::uintmax_t ConfigParser::getUnsignedValue(const std::string& key, std::uintmax_t default_value) const {
    YAML::Node node;
    if (!lookup(key, node) || node.IsNull()) {
        return default_value;
    }

    std::string text = node.IsScalar() ? node.Scalar() : std::string();
    if (text.empty() || text[0] == '-') {
        throw std::runtime_error("Configuration key '" + key + "' must be a non-negative integer");
    }
    try {
        return node.as<std::uintmax_t>();
    } catch (const YAML::Exception&) {
        throw std::runtime_error("Configuration key '" + key + "' must be a non-negative integer");
    }
}

bool ConfigParser::getBoolValue(const std::string& key, bool default_value) const {
    YAML::Node node;
    if (!lookup(key, node) || node.IsNull()) {
        return default_value;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        throw std::runtime_error("Configuration key '" + key + "' must be true or false");
    }
}

bool ConfigParser::lookup(const std::string& key, YAML::Node& node) const {
    if (!m_loaded) {
        return false;
    }

    // Node assignment writes through to the referenced node, so walk with reset()
    YAML::Node current;
    current.reset(m_root);

    size_t start = 0;
    while (true) {
        size_t dot = key.find('.', start);
        std::string part = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);

        if (!current.IsMap()) {
            return false;
        }
        const YAML::Node& view = current;
        YAML::Node next = view[part];
        if (!next.IsDefined()) {
            return false;
        }
        current.reset(next);

        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }

    node.reset(current);
    return true;
}

} // namespace Repolens
