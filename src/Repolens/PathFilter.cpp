// =================================================================
// src/Repolens/PathFilter.cpp
// =================================================================
// Implementation for the descend/include decisions applied during a walk.

#include "Repolens/PathFilter.hpp"
#include <filesystem>

namespace Repolens {

PathFilter::PathFilter(const ScanConfig& config)
    : m_ignored_dir_names(config.ignored_dir_names),
      m_allowed_extensions(config.allowed_extensions)
{
    for (const auto& pattern : config.glob_patterns) {
        m_patterns.addPattern(pattern);
    }
}

bool PathFilter::shouldDescend(const std::string& dir_name) const {
    return m_ignored_dir_names.find(dir_name) == m_ignored_dir_names.end();
}

bool PathFilter::shouldInclude(const std::string& file_path, const std::string& file_name) const {
    std::string name = file_name.empty()
        ? std::filesystem::path(file_path).filename().string()
        : file_name;

    if (m_allowed_extensions.find(getExtension(name)) == m_allowed_extensions.end()) {
        return false;
    }

    return !m_patterns.matchesAny(name);
}

std::string PathFilter::getExtension(const std::string& file_name) {
    size_t dot = file_name.rfind('.');
    if (dot == std::string::npos) {
        return "";
    }
    return file_name.substr(dot);
}

} // namespace Repolens
