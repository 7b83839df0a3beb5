// =================================================================
// src/Repolens/ScanConfig.cpp
// =================================================================

#include "Repolens/ScanConfig.hpp"
#include "Repolens/GlobPattern.hpp"
#include "Repolens/Logger.hpp"

namespace Repolens {

ScanConfig ScanConfig::create(const std::string& root,
                              const std::string& ignore_file,
                              const std::vector<std::string>& extensions,
                              const std::vector<std::string>& ignored_dirs) {
    ScanConfig config;
    config.root = root;
    config.allowed_extensions.insert(extensions.begin(), extensions.end());
    config.ignored_dir_names.insert(ignored_dirs.begin(), ignored_dirs.end());

    if (!ignore_file.empty()) {
        if (GlobPatternSet::readPatternFile(ignore_file, config.glob_patterns)) {
            REPOLENS_LOG_INFO("ScanConfig", "Loaded " + std::to_string(config.glob_patterns.size())
                + " ignore patterns from " + ignore_file);
        }
    }

    return config;
}

std::vector<std::string> ScanConfig::getDefaultIgnoredDirs() {
    return {".git", "node_modules"};
}

} // namespace Repolens
