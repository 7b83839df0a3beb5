// =================================================================
// include/Repolens/ScanConfig.hpp
// =================================================================
// Immutable description of a single scan.

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <unordered_set>

namespace Repolens {

/**
 * @brief Everything a scan needs to know about the tree it walks
 *
 * Built once before a scan and treated as read-only for its duration.
 */
struct ScanConfig {
    std::string root;                                   ///< Directory (or file) to scan
    std::unordered_set<std::string> ignored_dir_names;  ///< Directory names pruned by exact match
    std::vector<std::string> glob_patterns;             ///< Base-name globs; any match excludes
    std::unordered_set<std::string> allowed_extensions; ///< Extensions including the dot
    std::uintmax_t max_file_size = 0;                   ///< Bytes; 0 means unlimited

    /**
     * @brief Build a config, loading glob patterns from an ignore-file
     *
     * The ignore-file is optional: if it cannot be opened the config
     * simply carries no glob patterns.
     *
     * @param root Directory to scan
     * @param ignore_file Path to the ignore-file
     * @param extensions Allowed extensions (e.g. ".go")
     * @param ignored_dirs Directory names to prune
     * @return The assembled config
     */
    static ScanConfig create(const std::string& root,
                             const std::string& ignore_file,
                             const std::vector<std::string>& extensions,
                             const std::vector<std::string>& ignored_dirs = getDefaultIgnoredDirs());

    /**
     * @brief Directory names pruned when none are configured
     */
    static std::vector<std::string> getDefaultIgnoredDirs();
};

} // namespace Repolens
