// =================================================================
// include/Repolens/PathFilter.hpp
// =================================================================
// Header for the descend/include decisions applied during a walk.

#pragma once

#include "Repolens/GlobPattern.hpp"
#include "Repolens/ScanConfig.hpp"
#include <string>
#include <unordered_set>

namespace Repolens {

/**
 * @brief Decides which directories to enter and which files to read
 *
 * Holds no mutable state after construction and performs no I/O, so one
 * instance can answer queries for a whole scan.
 */
class PathFilter {
public:
    /**
     * @brief Construct a filter from a scan configuration
     * @param config Ignored directory names, glob patterns and extensions
     */
    explicit PathFilter(const ScanConfig& config);

    /**
     * @brief Check whether a directory should be walked into
     * @param dir_name Directory base name
     * @return false iff the name is one of the ignored directory names
     */
    bool shouldDescend(const std::string& dir_name) const;

    /**
     * @brief Check whether a file should be read
     *
     * The file is excluded if its extension is not allowed or if its base
     * name matches any glob pattern.
     *
     * @param file_path Path of the file; its base name is used when
     *        file_name is empty
     * @param file_name File base name
     * @return true if the file passes both checks
     */
    bool shouldInclude(const std::string& file_path, const std::string& file_name) const;

    /**
     * @brief Extension of a base name: from the last '.' to the end
     *
     * Unlike std::filesystem::path::extension(), a leading dot counts, so
     * ".gitignore" has the extension ".gitignore".
     *
     * @param file_name File base name
     * @return Extension including the dot, or an empty string
     */
    static std::string getExtension(const std::string& file_name);

private:
    std::unordered_set<std::string> m_ignored_dir_names;
    std::unordered_set<std::string> m_allowed_extensions;
    GlobPatternSet m_patterns;
};

} // namespace Repolens
