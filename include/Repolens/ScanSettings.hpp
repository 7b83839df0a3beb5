// =================================================================
// include/Repolens/ScanSettings.hpp
// =================================================================
// Tunables for a scan, layered as defaults, config file, command line.

#pragma once

#include "Repolens/ScanConfig.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace Repolens {

class ConfigParser;
struct Commands;

/**
 * @brief Configuration settings for the scan and context commands
 */
struct ScanSettings {
    // File discovery settings
    std::string ignore_file = ".gitignore";  ///< Relative paths resolve against the scan root
    std::vector<std::string> extensions = getDefaultExtensions();
    std::vector<std::string> ignored_dirs = ScanConfig::getDefaultIgnoredDirs();
    std::uintmax_t max_file_size = 0;

    // Concurrency settings
    size_t workers = 0;          ///< 0 picks one reader per hardware thread
    size_t queue_capacity = 100;

    // Context settings
    size_t max_tokens = 0;

    // Logging settings
    std::string log_level = "info";
    bool log_to_file = false;
    std::string log_dir = ".repolens/logs";

    /**
     * @brief Load configuration from ConfigParser
     * @param config ConfigParser instance
     * @throws std::runtime_error on values of the wrong type
     */
    void loadFromConfig(const ConfigParser& config);

    /**
     * @brief Apply command-line overrides
     * @param commands Command-line arguments
     */
    void applyCommandOverrides(const Commands& commands);

    /**
     * @brief Validate configuration settings
     * @return Human readable problems; empty when valid
     */
    std::vector<std::string> validate() const;

    /**
     * @brief Worker count to hand to the walker, never 0
     */
    size_t effectiveWorkerCount() const;

    /**
     * @brief Build the immutable config for one scan of `root`
     *
     * Loads the ignore-file; a missing one simply yields no patterns.
     */
    ScanConfig toScanConfig(const std::string& root) const;

    /**
     * @brief Extensions scanned when none are configured
     */
    static std::vector<std::string> getDefaultExtensions();
};

} // namespace Repolens
