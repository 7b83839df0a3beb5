// =================================================================
// src/Repolens/ScanSettings.cpp
// =================================================================
// Implementation for scan settings management.

#include "Repolens/ScanSettings.hpp"
#include "Repolens/CliParser.hpp"
#include "Repolens/ConfigParser.hpp"
#include "Repolens/Logger.hpp"
#include <filesystem>
#include <thread>

namespace Repolens {

void ScanSettings::loadFromConfig(const ConfigParser& config) {
    if (!config.isLoaded()) {
        return;
    }

    std::string ignore_file_str = config.getStringValue("scan.ignore_file");
    if (config.hasKey("scan.ignore_file")) {
        // An explicit empty value disables the ignore-file
        ignore_file = ignore_file_str;
    }

    std::vector<std::string> configured_extensions = config.getStringList("scan.extensions");
    if (!configured_extensions.empty()) {
        extensions = configured_extensions;
    }

    if (config.hasKey("scan.ignored_dirs")) {
        ignored_dirs = config.getStringList("scan.ignored_dirs");
    }

    workers = config.getUnsignedValue("scan.workers", workers);
    queue_capacity = config.getUnsignedValue("scan.queue_capacity", queue_capacity);
    max_file_size = config.getUnsignedValue("scan.max_file_size", max_file_size);
    max_tokens = config.getUnsignedValue("context.max_tokens", max_tokens);

    std::string level_str = config.getStringValue("logging.level");
    if (!level_str.empty()) {
        log_level = level_str;
    }
    log_to_file = config.getBoolValue("logging.file", log_to_file);
    std::string log_dir_str = config.getStringValue("logging.directory");
    if (!log_dir_str.empty()) {
        log_dir = log_dir_str;
    }

    Logger::getInstance().debug("ScanSettings", "Loaded configuration", config.getPath());
}

void ScanSettings::applyCommandOverrides(const Commands& commands) {
    if (!commands.ignore_file.empty()) {
        // Given on the command line, so relative to the working directory
        ignore_file = std::filesystem::absolute(commands.ignore_file).string();
    }
    if (!commands.extensions.empty()) {
        extensions = commands.extensions;
    }
    if (!commands.ignored_dirs.empty()) {
        ignored_dirs = commands.ignored_dirs;
    }
    if (commands.workers) {
        workers = *commands.workers;
    }
    if (commands.queue_capacity) {
        queue_capacity = *commands.queue_capacity;
    }
    if (commands.max_file_size) {
        max_file_size = *commands.max_file_size;
    }
    if (commands.max_tokens) {
        max_tokens = *commands.max_tokens;
    }
    if (commands.verbose) {
        log_level = "debug";
    } else if (commands.quiet) {
        log_level = "error";
    }
}

std::vector<std::string> ScanSettings::validate() const {
    std::vector<std::string> problems;

    if (extensions.empty()) {
        problems.push_back("At least one file extension must be allowed");
    }
    for (const auto& ext : extensions) {
        if (ext.size() < 2 || ext[0] != '.') {
            problems.push_back("Extension '" + ext + "' must start with '.' followed by a name");
        }
    }
    for (const auto& dir : ignored_dirs) {
        if (dir.empty() || dir.find('/') != std::string::npos) {
            problems.push_back("Ignored directory '" + dir + "' must be a plain directory name");
        }
    }
    if (queue_capacity == 0) {
        problems.push_back("Queue capacity must be at least 1");
    }

    LogLevel level;
    if (!Logger::parseLevel(log_level, level)) {
        problems.push_back("Unknown log level '" + log_level + "'");
    }

    return problems;
}

size_t ScanSettings::effectiveWorkerCount() const {
    if (workers > 0) {
        return workers;
    }
    unsigned hardware = std::thread::hardware_concurrency();
    return hardware > 0 ? hardware : 1;
}

ScanConfig ScanSettings::toScanConfig(const std::string& root) const {
    std::string ignore_path;
    if (!ignore_file.empty()) {
        std::filesystem::path path(ignore_file);
        ignore_path = path.is_absolute() ? path.string() : (std::filesystem::path(root) / path).string();
    }

    ScanConfig config = ScanConfig::create(root, ignore_path, extensions, ignored_dirs);
    config.max_file_size = max_file_size;
    return config;
}

std::vector<std::string> ScanSettings::getDefaultExtensions() {
    return {".svelte", ".ts", ".go", ".html", ".sql"};
}

} // namespace Repolens
