// =================================================================
// src/Repolens/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Repolens/Core.hpp"
#include "Repolens/ConcurrentWalker.hpp"
#include "Repolens/ConfigParser.hpp"
#include "Repolens/ContextBuilder.hpp"
#include "Repolens/FileIO.hpp"
#include "Repolens/Logger.hpp"
#include "Repolens/ScanSettings.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace Repolens {

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_settings(std::make_unique<ScanSettings>()),
      m_io(std::make_unique<FileIO>())
{
}

Core::~Core() = default;

int Core::run() {
    if (m_commands.active_command == "init") {
        return handleInit();
    } else if (m_commands.active_command == "scan") {
        return handleScan();
    } else if (m_commands.active_command == "context") {
        return handleContext();
    } else if (m_commands.active_command.empty()) {
        return 0;
    }

    std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    return 1;
}

int Core::handleInit() {
    std::cout << "Initializing Repolens configuration..." << std::endl;

    const std::string defaultConfig = R"(# Repolens Configuration
scan:
  # Ignore-file with one glob per line, matched against base names.
  # Relative paths resolve against the scanned directory.
  ignore_file: .gitignore
  extensions:
    - '.svelte'
    - '.ts'
    - '.go'
    - '.html'
    - '.sql'
  ignored_dirs:
    - '.git'
    - 'node_modules'
  workers: 0            # 0 = one reader per CPU
  queue_capacity: 100   # Paths allowed to wait for a reader
  max_file_size: 0      # Bytes; 0 = no limit

context:
  max_tokens: 0         # 0 = no budget

logging:
  level: info           # debug | info | warning | error | critical
  file: false
  directory: .repolens/logs
)";

    const std::string configPath = m_commands.config_path;
    const std::string configDir = std::filesystem::path(configPath).parent_path().string();

    if (!configDir.empty() && !m_io->directoryExists(configDir)) {
        if (!m_io->createDirectory(configDir)) {
            std::cerr << "Error: Failed to create configuration directory '" << configDir << "'." << std::endl;
            return 1;
        }
        std::cout << "Created configuration directory: " << configDir << std::endl;
    }

    if (m_io->fileExists(configPath)) {
        std::cout << "Configuration file '" << configPath << "' already exists. Skipping." << std::endl;
    } else {
        if (m_io->writeFile(configPath, defaultConfig)) {
            std::cout << "Created default configuration file: " << configPath << std::endl;
        } else {
            std::cerr << "Error: Failed to write configuration file '" << configPath << "'." << std::endl;
            return 1;
        }
    }
    return 0;
}

int Core::handleScan() {
    if (!prepareSettings()) {
        return 1;
    }

    ContextBuilder builder;
    ScanResult result = runScan(builder);

    // Whatever was delivered before a walk error is still reported
    for (const auto& path : builder.getPaths()) {
        std::cout << path << std::endl;
    }

    size_t total_tokens = (builder.totalBytes() + 3) / 4;
    std::cout << builder.fileCount() << " files loaded ("
              << builder.totalBytes() << " bytes, ~" << total_tokens << " tokens) in "
              << result.duration.count() << " ms" << std::endl;
    if (result.files_skipped > 0) {
        std::cout << result.files_skipped << " files skipped (see log)" << std::endl;
    }

    if (!result.success) {
        std::cerr << "Error: " << result.error_message << std::endl;
        return 1;
    }
    return 0;
}

int Core::handleContext() {
    if (!prepareSettings()) {
        return 1;
    }

    ContextBuilder builder(m_settings->max_tokens);
    ScanResult result = runScan(builder);
    if (!result.success) {
        std::cerr << "Error: " << result.error_message << std::endl;
        return 1;
    }

    std::string context = builder.build();

    if (m_commands.output_file.empty()) {
        std::cout << context;
        std::cout.flush();
    } else {
        if (!m_io->writeFile(m_commands.output_file, context)) {
            std::cerr << "Error: Failed to write context to '" << m_commands.output_file << "'." << std::endl;
            return 1;
        }
        std::cerr << "Wrote " << (builder.fileCount() - builder.omittedCount()) << " files (~"
                  << ContextBuilder::estimateTokens(context) << " tokens) to "
                  << m_commands.output_file << std::endl;
    }

    if (builder.omittedCount() > 0) {
        std::cerr << "[WARNING] " << builder.omittedCount()
                  << " files did not fit the token budget and were left out." << std::endl;
    }
    return 0;
}

bool Core::prepareSettings() {
    Logger& logger = Logger::getInstance();

    try {
        ConfigParser config(m_commands.config_path);
        m_settings->loadFromConfig(config);
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return false;
    }
    m_settings->applyCommandOverrides(m_commands);

    std::vector<std::string> problems = m_settings->validate();
    if (!problems.empty()) {
        std::cerr << "[FATAL] Invalid configuration:" << std::endl;
        for (const auto& problem : problems) {
            std::cerr << "  - " << problem << std::endl;
        }
        return false;
    }

    LogLevel level;
    if (Logger::parseLevel(m_settings->log_level, level)) {
        logger.setConsoleLogLevel(level);
    }

    if (m_settings->log_to_file) {
        if (!logger.enableFileLogging(m_settings->log_dir)) {
            std::cerr << "[WARNING] Could not open a log file in '" << m_settings->log_dir
                      << "'; logging to the console only." << std::endl;
        }
    }
    return true;
}

ScanResult Core::runScan(ContextBuilder& builder) {
    ScanConfig config = m_settings->toScanConfig(m_commands.directory);
    size_t workers = m_settings->effectiveWorkerCount();

    REPOLENS_LOG_DEBUG("Core", "Starting scan of " + config.root + " with "
                       + std::to_string(workers) + " workers");

    ConcurrentWalker walker(m_settings->queue_capacity);
    ScanResult result = walker.scan(config, workers, builder.makeSink());

    Logger::getInstance().logScanSummary(result, config.root);
    Logger::getInstance().flush();
    return result;
}

} // namespace Repolens
