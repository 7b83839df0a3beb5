// =================================================================
// include/Repolens/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Repolens {

// Parsed command information. Unset optionals and empty strings/lists
// leave the configured value in place.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Global options
    std::string config_path = ".repolens/config.yml";
    bool verbose = false;
    bool quiet = false;

    // Shared by 'scan' and 'context'
    std::string directory = ".";
    std::string ignore_file;
    std::vector<std::string> extensions;
    std::vector<std::string> ignored_dirs;
    std::optional<size_t> workers;
    std::optional<size_t> queue_capacity;
    std::optional<std::uintmax_t> max_file_size;

    // Options for 'context'
    std::string output_file;
    std::optional<size_t> max_tokens;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupScanCommand(CLI::App& app);
    void setupContextCommand(CLI::App& app);
    void addScanOptions(CLI::App& sub);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Repolens
