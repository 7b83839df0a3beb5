// =================================================================
// src/Repolens/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Repolens/CliParser.hpp"

namespace Repolens {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Repolens: scan a project tree in parallel and gather its sources.");
    m_app->require_subcommand(1);

    m_app->add_option("-c,--config", m_commands.config_path,
                      "Configuration file (default: .repolens/config.yml)");
    auto* verbose = m_app->add_flag("-v,--verbose", m_commands.verbose, "Log debug messages");
    auto* quiet = m_app->add_flag("-q,--quiet", m_commands.quiet, "Only log errors");
    verbose->excludes(quiet);

    // Record which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    m_app->add_subcommand("init", "Writes a default .repolens/config.yml.");
    setupScanCommand(*m_app);
    setupContextCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupScanCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("scan", "Lists the files a scan would load, with totals.");
    addScanOptions(*sub);
}

void CliParser::setupContextCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("context", "Writes every scanned file into one context document.");
    addScanOptions(*sub);
    sub->add_option("-o,--output", m_commands.output_file, "Write the context to this file instead of stdout");
    sub->add_option("--max-tokens", m_commands.max_tokens, "Token budget for the context (0: unlimited)");
}

void CliParser::addScanOptions(CLI::App& sub) {
    sub.add_option("dir", m_commands.directory, "The directory to analyze (default: .)")
        ->check(CLI::ExistingDirectory);
    sub.add_option("--ignore-file", m_commands.ignore_file,
                   "Ignore-file with base-name glob patterns (default: <dir>/.gitignore)");
    sub.add_option("-e,--ext", m_commands.extensions,
                   "Allowed file extension, e.g. .go (repeatable; replaces the configured list)");
    sub.add_option("--ignore-dir", m_commands.ignored_dirs,
                   "Directory name never walked into (repeatable; replaces the configured list)");
    sub.add_option("-j,--workers", m_commands.workers, "Reader threads (0: one per CPU)");
    sub.add_option("--queue-capacity", m_commands.queue_capacity, "Paths allowed to wait for a reader")
        ->check(CLI::PositiveNumber);
    sub.add_option("--max-file-size", m_commands.max_file_size, "Skip files larger than this many bytes (0: no limit)");
}

} // namespace Repolens
