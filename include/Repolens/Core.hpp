// =================================================================
// include/Repolens/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Repolens/CliParser.hpp"
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace Repolens {
    class ContextBuilder;
    class FileIO;
    struct ScanResult;
    struct ScanSettings;
}

namespace Repolens {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the main application logic based on parsed commands.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    // Command Handlers
    int handleInit();
    int handleScan();
    int handleContext();

    /**
     * @brief Layer config file and command line into m_settings and set up logging.
     * @return False if the configuration is unusable; the problems are already reported.
     */
    bool prepareSettings();

    /**
     * @brief Scan m_commands.directory into the given builder.
     */
    ScanResult runScan(ContextBuilder& builder);

    const Commands& m_commands;
    std::unique_ptr<ScanSettings> m_settings;
    std::unique_ptr<FileIO> m_io;
};

} // namespace Repolens
