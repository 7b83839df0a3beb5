#include "Repolens/CliParser.hpp"
#include "Repolens/Core.hpp"
#include "Repolens/Logger.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser is responsible for defining and parsing all command-line
    // arguments using the CLI11 library.
    Repolens::CliParser parser;
    auto app = parser.setupCli();

    // CLI11 reports help and usage errors through exceptions; app->exit()
    // prints them and picks the exit code.
    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    Repolens::Core core(parser.getCommands());

    try {
        return core.run();
    } catch (const std::exception& e) {
        REPOLENS_LOG_CRITICAL("main", std::string("Error during execution: ") + e.what());
        Repolens::Logger::getInstance().flush();
        return 1;
    }
}
