// =================================================================
// tests/ScanSettingsTest.cpp
// =================================================================
// Unit tests for configuration loading, CLI overrides and validation.

#include "Repolens/CliParser.hpp"
#include "Repolens/ConfigParser.hpp"
#include "Repolens/Logger.hpp"
#include "Repolens/ScanSettings.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace fs = std::filesystem;

class ScanSettingsTest {
private:
    fs::path test_dir;

    std::string writeConfig(const std::string& name, const std::string& yaml) {
        fs::path path = test_dir / name;
        std::ofstream(path) << yaml;
        return path.string();
    }

    static bool contains(const std::vector<std::string>& values, const std::string& value) {
        return std::find(values.begin(), values.end(), value) != values.end();
    }

public:
    ScanSettingsTest()
        : test_dir(fs::temp_directory_path() / ("repolens_settings_" + std::to_string(
              std::chrono::steady_clock::now().time_since_epoch().count()))) {
        fs::create_directories(test_dir);
    }

    ~ScanSettingsTest() {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    void testDefaults() {
        std::cout << "Testing default settings..." << std::endl;

        Repolens::ScanSettings settings;
        assert(settings.ignore_file == ".gitignore");
        assert(settings.extensions.size() == 5);
        assert(contains(settings.extensions, ".svelte"));
        assert(contains(settings.extensions, ".ts"));
        assert(contains(settings.extensions, ".go"));
        assert(contains(settings.extensions, ".html"));
        assert(contains(settings.extensions, ".sql"));
        assert(settings.ignored_dirs.size() == 2);
        assert(contains(settings.ignored_dirs, ".git"));
        assert(contains(settings.ignored_dirs, "node_modules"));
        assert(settings.workers == 0);
        assert(settings.queue_capacity == 100);
        assert(settings.max_file_size == 0);
        assert(settings.max_tokens == 0);
        assert(settings.log_level == "info");
        assert(!settings.log_to_file);
        assert(settings.validate().empty() && "Defaults are valid");

        std::cout << "✓ Default settings test passed" << std::endl;
    }

    void testLoadFromYaml() {
        std::cout << "Testing YAML loading..." << std::endl;

        std::string path = writeConfig("full.yml",
            "scan:\n"
            "  ignore_file: .repolensignore\n"
            "  extensions: [.cpp, .hpp]\n"
            "  ignored_dirs:\n"
            "    - build\n"
            "    - .git\n"
            "  workers: 6\n"
            "  queue_capacity: 16\n"
            "  max_file_size: 65536\n"
            "context:\n"
            "  max_tokens: 32000\n"
            "logging:\n"
            "  level: warning\n"
            "  file: yes\n"
            "  directory: /tmp/repolens-logs\n");

        Repolens::ConfigParser config(path);
        assert(config.isLoaded());
        assert(config.hasKey("scan.workers"));
        assert(!config.hasKey("scan.nope"));
        assert(!config.hasKey("scan.workers.deeper") && "Scalars have no children");

        Repolens::ScanSettings settings;
        settings.loadFromConfig(config);
        assert(settings.ignore_file == ".repolensignore");
        assert(settings.extensions.size() == 2 && settings.extensions[0] == ".cpp");
        assert(settings.ignored_dirs.size() == 2 && settings.ignored_dirs[0] == "build");
        assert(settings.workers == 6);
        assert(settings.queue_capacity == 16);
        assert(settings.max_file_size == 65536);
        assert(settings.max_tokens == 32000);
        assert(settings.log_level == "warning");
        assert(settings.log_to_file);
        assert(settings.log_dir == "/tmp/repolens-logs");
        assert(settings.validate().empty());

        std::cout << "✓ YAML loading test passed" << std::endl;
    }

    void testPartialAndMissingConfig() {
        std::cout << "Testing partial and missing configuration..." << std::endl;

        Repolens::ConfigParser missing((test_dir / "absent.yml").string());
        assert(!missing.isLoaded() && "A missing file is tolerated");
        Repolens::ScanSettings untouched;
        untouched.loadFromConfig(missing);
        assert(untouched.extensions.size() == 5 && untouched.workers == 0);

        std::string path = writeConfig("partial.yml", "scan:\n  workers: 2\n  ignore_file: ''\n");
        Repolens::ConfigParser partial(path);
        Repolens::ScanSettings settings;
        settings.loadFromConfig(partial);
        assert(settings.workers == 2);
        assert(settings.ignore_file.empty() && "An explicit empty ignore_file disables it");
        assert(settings.extensions.size() == 5 && "Unset keys keep their defaults");
        assert(settings.queue_capacity == 100);

        std::string scalar = writeConfig("scalar.yml", "scan:\n  extensions: .go\n");
        Repolens::ConfigParser scalar_config(scalar);
        Repolens::ScanSettings scalar_settings;
        scalar_settings.loadFromConfig(scalar_config);
        assert(scalar_settings.extensions.size() == 1 && scalar_settings.extensions[0] == ".go");

        std::cout << "✓ Partial and missing configuration test passed" << std::endl;
    }

    void testInvalidYaml() {
        std::cout << "Testing invalid configuration values..." << std::endl;

        bool threw = false;
        try {
            Repolens::ConfigParser broken(writeConfig("broken.yml", "scan: [unclosed\n"));
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw && "Malformed YAML is a configuration error");

        Repolens::ConfigParser negative(writeConfig("negative.yml", "scan:\n  workers: -3\n"));
        Repolens::ScanSettings settings;
        threw = false;
        try {
            settings.loadFromConfig(negative);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw && "Negative counts are rejected");

        Repolens::ConfigParser text(writeConfig("text.yml", "scan:\n  queue_capacity: lots\n"));
        threw = false;
        try {
            settings.loadFromConfig(text);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw && "Non-numeric counts are rejected");

        Repolens::ConfigParser nested(writeConfig("nested.yml", "scan:\n  extensions:\n    - {a: b}\n"));
        threw = false;
        try {
            settings.loadFromConfig(nested);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw && "Lists must hold strings");

        std::cout << "✓ Invalid configuration values test passed" << std::endl;
    }

    void testValidation() {
        std::cout << "Testing validation..." << std::endl;

        Repolens::ScanSettings settings;
        settings.extensions.clear();
        settings.queue_capacity = 0;
        settings.log_level = "chatty";
        auto problems = settings.validate();
        assert(problems.size() == 3);

        Repolens::ScanSettings bad_ext;
        bad_ext.extensions = {"go", "."};
        assert(bad_ext.validate().size() == 2 && "Extensions need a dot and a name");

        Repolens::ScanSettings bad_dir;
        bad_dir.ignored_dirs = {"src/vendor"};
        assert(bad_dir.validate().size() == 1 && "Ignored names are single path components");

        Repolens::ScanSettings upper;
        upper.log_level = "DEBUG";
        assert(upper.validate().empty() && "Level names are case-insensitive");

        std::cout << "✓ Validation test passed" << std::endl;
    }

    void testWorkerCount() {
        std::cout << "Testing effective worker count..." << std::endl;

        Repolens::ScanSettings settings;
        settings.workers = 3;
        assert(settings.effectiveWorkerCount() == 3);

        settings.workers = 0;
        size_t automatic = settings.effectiveWorkerCount();
        assert(automatic >= 1);
        if (std::thread::hardware_concurrency() > 0) {
            assert(automatic == std::thread::hardware_concurrency());
        }

        std::cout << "✓ Effective worker count test passed" << std::endl;
    }

    void testToScanConfig() {
        std::cout << "Testing conversion to a scan config..." << std::endl;

        fs::path project = test_dir / "project";
        fs::create_directories(project);
        std::ofstream(project / ".gitignore") << "*_test.go\n";
        std::ofstream(test_dir / "shared.ignore") << "*.min.js\nvendor.ts\n";

        Repolens::ScanSettings settings;
        settings.max_file_size = 1024;
        auto config = settings.toScanConfig(project.string());
        assert(config.root == project.string());
        assert(config.glob_patterns.size() == 1 && "Relative ignore-file resolves against the root");
        assert(config.glob_patterns[0] == "*_test.go");
        assert(config.max_file_size == 1024);
        assert(config.allowed_extensions.count(".go") == 1);
        assert(config.ignored_dir_names.count("node_modules") == 1);

        settings.ignore_file = (test_dir / "shared.ignore").string();
        auto absolute = settings.toScanConfig(project.string());
        assert(absolute.glob_patterns.size() == 2 && "Absolute ignore-file is used as is");

        settings.ignore_file.clear();
        auto none = settings.toScanConfig(project.string());
        assert(none.glob_patterns.empty());

        std::cout << "✓ Conversion to scan config test passed" << std::endl;
    }

    void testCommandLineOverrides() {
        std::cout << "Testing command-line parsing and overrides..." << std::endl;

        std::string dir = test_dir.string();
        Repolens::CliParser parser;
        auto app = parser.setupCli();
        const char* argv[] = {
            "repolens", "-v", "context", dir.c_str(),
            "-e", ".rs", "--ext", ".toml",
            "--ignore-dir", "target",
            "--ignore-file", "custom.ignore",
            "-j", "5", "--queue-capacity", "7",
            "--max-file-size", "2048", "--max-tokens", "900",
            "-o", "out.txt"
        };
        app->parse(static_cast<int>(sizeof(argv) / sizeof(argv[0])), argv);

        const Repolens::Commands& commands = parser.getCommands();
        assert(commands.active_command == "context");
        assert(commands.verbose && !commands.quiet);
        assert(commands.directory == dir);
        assert(commands.extensions.size() == 2);
        assert(commands.output_file == "out.txt");
        assert(commands.workers && *commands.workers == 5);

        Repolens::ScanSettings settings;
        settings.applyCommandOverrides(commands);
        assert(settings.extensions.size() == 2 && settings.extensions[1] == ".toml");
        assert(settings.ignored_dirs.size() == 1 && settings.ignored_dirs[0] == "target");
        assert(fs::path(settings.ignore_file).is_absolute() && "CLI ignore-file is made absolute");
        assert(fs::path(settings.ignore_file).filename() == "custom.ignore");
        assert(settings.workers == 5);
        assert(settings.queue_capacity == 7);
        assert(settings.max_file_size == 2048);
        assert(settings.max_tokens == 900);
        assert(settings.log_level == "debug");

        // Unset options leave configured values alone
        Repolens::CliParser plain_parser;
        auto plain_app = plain_parser.setupCli();
        const char* plain_argv[] = {"repolens", "-q", "scan", dir.c_str()};
        plain_app->parse(4, plain_argv);

        Repolens::ScanSettings configured;
        configured.workers = 9;
        configured.extensions = {".go"};
        configured.applyCommandOverrides(plain_parser.getCommands());
        assert(plain_parser.getCommands().active_command == "scan");
        assert(configured.workers == 9);
        assert(configured.extensions.size() == 1);
        assert(configured.ignore_file == ".gitignore");
        assert(configured.log_level == "error");

        std::cout << "✓ Command-line overrides test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ScanSettings unit tests..." << std::endl;

        testDefaults();
        testLoadFromYaml();
        testPartialAndMissingConfig();
        testInvalidYaml();
        testValidation();
        testWorkerCount();
        testToScanConfig();
        testCommandLineOverrides();

        std::cout << "All ScanSettings tests passed!" << std::endl;
    }
};

int main() {
    try {
        // Malformed YAML is logged at error level before it throws
        Repolens::Logger::getInstance().setConsoleLogLevel(Repolens::LogLevel::CRITICAL);

        ScanSettingsTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All ScanSettings component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
