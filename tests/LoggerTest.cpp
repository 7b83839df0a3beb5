// =================================================================
// tests/LoggerTest.cpp
// =================================================================
// Unit tests for the Logger singleton.

#include "Repolens/ConcurrentWalker.hpp"
#include "Repolens/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cassert>
#include <chrono>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

class LoggerTest {
private:
    fs::path test_dir;

    std::vector<fs::path> logFiles() const {
        std::vector<fs::path> files;
        for (const auto& entry : fs::directory_iterator(test_dir)) {
            if (entry.path().extension() == ".log") {
                files.push_back(entry.path());
            }
        }
        return files;
    }

    std::string readAll() const {
        std::string all;
        for (const auto& file : logFiles()) {
            std::ifstream in(file);
            std::stringstream buffer;
            buffer << in.rdbuf();
            all += buffer.str();
        }
        return all;
    }

public:
    LoggerTest()
        : test_dir(fs::temp_directory_path() / ("repolens_logs_" + std::to_string(
              std::chrono::steady_clock::now().time_since_epoch().count()))) {}

    ~LoggerTest() {
        Repolens::Logger::getInstance().disableFileLogging();
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    void testParseLevel() {
        std::cout << "Testing level parsing..." << std::endl;

        Repolens::LogLevel level = Repolens::LogLevel::INFO;
        assert(Repolens::Logger::parseLevel("debug", level) && level == Repolens::LogLevel::DEBUG);
        assert(Repolens::Logger::parseLevel("Warning", level) && level == Repolens::LogLevel::WARNING);
        assert(Repolens::Logger::parseLevel("warn", level) && level == Repolens::LogLevel::WARNING);
        assert(Repolens::Logger::parseLevel("ERROR", level) && level == Repolens::LogLevel::ERROR);
        assert(Repolens::Logger::parseLevel("critical", level) && level == Repolens::LogLevel::CRITICAL);
        assert(!Repolens::Logger::parseLevel("verbose", level));
        assert(level == Repolens::LogLevel::CRITICAL && "Unknown names leave the level alone");

        assert(Repolens::Logger::getLevelName(Repolens::LogLevel::WARNING) == "WARN");

        std::cout << "✓ Level parsing test passed" << std::endl;
    }

    void testFileLogging() {
        std::cout << "Testing file logging..." << std::endl;

        auto& logger = Repolens::Logger::getInstance();
        assert(logger.enableFileLogging(test_dir.string()));
        logger.setFileLogLevel(Repolens::LogLevel::INFO);

        logger.debug("LoggerTest", "below the file level");
        logger.info("LoggerTest", "first message", "key=value");
        REPOLENS_LOG_WARNING("LoggerTest", "second message");
        REPOLENS_LOG_CRITICAL("LoggerTest", "third message");

        Repolens::ScanResult result;
        result.files_delivered = 7;
        logger.logScanSummary(result, "/some/root");

        Repolens::ScanResult failed;
        failed.success = false;
        failed.error_message = "Cannot access scan root '/missing'";
        logger.logScanSummary(failed, "/missing");
        logger.flush();

        std::string content = readAll();
        assert(content.find("below the file level") == std::string::npos);
        assert(content.find("[INFO] LoggerTest: first message (key=value)") != std::string::npos);
        assert(content.find("[WARN] LoggerTest: second message") != std::string::npos);
        assert(content.find("[CRIT] LoggerTest: third message") != std::string::npos);
        assert(content.find("Scan of /some/root completed") != std::string::npos);
        assert(content.find("Delivered: 7") != std::string::npos);
        assert(content.find("[ERROR] ConcurrentWalker: Scan of /missing failed") != std::string::npos);
        assert(content.find("\033[") == std::string::npos && "Files carry no color codes");

        logger.disableFileLogging();
        logger.info("LoggerTest", "after disable");
        assert(readAll().find("after disable") == std::string::npos);

        std::cout << "✓ File logging test passed" << std::endl;
    }

    void testRotation() {
        std::cout << "Testing log rotation..." << std::endl;

        fs::remove_all(test_dir);
        auto& logger = Repolens::Logger::getInstance();
        assert(logger.enableFileLogging(test_dir.string(), 256, 2));

        for (int i = 0; i < 100; ++i) {
            logger.info("LoggerTest", "rotation message " + std::to_string(i));
        }
        logger.flush();

        auto files = logFiles();
        assert(!files.empty());
        assert(files.size() <= 2 && "Old log files are removed beyond the limit");
        assert(readAll().find("rotation message 99") != std::string::npos && "Newest entries are kept");

        logger.disableFileLogging();
        std::cout << "✓ Log rotation test passed" << std::endl;
    }

    void testConcurrentLogging() {
        std::cout << "Testing logging from several threads..." << std::endl;

        fs::remove_all(test_dir);
        auto& logger = Repolens::Logger::getInstance();
        assert(logger.enableFileLogging(test_dir.string()));

        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&logger, t]() {
                for (int i = 0; i < 50; ++i) {
                    logger.info("Worker" + std::to_string(t), "line " + std::to_string(i));
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        logger.flush();

        std::string content = readAll();
        size_t lines = 0;
        for (char c : content) {
            if (c == '\n') {
                ++lines;
            }
        }
        assert(lines == 200 && "Every entry is written as one whole line");

        logger.disableFileLogging();
        std::cout << "✓ Concurrent logging test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Logger unit tests..." << std::endl;

        testParseLevel();
        testFileLogging();
        testRotation();
        testConcurrentLogging();

        std::cout << "All Logger tests passed!" << std::endl;
    }
};

int main() {
    try {
        Repolens::Logger::getInstance().setConsoleLogging(false);

        LoggerTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All Logger component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
