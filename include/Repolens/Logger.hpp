// =================================================================
// include/Repolens/Logger.hpp
// =================================================================
// Header for console and rotating file logging.

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Repolens {

struct ScanResult;

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Process-wide logger writing to stderr and, optionally, log files
 *
 * Console output is always available. File output starts once
 * enableFileLogging() is called and rotates by size. Every public method
 * may be called from any thread; reader workers log through it while a
 * scan is running.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Start writing log files
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     * @return false if the log file could not be opened
     */
    bool enableFileLogging(const std::string& log_dir = ".repolens/logs",
                           size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                           size_t max_log_files = 5);

    /**
     * @brief Stop writing log files and close the current one
     */
    void disableFileLogging();

    /**
     * @brief Set minimum log level for console output
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Set minimum log level for file output
     */
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     */
    void setConsoleLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome and statistics of a finished scan
     * @param result Result returned by ConcurrentWalker::scan()
     * @param root Root that was scanned
     */
    void logScanSummary(const ScanResult& result, const std::string& root);

    /**
     * @brief Flush the current log file
     */
    void flush();

    /**
     * @brief Get log level name as string
     */
    static std::string getLevelName(LogLevel level);

    /**
     * @brief Get log level color for console output
     * @return ANSI color code
     */
    static std::string getLevelColor(LogLevel level);

    /**
     * @brief Parse a level name ("debug", "info", "warning", "error", "critical")
     * @param name Case-insensitive level name
     * @param level Receives the parsed level
     * @return false if the name is unknown
     */
    static bool parseLevel(const std::string& name, LogLevel& level);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::mutex m_mutex;
    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    /**
     * @brief Log an entry to all configured outputs
     */
    void logEntry(const LogEntry& entry);

    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param include_color Whether to include color codes
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool include_color) const;

    /**
     * @brief Rotate log files if needed; caller holds m_mutex
     */
    void rotateLogsIfNeeded();

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point) const;
    std::string generateLogFilename() const;
};

// Convenience macros for logging
#define REPOLENS_LOG_DEBUG(component, message) \
    Repolens::Logger::getInstance().debug(component, message)

#define REPOLENS_LOG_INFO(component, message) \
    Repolens::Logger::getInstance().info(component, message)

#define REPOLENS_LOG_WARNING(component, message) \
    Repolens::Logger::getInstance().warning(component, message)

#define REPOLENS_LOG_ERROR(component, message) \
    Repolens::Logger::getInstance().error(component, message)

#define REPOLENS_LOG_CRITICAL(component, message) \
    Repolens::Logger::getInstance().critical(component, message)

} // namespace Repolens
