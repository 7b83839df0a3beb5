// =================================================================
// src/Repolens/Logger.cpp
// =================================================================
// Implementation for console and rotating file logging.

#include "Repolens/Logger.hpp"
#include "Repolens/ConcurrentWalker.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace Repolens {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

bool Logger::enableFileLogging(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_log_dir = log_dir;
    m_max_log_size = max_log_size;
    m_max_log_files = std::max<size_t>(max_log_files, 1);

    std::error_code ec;
    std::filesystem::create_directories(m_log_dir, ec);
    if (ec) {
        std::cerr << "[ERROR] Cannot create log directory " << m_log_dir << ": " << ec.message() << std::endl;
        return false;
    }

    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
    m_current_log_size = 0;
    if (!m_current_log_file->is_open()) {
        std::cerr << "[ERROR] Cannot open log file " << m_current_log_filename << std::endl;
        m_current_log_file.reset();
        return false;
    }
    return true;
}

void Logger::disableFileLogging() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_current_log_file) {
        m_current_log_file->flush();
        m_current_log_file.reset();
    }
}

void Logger::setConsoleLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_console_level = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_file_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_console_enabled = enabled;
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::DEBUG, component, message, context));
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::INFO, component, message, context));
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::WARNING, component, message, context));
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::ERROR, component, message, context));
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::CRITICAL, component, message, context));
}

void Logger::logScanSummary(const ScanResult& result, const std::string& root) {
    std::ostringstream context;
    context << "Dispatched: " << result.files_dispatched << ", ";
    context << "Delivered: " << result.files_delivered << ", ";
    context << "Skipped: " << result.files_skipped << ", ";
    context << "Pruned dirs: " << result.directories_pruned << ", ";
    context << "Duration: " << result.duration.count() << "ms";

    if (result.success) {
        info("ConcurrentWalker", "Scan of " + root + " completed", context.str());
    } else {
        error("ConcurrentWalker", "Scan of " + root + " failed: " + result.error_message, context.str());
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_current_log_file && m_current_log_file->is_open()) {
        m_current_log_file->flush();
    }
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default: return "UNKNOWN";
    }
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        case LogLevel::CRITICAL: return "\033[91m";  // Bright red
        default: return "\033[0m";                   // Reset
    }
}

bool Logger::parseLevel(const std::string& name, LogLevel& level) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") {
        level = LogLevel::DEBUG;
    } else if (lowered == "info") {
        level = LogLevel::INFO;
    } else if (lowered == "warning" || lowered == "warn") {
        level = LogLevel::WARNING;
    } else if (lowered == "error") {
        level = LogLevel::ERROR;
    } else if (lowered == "critical") {
        level = LogLevel::CRITICAL;
    } else {
        return false;
    }
    return true;
}

void Logger::logEntry(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }

    // stderr keeps stdout free for scan output
    std::cerr << formatEntry(entry, true) << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_current_log_file || entry.level < m_file_level) {
        return;
    }

    rotateLogsIfNeeded();
    if (!m_current_log_file) {
        return;
    }

    std::string formatted = formatEntry(entry, false);
    *m_current_log_file << formatted << '\n';
    m_current_log_size += formatted.length() + 1;

    // Flush critical and error messages immediately
    if (entry.level >= LogLevel::ERROR) {
        m_current_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) const {
    std::ostringstream formatted;

    formatted << formatTimestamp(entry.timestamp) << " ";

    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m";
    }
    formatted << " ";

    formatted << entry.component << ": " << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

void Logger::rotateLogsIfNeeded() {
    if (m_current_log_size < m_max_log_size) {
        return;
    }

    m_current_log_file.reset();

    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename);
    m_current_log_size = 0;
    if (!m_current_log_file->is_open()) {
        std::cerr << "[WARN] Log rotation failed: cannot open " << m_current_log_filename << std::endl;
        m_current_log_file.reset();
        return;
    }

    // Remove the oldest files beyond the limit
    std::error_code ec;
    std::vector<std::filesystem::path> log_files;
    for (std::filesystem::directory_iterator it(m_log_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() == ".log") {
            log_files.push_back(it->path());
        }
    }
    if (ec) {
        std::cerr << "[WARN] Log rotation failed: " << ec.message() << std::endl;
        return;
    }

    // Names embed timestamp and sequence, so lexical order is age order
    std::sort(log_files.begin(), log_files.end(), std::greater<std::filesystem::path>());
    for (size_t i = m_max_log_files; i < log_files.size(); i++) {
        std::filesystem::remove(log_files[i], ec);
        if (ec) {
            std::cerr << "[WARN] Cannot remove old log " << log_files[i] << ": " << ec.message() << std::endl;
        }
    }
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) const {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::tm local_time{};
    localtime_r(&time_t, &local_time);

    std::ostringstream oss;
    oss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::generateLogFilename() const {
    static unsigned sequence = 0;
    auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::tm local_time{};
    localtime_r(&time_t, &local_time);

    std::ostringstream filename;
    filename << m_log_dir << "/repolens_";
    filename << std::put_time(&local_time, "%Y%m%d_%H%M%S");
    filename << "_" << std::setfill('0') << std::setw(4) << sequence++;
    filename << ".log";

    return filename.str();
}

} // namespace Repolens
