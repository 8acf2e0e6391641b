// =================================================================
// src/Infiniloom/Logger.cpp
// =================================================================
// Implementation for the library-wide logging facility.

#include "Infiniloom/Logger.hpp"
#include "Infiniloom/Types.hpp"
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <vector>

namespace Infiniloom {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_log_dir = log_dir;
        m_max_log_size = max_log_size;
        m_max_log_files = max_log_files;
        m_current_log_size = 0;

        ensureLogDirectory();

        m_current_log_filename = generateLogFilename();
        m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
        if (!m_current_log_file->is_open()) {
            std::cerr << "[WARN] Cannot open log file: " << m_current_log_filename << std::endl;
            m_current_log_file.reset();
        }
    }

    info("Logger", "File logging initialized", m_log_dir);
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_current_log_file) {
        m_current_log_file->flush();
        m_current_log_file.reset();
    }
    m_current_log_filename.clear();
    m_current_log_size = 0;
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

LogLevel Logger::getConsoleLogLevel() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_console_level;
}

bool Logger::isFileLoggingEnabled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current_log_file != nullptr;
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

void Logger::logScanSummary(const std::string& root_path, const ScanStatistics& stats, bool parallel) {
    std::ostringstream context;
    context << "Files: " << stats.total_files << ", ";
    context << "Bytes: " << stats.total_bytes << ", ";
    context << "Skipped binary: " << stats.skipped_binary << ", ";
    context << "Skipped size: " << stats.skipped_size << ", ";
    context << "Ignored: " << stats.skipped_ignored << ", ";
    context << "Hidden: " << stats.skipped_hidden << ", ";
    context << "Duration: " << stats.scan_time_ms << "ms";

    info(parallel ? "ParallelScanner" : "DirectoryScanner", "Scan of " + root_path + " completed", context.str());

    if (stats.skipped_unreadable > 0 || stats.directories_failed > 0) {
        warning(parallel ? "ParallelScanner" : "DirectoryScanner",
               "Some entries could not be read",
               "Files: " + std::to_string(stats.skipped_unreadable) +
               ", Directories: " + std::to_string(stats.directories_failed));
    }
}

void Logger::logIgnoreRules(const std::string& source, size_t pattern_count) {
    if (pattern_count == 0) {
        return;
    }
    debug("IgnoreMatcher", "Loaded ignore rules", source + ": " + std::to_string(pattern_count) + " patterns");
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
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        level = LogLevel::DEBUG;
    } else if (lower == "info") {
        level = LogLevel::INFO;
    } else if (lower == "warning" || lower == "warn") {
        level = LogLevel::WARNING;
    } else if (lower == "error") {
        level = LogLevel::ERROR;
    } else if (lower == "critical" || lower == "crit") {
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

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) {
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

    formatted << entry.component << ": ";
    formatted << entry.message;

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
        m_current_log_file.reset();
    }

    try {
        std::vector<std::filesystem::path> log_files;
        for (const auto& entry : std::filesystem::directory_iterator(m_log_dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log" &&
                entry.path() != std::filesystem::path(m_current_log_filename)) {
                log_files.push_back(entry.path());
            }
        }

        // Newest first
        std::sort(log_files.begin(), log_files.end(),
                 [](const std::filesystem::path& a, const std::filesystem::path& b) {
                     return std::filesystem::last_write_time(a) > std::filesystem::last_write_time(b);
                 });

        // The current file counts towards the limit
        size_t keep = m_max_log_files > 0 ? m_max_log_files - 1 : 0;
        for (size_t i = keep; i < log_files.size(); i++) {
            std::filesystem::remove(log_files[i]);
        }

    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[WARN] Log rotation failed: " << e.what() << std::endl;
    }
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

void Logger::ensureLogDirectory() {
    std::error_code ec;
    std::filesystem::create_directories(m_log_dir, ec);
    if (ec) {
        std::cerr << "[ERROR] Cannot create log directory: " << ec.message() << std::endl;
        m_log_dir = ".";
    }
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream filename;
    filename << m_log_dir << "/infiniloom_";
    filename << std::put_time(&local_tm, "%Y%m%d_%H%M%S");

    std::string base = filename.str();
    std::string candidate = base + ".log";
    for (int suffix = 1; std::filesystem::exists(candidate) && suffix < 1000; ++suffix) {
        candidate = base + "_" + std::to_string(suffix) + ".log";
    }
    return candidate;
}

} // namespace Infiniloom
