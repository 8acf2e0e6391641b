// =================================================================
// include/Infiniloom/Logger.hpp
// =================================================================
// Header for the library-wide logging facility.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Infiniloom {

struct ScanStatistics;

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
 * @brief Process-wide logger shared by all components
 *
 * Until initialize() is called the logger writes WARNING and above to
 * stderr only and never touches the filesystem. After initialization
 * entries are also appended to a rotating log file. All methods may be
 * called concurrently from scanner worker threads.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Enable file logging
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir,
                   size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                   size_t max_log_files = 5);

    /**
     * @brief Stop file logging and return to console-only mode
     */
    void shutdown();

    void setConsoleLogLevel(LogLevel level);
    void setFileLogLevel(LogLevel level);
    void setConsoleLogging(bool enabled);

    LogLevel getConsoleLogLevel() const;
    bool isFileLoggingEnabled() const;

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome of a directory scan
     * @param root_path Scanned root directory
     * @param stats Final statistics of the scan
     * @param parallel Whether the parallel scanner produced them
     */
    void logScanSummary(const std::string& root_path, const ScanStatistics& stats, bool parallel);

    /**
     * @brief Log how many ignore rules were loaded from a source
     * @param source Rule source (file path or "defaults")
     * @param pattern_count Number of rules added
     */
    void logIgnoreRules(const std::string& source, size_t pattern_count);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    /**
     * @brief Get log level name as string
     * @param level Log level
     * @return String representation
     */
    static std::string getLevelName(LogLevel level);

    /**
     * @brief Get log level color for console output
     * @param level Log level
     * @return ANSI color code
     */
    static std::string getLevelColor(LogLevel level);

    /**
     * @brief Parse a level name ("debug", "info", "warning", ...)
     * @param name Level name, case-insensitive
     * @param level Receives the parsed level
     * @return false if the name is not a known level
     */
    static bool parseLevel(const std::string& name, LogLevel& level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::WARNING;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    mutable std::mutex m_mutex;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color);
    void rotateLogsIfNeeded();
    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    void ensureLogDirectory();
    std::string generateLogFilename();
};

#define INFINILOOM_LOG_DEBUG(component, message) \
    Infiniloom::Logger::getInstance().debug(component, message)

#define INFINILOOM_LOG_INFO(component, message) \
    Infiniloom::Logger::getInstance().info(component, message)

#define INFINILOOM_LOG_WARNING(component, message) \
    Infiniloom::Logger::getInstance().warning(component, message)

#define INFINILOOM_LOG_ERROR(component, message) \
    Infiniloom::Logger::getInstance().error(component, message)

#define INFINILOOM_LOG_CRITICAL(component, message) \
    Infiniloom::Logger::getInstance().critical(component, message)

} // namespace Infiniloom
