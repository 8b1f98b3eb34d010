// =================================================================
// include/Quill/Logger.hpp
// =================================================================
// Header for diagnostic logging to stderr and an optional log file.

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <memory>

namespace Quill {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR       ///< Error conditions
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
 * @brief Process-wide diagnostic logger
 * 
 * Console output always goes to stderr because stdout carries the
 * document stream. A log file sink can be attached from configuration.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Attach a file sink; entries are appended to it
     * @param log_file Path of the log file
     * @return true if the file could be opened
     */
    bool openLogFile(const std::string& log_file);

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome of resolving one input path
     * @param input_path Path as given by the user
     * @param candidate_count Files yielded after filtering and dedup
     */
    void logPathResolution(const std::string& input_path, size_t candidate_count);

    /**
     * @brief Log end-of-run counters
     * @param files_seen Files handed to the pipeline
     * @param documents_written Documents emitted (or recorded in stats mode)
     * @param files_skipped Binary, undecodable or failed files
     */
    void logRunSummary(size_t files_seen, size_t documents_written, size_t files_skipped);

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
     * @brief Parse a level name ("debug", "warning", ...), case-insensitive
     * @param name Level name
     * @param fallback Level returned for unknown names
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback);

    /**
     * @brief Get log level color for console output
     * @param level Log level
     * @return ANSI color code
     */
    static std::string getLevelColor(LogLevel level);

private:
    Logger();
    ~Logger();
    
    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel m_console_level;
    LogLevel m_file_level;
    bool m_console_color;
    
    std::unique_ptr<std::ofstream> m_log_file;
    std::string m_log_filename;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param include_color Whether to include color codes
     * @param include_timestamp Whether to prefix a timestamp
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool include_color, bool include_timestamp);

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
};

} // namespace Quill
