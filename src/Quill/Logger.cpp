// =================================================================
// src/Quill/Logger.cpp
// =================================================================
// Implementation for the diagnostic logger.

#include "Quill/Logger.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <unistd.h>

namespace Quill {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : m_console_level(LogLevel::WARNING),
      m_file_level(LogLevel::DEBUG),
      m_console_color(isatty(STDERR_FILENO) != 0)
{
}

Logger::~Logger() {
    flush();
}

bool Logger::openLogFile(const std::string& log_file) {
    auto stream = std::make_unique<std::ofstream>(log_file, std::ios::app);
    if (!stream->is_open()) {
        warning("Logger", "Cannot open log file", log_file);
        return false;
    }
    m_log_file = std::move(stream);
    m_log_filename = log_file;
    debug("Logger", "Log file attached", m_log_filename);
    return true;
}

void Logger::setConsoleLogLevel(LogLevel level) {
    m_console_level = level;
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

void Logger::logPathResolution(const std::string& input_path, size_t candidate_count) {
    std::ostringstream context;
    context << "Input: " << input_path << ", ";
    context << "Candidates: " << candidate_count;
    
    info("PathScanner", "Input path resolved", context.str());
    
    if (candidate_count == 0) {
        debug("PathScanner", "No files matched under " + input_path);
    }
}

void Logger::logRunSummary(size_t files_seen, size_t documents_written, size_t files_skipped) {
    std::ostringstream context;
    context << "Seen: " << files_seen << ", ";
    context << "Written: " << documents_written << ", ";
    context << "Skipped: " << files_skipped;
    
    info("Core", "Run completed", context.str());
}

void Logger::flush() {
    if (m_log_file && m_log_file->is_open()) {
        m_log_file->flush();
    }
    std::cerr.flush();
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

LogLevel Logger::parseLevel(const std::string& name, LogLevel fallback) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARNING;
    if (lowered == "error") return LogLevel::ERROR;
    return fallback;
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        default: return "\033[0m";                   // Reset
    }
}

void Logger::logEntry(const LogEntry& entry) {
    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (entry.level < m_console_level) {
        return;
    }
    
    std::cerr << formatEntry(entry, m_console_color, false) << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_log_file || entry.level < m_file_level) {
        return;
    }
    
    *m_log_file << formatEntry(entry, false, true) << '\n';
    
    // Errors reach the file even if the process dies right after
    if (entry.level >= LogLevel::ERROR) {
        m_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color, bool include_timestamp) {
    std::ostringstream formatted;
    
    if (include_timestamp) {
        formatted << formatTimestamp(entry.timestamp) << " ";
    }
    
    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m"; // Reset color
    }
    formatted << " ";
    
    formatted << entry.component << ": ";
    formatted << entry.message;
    
    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }
    
    return formatted.str();
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

} // namespace Quill
