#pragma once

#include <chrono>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace lazyverdi::tui {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string source;
    std::string message;

    std::string format_timestamp() const;   // HH:MM:SS.mmm
    std::string level_str() const;
};

// Process-wide log. Entries below the minimum level are dropped; the rest go
// to a bounded ring (shown in the details panel) and to the log file if set.
// The terminal belongs to curses, so nothing is written to stdout or stderr.
class Logger {
public:
    static Logger& instance();

    void log(LogLevel level, const std::string& source, const std::string& message);

    // Oldest first, at most `count` entries.
    std::vector<LogEntry> get_recent_logs(size_t count = 100) const;
    void clear();

    void set_min_level(LogLevel level);
    void set_max_entries(size_t max);

    // Appends to `path`; an empty path closes the current file.
    bool set_log_file(const std::string& path);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex mutex_;
    std::deque<LogEntry> entries_;
    LogLevel min_level_ = LogLevel::DEBUG;
    size_t max_entries_ = 1000;
    std::ofstream file_;
};

#define LOG_DEBUG(source, msg) lazyverdi::tui::Logger::instance().log(lazyverdi::tui::LogLevel::DEBUG, source, msg)
#define LOG_INFO(source, msg) lazyverdi::tui::Logger::instance().log(lazyverdi::tui::LogLevel::INFO, source, msg)
#define LOG_WARN(source, msg) lazyverdi::tui::Logger::instance().log(lazyverdi::tui::LogLevel::WARN, source, msg)
#define LOG_ERROR(source, msg) lazyverdi::tui::Logger::instance().log(lazyverdi::tui::LogLevel::ERROR, source, msg)
#define LOG_CRITICAL(source, msg) lazyverdi::tui::Logger::instance().log(lazyverdi::tui::LogLevel::CRITICAL, source, msg)

} // namespace lazyverdi::tui
