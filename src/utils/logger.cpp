#include "utils/logger.hpp"
#include <algorithm>
#include <cstddef>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace lazyverdi::tui {

std::string LogEntry::format_timestamp() const {
    auto seconds = std::chrono::system_clock::to_time_t(timestamp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis;
    return out.str();
}

std::string LogEntry::level_str() const {
    switch (level) {
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARN:     return "WARN";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::log(LogLevel level, const std::string& source, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) return;

    entries_.push_back(LogEntry{
        .timestamp = std::chrono::system_clock::now(),
        .level = level,
        .source = source,
        .message = message
    });
    const LogEntry& entry = entries_.back();

    if (file_.is_open()) {
        file_ << entry.format_timestamp() << " [" << entry.level_str() << "] "
              << entry.source << ": " << entry.message << std::endl;
    }

    while (entries_.size() > max_entries_) {
        entries_.pop_front();
    }
}

std::vector<LogEntry> Logger::get_recent_logs(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t skip = entries_.size() > count ? entries_.size() - count : 0;
    return {entries_.begin() + static_cast<std::ptrdiff_t>(skip), entries_.end()};
}

void Logger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

void Logger::set_max_entries(size_t max) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_entries_ = std::max<size_t>(max, 1);
    while (entries_.size() > max_entries_) {
        entries_.pop_front();
    }
}

bool Logger::set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    if (path.empty()) {
        return true;
    }
    file_.open(path, std::ios::out | std::ios::app);
    return file_.is_open();
}

} // namespace lazyverdi::tui
