#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <regex>
#include <string>
#include <vector>

namespace lazyverdi::tui {

std::vector<std::string> default_benign_patterns();
std::vector<std::string> default_once_per_session_patterns();

// Friendly text for common backend failures, raw error otherwise.
std::string format_error_message(const std::string& command_name, const std::string& error);

// Shared "details" log fed by stderr of every command plus notifications.
// Benign messages are dropped, once-per-session messages are shown the first
// time only. Patterns are ECMAScript regexes searched in the normalized text
// (lowercase, whitespace runs collapsed to one space).
class DiagnosticSink {
public:
    DiagnosticSink(const std::vector<std::string>& benign_patterns,
                   const std::vector<std::string>& once_patterns,
                   size_t max_lines = 500);

    // Returns true when something was written.
    bool report(const std::string& command_name, const std::string& stderr_text);

    // Appends text verbatim, one entry per line.
    void write(const std::string& text);

    std::vector<std::string> lines() const;

    // Bumped on every change; the details panel copies lines only when it moves.
    uint64_t revision() const;

    void clear();

    static std::string normalize(const std::string& text);

private:
    void append_locked(const std::string& text);

    std::vector<std::regex> benign_;
    std::vector<std::regex> once_;
    std::vector<bool> once_fired_;
    size_t max_lines_;

    mutable std::mutex mutex_;
    std::deque<std::string> lines_;
    uint64_t revision_ = 0;
};

} // namespace lazyverdi::tui
