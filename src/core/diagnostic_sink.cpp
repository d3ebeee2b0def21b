#include "core/diagnostic_sink.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace lazyverdi::tui {

namespace {

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    size_t begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) return {};
    return text.substr(begin, text.find_last_not_of(ws) - begin + 1);
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::vector<std::regex> compile(const std::vector<std::string>& patterns) {
    std::vector<std::regex> compiled;
    for (const auto& pattern : patterns) {
        try {
            compiled.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            LOG_WARN("DiagnosticSink", "Ignoring invalid pattern '" + pattern + "': " + e.what());
        }
    }
    return compiled;
}

} // namespace

std::vector<std::string> default_benign_patterns() {
    return {"configuration file.*does not exist"};
}

std::vector<std::string> default_once_per_session_patterns() {
    return {"no (default |aiida )?profile"};
}

std::string format_error_message(const std::string& command_name, const std::string& error) {
    std::string name = lowercase(command_name);
    if (name.find("profile") != std::string::npos ||
        lowercase(error).find("profile") != std::string::npos) {
        return "No AiiDA profile configured.\n\n"
               "Please run:\n"
               "  verdi quicksetup  (for quick setup)\n"
               "  verdi setup       (for detailed setup)";
    }
    if (name.find("computer") != std::string::npos && error.find("No") != std::string::npos) {
        return "No computers configured.\n\nUse 'verdi computer setup' to add computers.";
    }
    if (name.find("process") != std::string::npos && error.find("No") != std::string::npos) {
        return "No processes found.\n\nSubmit calculations to see them here.";
    }
    return error.empty() ? "Command failed" : error;
}

DiagnosticSink::DiagnosticSink(const std::vector<std::string>& benign_patterns,
                               const std::vector<std::string>& once_patterns,
                               size_t max_lines)
    : benign_(compile(benign_patterns)),
      once_(compile(once_patterns)),
      once_fired_(once_.size(), false),
      max_lines_(std::max<size_t>(max_lines, 1)) {
}

std::string DiagnosticSink::normalize(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool in_space = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            in_space = true;
            continue;
        }
        if (in_space && !out.empty()) out += ' ';
        in_space = false;
        out += static_cast<char>(std::tolower(c));
    }
    return out;
}

bool DiagnosticSink::report(const std::string& command_name, const std::string& stderr_text) {
    std::string error = trim(stderr_text);
    if (error.empty()) return false;

    std::string normalized = normalize(error);
    for (const auto& pattern : benign_) {
        if (std::regex_search(normalized, pattern)) {
            LOG_DEBUG("DiagnosticSink", "Suppressed benign warning from " + command_name);
            return false;
        }
    }

    std::string message = format_error_message(command_name, error);
    std::string normalized_message = normalize(message);

    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < once_.size(); ++i) {
        if (std::regex_search(normalized, once_[i]) ||
            std::regex_search(normalized_message, once_[i])) {
            if (once_fired_[i]) {
                return false;
            }
            once_fired_[i] = true;
            break;
        }
    }

    append_locked(message);
    return true;
}

void DiagnosticSink::write(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    append_locked(text);
}

void DiagnosticSink::append_locked(const std::string& text) {
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines_.push_back(line);
    }
    if (text.empty()) {
        lines_.push_back("");
    }
    while (lines_.size() > max_lines_) {
        lines_.pop_front();
    }
    ++revision_;
}

std::vector<std::string> DiagnosticSink::lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {lines_.begin(), lines_.end()};
}

uint64_t DiagnosticSink::revision() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return revision_;
}

void DiagnosticSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
    ++revision_;
}

} // namespace lazyverdi::tui
