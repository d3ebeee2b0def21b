#include "commands/formatters.hpp"
#include <cctype>
#include <sstream>
#include <vector>

namespace lazyverdi::tui {

namespace {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines, size_t count) {
    std::string out;
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

bool is_blank(const std::string& line) {
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

std::string drop_trailing_blank_lines(const std::string& text) {
    auto lines = split_lines(text);
    size_t count = lines.size();
    while (count > 0 && is_blank(lines[count - 1])) --count;
    return join_lines(lines, count);
}

} // namespace

std::string strip_command_echo(const std::string& text) {
    auto lines = split_lines(text);
    if (!lines.empty() && trim(lines.back()).starts_with("$ verdi")) {
        return join_lines(lines, lines.size() - 1);
    }
    return text;
}

std::string format_table_output(const std::string& text) {
    return drop_trailing_blank_lines(strip_command_echo(text));
}

std::string format_process_list(const std::string& text) {
    return drop_trailing_blank_lines(strip_command_echo(text));
}

std::string format_status_output(const std::string& text) {
    return trim(strip_command_echo(text));
}

std::string no_format(const std::string& text) {
    return text;
}

} // namespace lazyverdi::tui
