#include "commands/parsers.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <nlohmann/json.hpp>

namespace lazyverdi::tui {

namespace {

// Lines starting with one of these switch a table into footer mode
constexpr std::array<std::string_view, 8> kFooterTriggers = {
    "Total", "Report:", "Info:", "Warning:", "Error:", "Success:", "Critical:", "Debug:"
};

// Operational noise, never shown in a footer ("Success:" and "Total" are kept)
constexpr std::array<std::string_view, 6> kFooterNoise = {
    "Report:", "Info:", "Warning:", "Error:", "Debug:", "Critical:"
};

constexpr std::array<std::string_view, 7> kReportPrefixes = {
    "Report:", "Info:", "Warning:", "Error:", "Success:", "Critical:", "Debug:"
};

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view s) {
    size_t begin = 0;
    while (begin < s.size() && is_space(s[begin])) ++begin;
    size_t end = s.size();
    while (end > begin && is_space(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

bool starts_with_any(std::string_view s, const auto& prefixes) {
    return std::any_of(prefixes.begin(), prefixes.end(),
                       [s](std::string_view p) { return s.starts_with(p); });
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

bool is_separator_line(std::string_view line) {
    bool has_dash = false;
    for (char c : line) {
        if (c == '-') {
            has_dash = true;
        } else if (!is_space(c)) {
            return false;
        }
    }
    return has_dash;
}

ParsedTable parse_bullet_list(const std::string& text, const std::string& header,
                              std::string_view section_prefix) {
    ParsedTable table;
    table.headers = {header};

    for (std::string_view line : split_lines(trim(text))) {
        std::string_view stripped = trim(line);
        if (stripped.empty() || is_report_line(stripped)) {
            continue;
        }
        if (!section_prefix.empty() && stripped.starts_with(section_prefix)) {
            continue;
        }
        if (stripped.starts_with("* ")) {
            stripped = trim(stripped.substr(2));
        }
        table.rows.push_back({std::string(stripped)});
    }
    return table;
}

std::string json_cell(const nlohmann::json& value) {
    if (value.is_null()) return "";
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

ParsedTable records_table(const nlohmann::json& records) {
    ParsedTable table;

    for (const auto& record : records) {
        if (!record.is_object()) {
            if (table.headers.empty()) table.headers = {"value"};
            continue;
        }
        for (const auto& [key, _] : record.items()) {
            if (std::find(table.headers.begin(), table.headers.end(), key) == table.headers.end()) {
                table.headers.push_back(key);
            }
        }
    }

    for (const auto& record : records) {
        std::vector<std::string> row;
        row.reserve(table.headers.size());
        if (record.is_object()) {
            for (const auto& key : table.headers) {
                auto it = record.find(key);
                row.push_back(it == record.end() ? "" : json_cell(*it));
            }
        } else {
            row.push_back(json_cell(record));
        }
        table.rows.push_back(fit_row(row, table.headers.size()));
    }

    table.footer = "Total results: " + std::to_string(records.size());
    return table;
}

} // namespace

std::vector<std::string> split_columns(std::string_view line) {
    std::vector<std::string> cells;
    size_t i = 0;
    size_t cell_start = 0;

    while (i < line.size()) {
        if (is_space(line[i])) {
            size_t run_end = i;
            while (run_end < line.size() && is_space(line[run_end])) ++run_end;
            if (run_end - i >= 2) {
                std::string_view cell = trim(line.substr(cell_start, i - cell_start));
                if (!cell.empty()) cells.emplace_back(cell);
                cell_start = run_end;
            }
            i = run_end;
        } else {
            ++i;
        }
    }

    std::string_view last = trim(line.substr(std::min(cell_start, line.size())));
    if (!last.empty()) cells.emplace_back(last);
    return cells;
}

std::vector<std::string> fit_row(const std::vector<std::string>& row, size_t width) {
    std::vector<std::string> fitted(row.begin(), row.begin() + std::min(row.size(), width));
    fitted.resize(width);
    return fitted;
}

bool is_report_line(std::string_view line) {
    return starts_with_any(trim(line), kReportPrefixes);
}

ParsedTable parse_table(const std::string& text) {
    std::string_view body = trim(text);
    std::vector<std::string_view> lines = split_lines(body);
    if (lines.empty()) {
        return {};
    }

    auto separator = std::find_if(lines.begin(), lines.end(), is_separator_line);
    if (separator == lines.end()) {
        return ParsedTable{.headers = {}, .rows = {}, .footer = std::string(body)};
    }

    ParsedTable table;
    if (separator != lines.begin()) {
        table.headers = split_columns(*(separator - 1));
    }

    std::vector<std::string_view> footer_lines;
    bool in_footer = false;

    for (auto it = separator + 1; it != lines.end(); ++it) {
        std::string_view stripped = trim(*it);

        if (stripped.empty() || starts_with_any(stripped, kFooterTriggers)) {
            in_footer = true;
        }

        if (in_footer) {
            if (!stripped.empty() && !starts_with_any(stripped, kFooterNoise)) {
                footer_lines.push_back(stripped);
            }
            continue;
        }

        auto cells = split_columns(*it);
        if (cells.empty()) continue;
        if (!table.headers.empty()) {
            cells = fit_row(cells, table.headers.size());
        }
        table.rows.push_back(std::move(cells));
    }

    for (size_t i = 0; i < footer_lines.size(); ++i) {
        if (i > 0) table.footer += '\n';
        table.footer += footer_lines[i];
    }
    return table;
}

ParsedTable parse_label_list(const std::string& text) {
    return parse_bullet_list(text, "label", {});
}

ParsedTable parse_entry_point_list(const std::string& text) {
    return parse_bullet_list(text, "entry point", "Registered entry points");
}

ParsedTable parse_subcommand_help(const std::string& text) {
    ParsedTable table;
    table.headers = {"command", "description"};

    bool in_commands = false;
    for (std::string_view line : split_lines(trim(text))) {
        std::string_view stripped = trim(line);

        if (stripped.starts_with("Commands:")) {
            in_commands = true;
            continue;
        }
        if (!in_commands) continue;

        if (!line.starts_with("  ") || stripped.starts_with("-")) {
            break;
        }

        auto parts = split_columns(stripped);
        if (parts.empty()) continue;
        table.rows.push_back({parts[0], parts.size() >= 2 ? parts[1] : ""});
    }
    return table;
}

ParsedTable parse_json_records(const std::string& text) {
    nlohmann::json document = nlohmann::json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return ParsedTable{.headers = {}, .rows = {}, .footer = std::string(trim(text))};
    }

    const nlohmann::json& data =
        (document.is_object() && document.contains("data")) ? document["data"] : document;

    if (data.is_array()) {
        return records_table(data);
    }

    if (data.is_object()) {
        for (const auto& [key, value] : data.items()) {
            if (value.is_array()) {
                return records_table(value);
            }
        }

        ParsedTable table;
        table.headers = {"key", "value"};
        for (const auto& [key, value] : data.items()) {
            table.rows.push_back({key, json_cell(value)});
        }
        return table;
    }

    return ParsedTable{.headers = {}, .rows = {}, .footer = json_cell(data)};
}

} // namespace lazyverdi::tui
