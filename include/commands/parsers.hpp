#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace lazyverdi::tui {

struct ParsedTable {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;
    std::string footer;

    bool operator==(const ParsedTable& other) const = default;
};

using TableParser = std::function<ParsedTable(const std::string&)>;

// Splits a line on runs of two or more whitespace characters. Cells are
// trimmed and empty cells dropped.
std::vector<std::string> split_columns(std::string_view line);

// Pads with "" or truncates so the row has exactly `width` cells.
std::vector<std::string> fit_row(const std::vector<std::string>& row, size_t width);

// True for operational noise lines such as "Report: ..." or "Warning: ...".
bool is_report_line(std::string_view line);

// Parses column output of the form
//
//   Column1  Column2
//   -------  -------
//   value1   value2
//
//   Total results: 1
//
// Never fails: text without a dash separator comes back as footer only.
ParsedTable parse_table(const std::string& text);

// Bullet lists ("* localhost") as a single "label" column.
ParsedTable parse_label_list(const std::string& text);

// Bullet lists of plugin entry points as a single "entry point" column.
ParsedTable parse_entry_point_list(const std::string& text);

// Extracts the "Commands:" section of a --help text as command/description rows.
ParsedTable parse_subcommand_help(const std::string& text);

// REST API responses: {"data": {...}} with either a list of records, an
// object holding such a list, or a flat object of scalars.
ParsedTable parse_json_records(const std::string& text);

} // namespace lazyverdi::tui
