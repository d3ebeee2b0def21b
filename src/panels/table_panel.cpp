#include "panels/table_panel.hpp"
#include "utils/colors.hpp"
#include <algorithm>
#include <sstream>

namespace lazyverdi::tui {

namespace {

constexpr int kColumnGap = 2;
constexpr int kMaxColumnWidth = 48;

std::vector<std::string> footer_lines(const std::string& footer) {
    std::vector<std::string> lines;
    std::istringstream stream(footer);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

TablePanel::TablePanel(const std::string& id, const std::string& title)
    : BasePanel(id, title) {
}

void TablePanel::set_table(ParsedTable table) {
    table_ = std::move(table);
    has_content_ = true;
    error_.clear();
    loading_ = false;
}

void TablePanel::set_text(const std::string& text) {
    set_table(ParsedTable{.headers = {}, .rows = {}, .footer = text});
}

std::vector<int> TablePanel::column_widths(int available) const {
    size_t columns = table_.headers.size();
    for (const auto& row : table_.rows) {
        columns = std::max(columns, row.size());
    }

    std::vector<int> widths(columns, 0);
    for (size_t i = 0; i < table_.headers.size(); ++i) {
        widths[i] = static_cast<int>(table_.headers[i].size());
    }
    for (const auto& row : table_.rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], static_cast<int>(row[i].size()));
        }
    }
    for (auto& w : widths) {
        w = std::min(w, kMaxColumnWidth);
    }

    // The last visible column takes whatever is left
    int used = 0;
    for (size_t i = 0; i < widths.size(); ++i) {
        if (used + widths[i] > available) {
            widths[i] = std::max(0, available - used);
        }
        used += widths[i] + kColumnGap;
    }
    return widths;
}

void TablePanel::render(WINDOW* window, bool focused) {
    werase(window);
    draw_frame(window, focused);

    int height = getmaxy(window);
    int width = getmaxx(window);
    int inner_width = width - 4;

    if (draw_status(window)) {
        return;
    }
    if (!has_content_) {
        wattron(window, COLOR_PAIR(colors::TEXT_DIM));
        put_clipped(window, 1, 2, loading_ ? "Loading..." : "No data", inner_width);
        wattroff(window, COLOR_PAIR(colors::TEXT_DIM));
        return;
    }

    auto footer = footer_lines(table_.footer);
    auto widths = column_widths(inner_width);
    int y = 1;

    auto draw_row = [&](const std::vector<std::string>& cells) {
        int x = 2;
        for (size_t i = 0; i < widths.size() && i < cells.size(); ++i) {
            if (widths[i] > 0) {
                put_clipped(window, y, x, cells[i], widths[i]);
            }
            x += widths[i] + kColumnGap;
            if (x >= width - 2) break;
        }
    };

    if (!table_.headers.empty()) {
        wattron(window, COLOR_PAIR(colors::ACCENT_CYAN) | A_BOLD);
        draw_row(table_.headers);
        wattroff(window, COLOR_PAIR(colors::ACCENT_CYAN) | A_BOLD);
        y++;
        wattron(window, COLOR_PAIR(colors::BORDER));
        mvwhline(window, y++, 2, ACS_HLINE, std::max(0, inner_width));
        wattroff(window, COLOR_PAIR(colors::BORDER));
    }

    int footer_rows = std::min(static_cast<int>(footer.size()), std::max(0, (height - 2 - y) / 2));
    int visible_rows = std::max(0, height - 1 - y - footer_rows);
    update_scroll(static_cast<int>(table_.rows.size()), visible_rows);

    for (int i = 0; i < visible_rows; ++i) {
        size_t row = static_cast<size_t>(scroll_offset_ + i);
        if (row >= table_.rows.size()) break;
        draw_row(table_.rows[row]);
        y++;
    }

    if (footer_rows > 0) {
        int fy = height - 1 - footer_rows;
        wattron(window, COLOR_PAIR(colors::TEXT_DIM));
        for (int i = 0; i < footer_rows; ++i) {
            put_clipped(window, fy + i, 2, footer[static_cast<size_t>(i)], inner_width);
        }
        wattroff(window, COLOR_PAIR(colors::TEXT_DIM));
    }
}

} // namespace lazyverdi::tui
