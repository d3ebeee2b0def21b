#include "panels/info_panel.hpp"
#include "utils/colors.hpp"
#include <sstream>

namespace lazyverdi::tui {

namespace {

// Status lines carry a leading check, warning or cross mark
int line_color(const std::string& line) {
    if (line.rfind("✔", 0) == 0) return colors::ACCENT_GREEN;
    if (line.rfind("⚠", 0) == 0) return colors::ACCENT_YELLOW;
    if (line.rfind("✘", 0) == 0) return colors::ACCENT_RED;
    return colors::TEXT_PRIMARY;
}

} // namespace

InfoPanel::InfoPanel(const std::string& id, const std::string& title)
    : BasePanel(id, title) {
}

void InfoPanel::set_text(const std::string& text) {
    lines_.clear();
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines_.push_back(line);
    }
    has_content_ = true;
    error_.clear();
    loading_ = false;
}

void InfoPanel::render(WINDOW* window, bool focused) {
    werase(window);
    draw_frame(window, focused);

    int height = getmaxy(window);
    int width = getmaxx(window);

    if (draw_status(window)) {
        return;
    }
    if (!has_content_) {
        wattron(window, COLOR_PAIR(colors::TEXT_DIM));
        put_clipped(window, 1, 2, loading_ ? "Loading..." : "No data", width - 4);
        wattroff(window, COLOR_PAIR(colors::TEXT_DIM));
        return;
    }

    int visible_rows = height - 2;
    update_scroll(static_cast<int>(lines_.size()), visible_rows);

    for (int i = 0; i < visible_rows; ++i) {
        size_t index = static_cast<size_t>(scroll_offset_ + i);
        if (index >= lines_.size()) break;
        int color = line_color(lines_[index]);
        wattron(window, COLOR_PAIR(color));
        put_clipped(window, 1 + i, 2, lines_[index], width - 4);
        wattroff(window, COLOR_PAIR(color));
    }
}

} // namespace lazyverdi::tui
