#include "panels/base_panel.hpp"
#include "utils/colors.hpp"
#include <algorithm>

namespace lazyverdi::tui {

BasePanel::BasePanel(const std::string& id, const std::string& title)
    : panel_id_(id), title_(title) {
}

void BasePanel::set_loading(bool loading) {
    loading_ = loading;
    if (loading) {
        error_.clear();
    }
}

void BasePanel::set_error(const std::string& message) {
    error_ = message;
    loading_ = false;
}

bool BasePanel::handle_input(int ch) {
    // Default input handling - scrolling
    switch (ch) {
        case KEY_UP:
        case 'k':
            if (scroll_offset_ > 0) {
                scroll_offset_--;
                return true;
            }
            break;
        case KEY_DOWN:
        case 'j':
            if (scroll_offset_ < max_scroll_) {
                scroll_offset_++;
                return true;
            }
            break;
        case KEY_PPAGE: // Page up
            scroll_offset_ = std::max(0, scroll_offset_ - page_size_);
            return true;
        case KEY_NPAGE: // Page down
            scroll_offset_ = std::min(max_scroll_, scroll_offset_ + page_size_);
            return true;
        case KEY_HOME:
        case 'g':
            scroll_offset_ = 0;
            return true;
        case KEY_END:
        case 'G':
            scroll_offset_ = max_scroll_;
            return true;
    }
    return false;
}

void BasePanel::update_scroll(int total_rows, int visible_rows) {
    page_size_ = std::max(1, visible_rows);
    max_scroll_ = std::max(0, total_rows - visible_rows);
    scroll_offset_ = std::clamp(scroll_offset_, 0, max_scroll_);
}

void BasePanel::draw_frame(WINDOW* window, bool focused) {
    int width = getmaxx(window);
    int border = focused ? colors::BORDER_FOCUSED : colors::BORDER;

    wattron(window, COLOR_PAIR(border));
    box(window, 0, 0);
    wattroff(window, COLOR_PAIR(border));

    std::string label = " " + title_ + " ";
    wattron(window, COLOR_PAIR(focused ? colors::HEADER_ACTIVE : colors::HEADER));
    put_clipped(window, 0, 2, label, width - 4);
    wattroff(window, COLOR_PAIR(focused ? colors::HEADER_ACTIVE : colors::HEADER));

    int label_width = static_cast<int>(label.size());
    if (loading_ && width - 4 - label_width > 0) {
        wattron(window, COLOR_PAIR(colors::ACCENT_YELLOW));
        put_clipped(window, 0, 2 + label_width, " loading ", width - 4 - label_width);
        wattroff(window, COLOR_PAIR(colors::ACCENT_YELLOW));
    }
}

bool BasePanel::draw_status(WINDOW* window) {
    int width = getmaxx(window);
    int height = getmaxy(window);

    if (!error_.empty()) {
        wattron(window, COLOR_PAIR(colors::ACCENT_RED));
        int y = 1;
        size_t start = 0;
        while (start <= error_.size() && y < height - 1) {
            size_t end = error_.find('\n', start);
            if (end == std::string::npos) end = error_.size();
            put_clipped(window, y++, 2, error_.substr(start, end - start), width - 4);
            start = end + 1;
        }
        wattroff(window, COLOR_PAIR(colors::ACCENT_RED));
        return true;
    }
    return false;
}

void BasePanel::put_clipped(WINDOW* window, int y, int x, const std::string& text, int width) {
    if (width <= 0) return;
    mvwaddnstr(window, y, x, text.c_str(), width);
}

} // namespace lazyverdi::tui
