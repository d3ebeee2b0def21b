#include "panels/results_panel.hpp"
#include "core/diagnostic_sink.hpp"
#include "utils/colors.hpp"

namespace lazyverdi::tui {

ResultsPanel::ResultsPanel(const std::string& id, const std::string& title,
                           const DiagnosticSink& sink)
    : BasePanel(id, title), sink_(sink) {
}

bool ResultsPanel::handle_input(int ch) {
    bool handled = BasePanel::handle_input(ch);
    if (handled) {
        follow_ = scroll_offset_ >= max_scroll_;
    }
    return handled;
}

bool ResultsPanel::sync() {
    uint64_t revision = sink_.revision();
    if (synced_ && revision == seen_revision_) {
        return false;
    }
    lines_ = sink_.lines();
    seen_revision_ = revision;
    synced_ = true;
    return true;
}

void ResultsPanel::render(WINDOW* window, bool focused) {
    werase(window);
    draw_frame(window, focused);

    int height = getmaxy(window);
    int width = getmaxx(window);
    int visible_rows = height - 2;

    sync();
    update_scroll(static_cast<int>(lines_.size()), visible_rows);
    if (follow_) {
        scroll_offset_ = max_scroll_;
    }

    for (int i = 0; i < visible_rows; ++i) {
        size_t index = static_cast<size_t>(scroll_offset_ + i);
        if (index >= lines_.size()) break;
        const auto& line = lines_[index];
        bool is_error = line.rfind("Error", 0) == 0;
        if (is_error) wattron(window, COLOR_PAIR(colors::ACCENT_RED));
        put_clipped(window, 1 + i, 2, line, width - 4);
        if (is_error) wattroff(window, COLOR_PAIR(colors::ACCENT_RED));
    }
}

} // namespace lazyverdi::tui
