#include "ui_manager.hpp"
#include "panels/info_panel.hpp"
#include "panels/results_panel.hpp"
#include "panels/table_panel.hpp"
#include "utils/logger.hpp"
#include "utils/colors.hpp"
#include <algorithm>
#include <clocale>

namespace lazyverdi::tui {

namespace {

constexpr int kMinPanelHeight = 3;

// Splits `total` rows between panels by weight, remainder to the last one.
std::vector<int> split_heights(int total, const std::vector<int>& weights) {
    int weight_sum = 0;
    for (int w : weights) weight_sum += w;

    std::vector<int> heights;
    int used = 0;
    for (size_t i = 0; i < weights.size(); ++i) {
        int h = (i + 1 == weights.size())
            ? total - used
            : std::max(kMinPanelHeight, total * weights[i] / std::max(1, weight_sum));
        heights.push_back(h);
        used += h;
    }
    return heights;
}

} // namespace

void LayoutDimensions::calculate(int tw, int th, const LayoutSettings& settings,
                                 const std::string& focused) {
    term_width = tw;
    term_height = th;
    panels.clear();

    int body_height = std::max(0, term_height - status_bar_height);
    left_width = term_width * settings.left_width_percent / 100;
    right_width = term_width - left_width;

    // Left column
    const std::vector<std::string> left_ids = {"panel-1", "panel-2", "panel-3", "panel-4"};
    std::vector<int> weights = {1, 2, 2, 1};
    auto focused_it = std::find(left_ids.begin(), left_ids.end(), focused);
    std::vector<int> heights;

    if (focused_it != left_ids.end()) {
        int focused_height = std::max(kMinPanelHeight, body_height * settings.focused_height_percent / 100);
        int rest = body_height - focused_height;
        auto rest_heights = split_heights(rest, {1, 1, 1});
        size_t focused_index = static_cast<size_t>(focused_it - left_ids.begin());
        size_t r = 0;
        for (size_t i = 0; i < left_ids.size(); ++i) {
            heights.push_back(i == focused_index ? focused_height : rest_heights[r++]);
        }
    } else {
        heights = split_heights(body_height, weights);
    }

    int y = 0;
    for (size_t i = 0; i < left_ids.size(); ++i) {
        panels[left_ids[i]] = PanelRect{.y = y, .x = 0, .height = heights[i], .width = left_width};
        y += heights[i];
    }

    // Right column
    int details_height = body_height * settings.results_height_percent / 100;
    panels["panel-0"] = PanelRect{.y = 0, .x = left_width, .height = details_height, .width = right_width};
    panels["panel-5"] = PanelRect{.y = details_height, .x = left_width,
                                  .height = body_height - details_height, .width = right_width};
}

UIManager::UIManager(LayoutSettings settings)
    : settings_(settings) {
}

UIManager::~UIManager() {
    shutdown();
}

void UIManager::init() {
    if (initialized_) return;

    std::setlocale(LC_ALL, "");

    // Initialize ncurses
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);
    // Note: timeout will be set in main loop

    colors::init_color_pairs();

    std::lock_guard<std::mutex> lock(mutex_);
    int h, w;
    getmaxyx(stdscr, h, w);
    layout_.calculate(w, h, settings_, focused_);
    create_windows();

    initialized_ = true;
    LOG_INFO("UIManager", "Initialized (" + std::to_string(w) + "x" + std::to_string(h) + ")");
}

void UIManager::shutdown() {
    if (!initialized_) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        destroy_windows();
    }
    endwin();

    initialized_ = false;
    LOG_INFO("UIManager", "Shut down");
}

void UIManager::add_table_panel(const std::string& id, const std::string& title) {
    std::lock_guard<std::mutex> lock(mutex_);
    panels_[id] = std::make_unique<TablePanel>(id, title);
    layout_dirty_ = true;
}

void UIManager::add_info_panel(const std::string& id, const std::string& title) {
    std::lock_guard<std::mutex> lock(mutex_);
    panels_[id] = std::make_unique<InfoPanel>(id, title);
    layout_dirty_ = true;
}

void UIManager::add_results_panel(const std::string& id, const std::string& title,
                                  const DiagnosticSink& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    panels_[id] = std::make_unique<ResultsPanel>(id, title, sink);
    layout_dirty_ = true;
}

void UIManager::set_focus(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (focused_ != id) {
        focused_ = id;
        layout_dirty_ = true;
    }
}

std::string UIManager::focus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return focused_;
}

void UIManager::create_windows() {
    destroy_windows();

    for (const auto& [id, rect] : layout_.panels) {
        if (rect.height <= 0 || rect.width <= 0) continue;
        windows_[id] = newwin(rect.height, rect.width, rect.y, rect.x);
    }

    // Status bar
    status_bar_win_ = newwin(layout_.status_bar_height, layout_.term_width,
                             layout_.term_height - layout_.status_bar_height, 0);
    layout_dirty_ = false;
}

void UIManager::destroy_windows() {
    for (auto& [id, win] : windows_) {
        if (win) delwin(win);
    }
    windows_.clear();
    if (status_bar_win_) { delwin(status_bar_win_); status_bar_win_ = nullptr; }
}

void UIManager::update_layout() {
    std::lock_guard<std::mutex> lock(mutex_);
    int h, w;
    getmaxyx(stdscr, h, w);

    if (h != layout_.term_height || w != layout_.term_width) {
        layout_dirty_ = true;
        LOG_INFO("UIManager", "Layout updated (" + std::to_string(w) + "x" + std::to_string(h) + ")");
    }
}

void UIManager::render_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) return;

    if (layout_dirty_) {
        int h, w;
        getmaxyx(stdscr, h, w);
        layout_.calculate(w, h, settings_, focused_);
        erase();
        wnoutrefresh(stdscr);
        create_windows();
    }

    for (const auto& [id, win] : windows_) {
        auto it = panels_.find(id);
        if (it == panels_.end()) continue;
        it->second->render(win, id == focused_);
        wnoutrefresh(win);
    }

    render_status_bar();
    doupdate();
}

void UIManager::render_status_bar() {
    if (!status_bar_win_) return;

    werase(status_bar_win_);

    wattron(status_bar_win_, COLOR_PAIR(colors::HEADER));
    mvwhline(status_bar_win_, 0, 0, ' ', layout_.term_width);
    mvwaddnstr(status_bar_win_, 0, 1, status_text_.c_str(), std::max(0, layout_.term_width - 2));
    wattroff(status_bar_win_, COLOR_PAIR(colors::HEADER));

    wnoutrefresh(status_bar_win_);
}

bool UIManager::route_to_focused(int ch) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* panel = find_locked(focused_);
    return panel && panel->handle_input(ch);
}

int UIManager::get_input() {
    return getch();
}

void UIManager::set_status(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_text_ = text;
}

void UIManager::show_loading(const std::string& panel_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* panel = find_locked(panel_id)) {
        panel->set_loading(true);
    }
}

void UIManager::clear_loading(const std::string& panel_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* panel = find_locked(panel_id)) {
        panel->set_loading(false);
    }
}

void UIManager::show_content(const std::string& panel_id, size_t tab_index,
                             const TabContent& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* panel = find_locked(panel_id);
    if (!panel) {
        LOG_WARN("UIManager", "No panel " + panel_id + " for tab " + std::to_string(tab_index));
        return;
    }

    if (auto* table_panel = dynamic_cast<TablePanel*>(panel)) {
        if (const auto* table = std::get_if<ParsedTable>(&content)) {
            table_panel->set_table(*table);
        } else {
            table_panel->set_text(std::get<std::string>(content));
        }
    } else if (auto* info_panel = dynamic_cast<InfoPanel*>(panel)) {
        if (const auto* text = std::get_if<std::string>(&content)) {
            info_panel->set_text(*text);
        } else {
            info_panel->set_text(std::get<ParsedTable>(content).footer);
        }
    }
}

void UIManager::show_error(const std::string& panel_id, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* panel = find_locked(panel_id)) {
        panel->set_error(message);
    }
}

void UIManager::update_tabs(const std::string& panel_id, const std::string& title) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* panel = find_locked(panel_id)) {
        panel->set_title(title);
    }
}

BasePanel* UIManager::find_locked(const std::string& id) {
    auto it = panels_.find(id);
    return it == panels_.end() ? nullptr : it->second.get();
}

} // namespace lazyverdi::tui
