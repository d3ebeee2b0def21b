#pragma once

#include "core/render_sink.hpp"
#include "panels/base_panel.hpp"
#include <ncurses.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lazyverdi::tui {

class DiagnosticSink;

struct LayoutSettings {
    int left_width_percent = 40;
    int results_height_percent = 80;
    int focused_height_percent = 50;
};

struct PanelRect {
    int y = 0;
    int x = 0;
    int height = 0;
    int width = 0;
};

struct LayoutDimensions {
    // Terminal size
    int term_width = 0;
    int term_height = 0;

    // Status bar at bottom
    int status_bar_height = 1;

    int left_width = 0;
    int right_width = 0;

    // panel-1..panel-4 stacked on the left; panel-0 (details) and panel-5 on
    // the right. The focused left panel gets `focused_height_percent`.
    std::map<std::string, PanelRect> panels;

    void calculate(int tw, int th, const LayoutSettings& settings, const std::string& focused);
};

class UIManager : public RenderSink {
public:
    explicit UIManager(LayoutSettings settings);
    ~UIManager() override;

    // Initialization
    void init();
    void shutdown();

    // Panel management
    void add_table_panel(const std::string& id, const std::string& title);
    void add_info_panel(const std::string& id, const std::string& title);
    void add_results_panel(const std::string& id, const std::string& title,
                           const DiagnosticSink& sink);

    void set_focus(const std::string& id);
    std::string focus() const;

    // Layout management
    void update_layout();
    void render_all();

    // Input routing: scroll keys go to the focused panel
    bool route_to_focused(int ch);
    int get_input();

    void set_status(const std::string& text);

    // RenderSink
    void show_loading(const std::string& panel_id) override;
    void clear_loading(const std::string& panel_id) override;
    void show_content(const std::string& panel_id, size_t tab_index,
                      const TabContent& content) override;
    void show_error(const std::string& panel_id, const std::string& message) override;
    void update_tabs(const std::string& panel_id, const std::string& title) override;

private:
    LayoutSettings settings_;
    LayoutDimensions layout_;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<BasePanel>> panels_;
    std::map<std::string, WINDOW*> windows_;
    WINDOW* status_bar_win_ = nullptr;
    std::string focused_;
    std::string status_text_;
    bool layout_dirty_ = true;

    // State
    bool initialized_ = false;

    // Helper methods
    void create_windows();
    void destroy_windows();
    void render_status_bar();
    BasePanel* find_locked(const std::string& id);
};

} // namespace lazyverdi::tui
