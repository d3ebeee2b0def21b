#pragma once

#include <string>
#include <ncurses.h>

namespace lazyverdi::tui {

class BasePanel {
public:
    BasePanel(const std::string& id, const std::string& title);
    virtual ~BasePanel() = default;

    // Getters
    const std::string& panel_id() const { return panel_id_; }
    const std::string& title() const { return title_; }

    void set_title(const std::string& title) { title_ = title; }
    // Starting a load drops the error left by a previous tab.
    void set_loading(bool loading);
    bool loading() const { return loading_; }
    const std::string& error() const { return error_; }

    // Shown instead of the content until new content arrives
    void set_error(const std::string& message);

    // Core methods (to be implemented by subclasses)
    virtual void render(WINDOW* window, bool focused) = 0;
    virtual bool handle_input(int ch);

protected:
    std::string panel_id_;
    std::string title_;
    bool loading_ = false;
    std::string error_;

    // Scroll support
    int scroll_offset_ = 0;
    int max_scroll_ = 0;
    int page_size_ = 10;

    // Helper methods for subclasses
    void draw_frame(WINDOW* window, bool focused);
    void update_scroll(int total_rows, int visible_rows);

    // Draws error/loading text inside the frame; true if it drew anything
    bool draw_status(WINDOW* window);

    // Writes at most `width` bytes of text
    static void put_clipped(WINDOW* window, int y, int x, const std::string& text, int width);
};

} // namespace lazyverdi::tui
