#pragma once

#include "core/panel_tab_state.hpp"
#include <string>

namespace lazyverdi::tui {

// Where the dashboard puts panel content. Calls for one panel never overlap.
class RenderSink {
public:
    virtual ~RenderSink() = default;

    virtual void show_loading(const std::string& panel_id) = 0;
    // A load was cancelled and nothing replaces the loading indicator.
    virtual void clear_loading(const std::string& panel_id) = 0;
    virtual void show_content(const std::string& panel_id, size_t tab_index,
                              const TabContent& content) = 0;
    virtual void show_error(const std::string& panel_id, const std::string& message) = 0;
    virtual void update_tabs(const std::string& panel_id, const std::string& title) = 0;
};

} // namespace lazyverdi::tui
