#pragma once

#include "base_panel.hpp"
#include <vector>

namespace lazyverdi::tui {

// Scrollable free text (config, profile, status output).
class InfoPanel : public BasePanel {
public:
    InfoPanel(const std::string& id, const std::string& title);
    ~InfoPanel() override = default;

    void set_text(const std::string& text);
    void render(WINDOW* window, bool focused) override;

private:
    std::vector<std::string> lines_;
    bool has_content_ = false;
};

} // namespace lazyverdi::tui
