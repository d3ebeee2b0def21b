#pragma once

#include "base_panel.hpp"
#include "commands/parsers.hpp"
#include <vector>

namespace lazyverdi::tui {

// Headers, rows and footer of a ParsedTable, columns sized to content.
class TablePanel : public BasePanel {
public:
    TablePanel(const std::string& id, const std::string& title);
    ~TablePanel() override = default;

    void set_table(ParsedTable table);

    // Plain text in a table panel goes to the footer
    void set_text(const std::string& text);

    void render(WINDOW* window, bool focused) override;

    const ParsedTable& table() const { return table_; }

private:
    ParsedTable table_;
    bool has_content_ = false;

    std::vector<int> column_widths(int available) const;
};

} // namespace lazyverdi::tui
