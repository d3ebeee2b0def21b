#pragma once

#include "commands/formatters.hpp"
#include "commands/parsers.hpp"
#include "core/command.hpp"
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lazyverdi::tui {

struct Tab {
    std::string name;
    CommandSpec command;
    Formatter formatter;   // optional
    TableParser parser;    // optional; without one the content is text
};

using TabContent = std::variant<ParsedTable, std::string>;

// Active tab index plus a per-tab cache of the last successful load.
// Switching tabs never loads anything; callers check is_loaded() and run
// the tab command themselves.
class PanelTabState {
public:
    explicit PanelTabState(std::vector<Tab> tabs);

    // No-op returning false at the last (first) index.
    bool next();
    bool prev();

    size_t active_index() const { return active_index_; }
    size_t tab_count() const { return tabs_.size(); }
    bool empty() const { return tabs_.empty(); }

    // Throws std::logic_error when there are no tabs.
    const Tab& active_tab() const;
    const Tab& tab(size_t index) const;
    const std::vector<Tab>& tabs() const { return tabs_; }

    bool is_loaded(size_t index) const { return cache_.count(index) > 0; }
    void mark_loaded(size_t index, TabContent content);
    const TabContent* cached(size_t index) const;

    // "[1] computer/code/plugin" with the active tab wrapped in brackets:
    // "[1] [computer]/code/plugin".
    std::string title(const std::string& prefix) const;

private:
    std::vector<Tab> tabs_;
    size_t active_index_ = 0;
    std::map<size_t, TabContent> cache_;
};

// stdout -> trimmed -> "No output" if empty -> formatter -> parser.
TabContent build_tab_content(const Tab& tab, const std::string& stdout_text);

} // namespace lazyverdi::tui
