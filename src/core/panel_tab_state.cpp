#include "core/panel_tab_state.hpp"
#include <stdexcept>

namespace lazyverdi::tui {

PanelTabState::PanelTabState(std::vector<Tab> tabs)
    : tabs_(std::move(tabs)) {
}

bool PanelTabState::next() {
    if (tabs_.empty() || active_index_ + 1 >= tabs_.size()) {
        return false;
    }
    ++active_index_;
    return true;
}

bool PanelTabState::prev() {
    if (active_index_ == 0) {
        return false;
    }
    --active_index_;
    return true;
}

const Tab& PanelTabState::active_tab() const {
    if (tabs_.empty()) {
        throw std::logic_error("panel has no tabs");
    }
    return tabs_[active_index_];
}

const Tab& PanelTabState::tab(size_t index) const {
    if (index >= tabs_.size()) {
        throw std::out_of_range("tab index " + std::to_string(index) + " out of range");
    }
    return tabs_[index];
}

void PanelTabState::mark_loaded(size_t index, TabContent content) {
    if (index >= tabs_.size()) {
        throw std::out_of_range("tab index " + std::to_string(index) + " out of range");
    }
    cache_[index] = std::move(content);
}

const TabContent* PanelTabState::cached(size_t index) const {
    auto it = cache_.find(index);
    return it == cache_.end() ? nullptr : &it->second;
}

std::string PanelTabState::title(const std::string& prefix) const {
    std::string text = prefix;
    for (size_t i = 0; i < tabs_.size(); ++i) {
        if (i == 0) {
            text += prefix.empty() ? "" : " ";
        } else {
            text += "/";
        }
        text += (i == active_index_) ? "[" + tabs_[i].name + "]" : tabs_[i].name;
    }
    return text;
}

TabContent build_tab_content(const Tab& tab, const std::string& stdout_text) {
    const char* ws = " \t\r\n";
    size_t begin = stdout_text.find_first_not_of(ws);
    std::string text = (begin == std::string::npos)
        ? std::string("No output")
        : stdout_text.substr(begin, stdout_text.find_last_not_of(ws) - begin + 1);

    if (tab.formatter) {
        text = tab.formatter(text);
    }
    if (tab.parser) {
        return tab.parser(text);
    }
    return text;
}

} // namespace lazyverdi::tui
