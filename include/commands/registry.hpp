#pragma once

#include "core/panel_tab_state.hpp"
#include <string>
#include <vector>

namespace lazyverdi::tui {

class VerdiSession;

enum class PanelKind {
    Table,
    Text
};

struct PanelDefinition {
    std::string id;       // "panel-1"
    std::string label;    // "[1]"
    PanelKind kind;
    std::vector<Tab> tabs;
};

// The static panel layout: three table panels, two text panels.
std::vector<PanelDefinition> build_panel_registry(VerdiSession& session);

} // namespace lazyverdi::tui
