#pragma once

#include <ncurses.h>

namespace lazyverdi::tui::colors {

// Color pair IDs for ncurses
enum ColorPair {
    DEFAULT = 0,

    // Text colors
    TEXT_PRIMARY = 1,
    TEXT_DIM = 2,

    // Accent colors
    ACCENT_GREEN = 3,      // Success
    ACCENT_RED = 4,        // Errors
    ACCENT_YELLOW = 5,     // Loading, warnings
    ACCENT_CYAN = 6,       // Table headers

    // UI elements
    BORDER = 7,
    BORDER_FOCUSED = 8,
    HEADER = 9,
    HEADER_ACTIVE = 10,

    MAX_PAIRS = 11
};

inline void init_color_pairs() {
    if (!has_colors()) return;

    start_color();
    use_default_colors();

    init_pair(TEXT_PRIMARY, COLOR_WHITE, -1);
    init_pair(TEXT_DIM, COLORS >= 256 ? 244 : COLOR_WHITE, -1);

    init_pair(ACCENT_GREEN, COLOR_GREEN, -1);
    init_pair(ACCENT_RED, COLOR_RED, -1);
    init_pair(ACCENT_YELLOW, COLOR_YELLOW, -1);
    init_pair(ACCENT_CYAN, COLOR_CYAN, -1);

    init_pair(BORDER, COLOR_BLUE, -1);
    init_pair(BORDER_FOCUSED, COLOR_GREEN, -1);
    init_pair(HEADER, COLOR_BLACK, COLOR_CYAN);
    init_pair(HEADER_ACTIVE, COLOR_BLACK, COLOR_GREEN);
}

} // namespace lazyverdi::tui::colors
