#pragma once

#include "base_panel.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace lazyverdi::tui {

class DiagnosticSink;

// Panel [0]: the shared details log. Follows the newest line until the user
// scrolls up.
class ResultsPanel : public BasePanel {
public:
    ResultsPanel(const std::string& id, const std::string& title, const DiagnosticSink& sink);
    ~ResultsPanel() override = default;

    void render(WINDOW* window, bool focused) override;
    bool handle_input(int ch) override;

    // Copies the sink's lines when its revision moved. True if it did.
    bool sync();
    size_t line_count() const { return lines_.size(); }

private:
    const DiagnosticSink& sink_;
    std::vector<std::string> lines_;
    uint64_t seen_revision_ = 0;
    bool synced_ = false;
    bool follow_ = true;
};

} // namespace lazyverdi::tui
