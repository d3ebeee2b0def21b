#pragma once

#include "core/auto_refresher.hpp"
#include "core/command_runner.hpp"
#include "core/config.hpp"
#include "core/dashboard.hpp"
#include "core/diagnostic_sink.hpp"
#include "core/verdi_session.hpp"
#include "ui_manager.hpp"
#include <memory>
#include <string>
#include <vector>

namespace lazyverdi::tui {

class Application {
public:
    explicit Application(std::string config_path);
    ~Application();

    // Initialize and run
    void init();
    void run();
    void shutdown();

    // Panel management
    void focus_panel(const std::string& panel_id);
    void cycle_next_panel();
    void switch_tab(bool forward);
    void refresh_focused();
    void toggle_auto_refresh();

private:
    std::string config_path_;
    Config config_;

    std::shared_ptr<VerdiSession> session_;
    std::unique_ptr<CommandRunner> runner_;
    std::unique_ptr<DiagnosticSink> diagnostics_;
    std::unique_ptr<UIManager> ui_manager_;
    std::shared_ptr<Dashboard> dashboard_;
    std::unique_ptr<AutoRefresher> refresher_;

    // "panel-0" (details) followed by the registry panels
    std::vector<std::string> focus_order_;

    bool running_ = false;
    bool shut_down_ = false;

    // Event handlers
    bool handle_input(int ch);
    void show_help();
    void show_recent_logs();
    std::string status_line() const;
};

} // namespace lazyverdi::tui
