#include "application.hpp"
#include "commands/registry.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <sstream>

namespace lazyverdi::tui {

namespace {

constexpr int kInputTimeoutMs = 100;
constexpr const char* kDetailsPanel = "panel-0";
constexpr const char* kVersion = "1.0.0";
constexpr size_t kRecentLogLines = 20;

std::string format_seconds(double seconds) {
    std::ostringstream out;
    out << seconds;
    return out.str();
}

} // namespace

Application::Application(std::string config_path)
    : config_path_(std::move(config_path)) {
}

Application::~Application() {
    shutdown();
}

void Application::init() {
    LOG_INFO("Application", "Initializing lazyverdi...");

    config_ = Config::load(config_path_);
    if (!config_.log_file.empty() && !Logger::instance().set_log_file(config_.log_file)) {
        LOG_WARN("Application", "Cannot open log file " + config_.log_file);
    }

    session_ = std::make_shared<VerdiSession>(VerdiSessionOptions{
        .verdi_executable = config_.verdi_executable,
        .rest_api_url = config_.rest_api_url,
        .command_timeout = std::chrono::seconds(config_.command_timeout)
    });
    runner_ = std::make_unique<CommandRunner>(session_);
    diagnostics_ = std::make_unique<DiagnosticSink>(config_.benign_warning_patterns,
                                                    config_.once_per_session_patterns);

    ui_manager_ = std::make_unique<UIManager>(LayoutSettings{
        .left_width_percent = config_.left_panel_width_percent,
        .results_height_percent = config_.results_panel_height_percent,
        .focused_height_percent = config_.focused_panel_height_percent
    });
    ui_manager_->add_results_panel(kDetailsPanel, "[0] details", *diagnostics_);
    focus_order_ = {kDetailsPanel};

    dashboard_ = std::make_shared<Dashboard>(*runner_, *diagnostics_, *ui_manager_);
    for (auto& panel : build_panel_registry(*session_)) {
        if (panel.kind == PanelKind::Table) {
            ui_manager_->add_table_panel(panel.id, panel.label);
        } else {
            ui_manager_->add_info_panel(panel.id, panel.label);
        }
        dashboard_->mount_panel(panel.id, panel.label, std::move(panel.tabs));
        focus_order_.push_back(panel.id);
    }

    ui_manager_->init();
    timeout(kInputTimeoutMs);

    if (config_.show_welcome_message) {
        diagnostics_->write(std::string("LazyVerdi v") + kVersion + "\nWelcome! Press ? for help");
    }

    focus_panel(focus_order_[static_cast<size_t>(config_.initial_focus_panel) % focus_order_.size()]);

    dashboard_->load_startup();

    refresher_ = std::make_unique<AutoRefresher>(*dashboard_, config_.refresh_interval());
    if (config_.auto_refresh_on_startup) {
        refresher_->start();
    }

    LOG_INFO("Application", "Initialization complete");
}

void Application::run() {
    running_ = true;
    LOG_INFO("Application", "Entering main loop");

    while (running_) {
        ui_manager_->set_status(status_line());
        ui_manager_->render_all();

        // Blocks for at most kInputTimeoutMs
        int ch = ui_manager_->get_input();
        if (ch != ERR && !handle_input(ch)) {
            break; // User quit
        }
    }

    LOG_INFO("Application", "Main loop exited");
}

void Application::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;

    if (refresher_) refresher_->stop();
    if (dashboard_) dashboard_->shutdown();
    if (runner_) runner_->shutdown();
    if (ui_manager_) ui_manager_->shutdown();

    LOG_INFO("Application", "Shutdown complete");
}

void Application::focus_panel(const std::string& panel_id) {
    ui_manager_->set_focus(panel_id);
    if (panel_id != kDetailsPanel) {
        dashboard_->set_focus(panel_id);
    }
    LOG_DEBUG("Application", "Focus: " + panel_id);
}

void Application::cycle_next_panel() {
    if (focus_order_.empty()) return;

    auto it = std::find(focus_order_.begin(), focus_order_.end(), ui_manager_->focus());
    size_t index = (it == focus_order_.end()) ? 0 : static_cast<size_t>(it - focus_order_.begin()) + 1;
    focus_panel(focus_order_[index % focus_order_.size()]);
}

void Application::switch_tab(bool forward) {
    std::string panel_id = ui_manager_->focus();
    if (panel_id == kDetailsPanel) return;

    bool changed = forward ? dashboard_->next_tab(panel_id) : dashboard_->prev_tab(panel_id);
    if (changed) {
        dashboard_->load_active_tab(panel_id);
    }
}

void Application::refresh_focused() {
    std::string panel_id = ui_manager_->focus();
    if (panel_id == kDetailsPanel) return;

    if (dashboard_->refresh(panel_id, true)) {
        LOG_INFO("Application", "Manual refresh of " + panel_id);
    }
}

void Application::toggle_auto_refresh() {
    if (refresher_->toggle()) {
        diagnostics_->write("Auto-refresh enabled (interval: " +
                            format_seconds(config_.auto_refresh_interval) + "s)");
    } else if (refresher_->state() == RefresherState::Disabled) {
        diagnostics_->write("Auto-refresh is disabled by auto_refresh_interval <= 0");
    } else {
        diagnostics_->write("Auto-refresh disabled");
    }
}

void Application::show_recent_logs() {
    std::string text = "Recent log:";
    for (const auto& entry : Logger::instance().get_recent_logs(kRecentLogLines)) {
        text += "\n" + entry.format_timestamp() + " " + entry.level_str() + " " +
                entry.source + ": " + entry.message;
    }
    diagnostics_->write(text);
}

void Application::show_help() {
    diagnostics_->write(
        "Keys:\n"
        "  0-5        focus panel (0 = details)\n"
        "  Tab        next panel\n"
        "  [ / ]      previous / next tab\n"
        "  r          refresh focused panel\n"
        "  a          toggle auto-refresh\n"
        "  l          show recent log\n"
        "  j/k, g/G   scroll, top/bottom\n"
        "  q          quit");
}

std::string Application::status_line() const {
    std::string text = "lazyverdi | auto-refresh: ";
    text += refresher_ && refresher_->is_running()
        ? "on (" + format_seconds(config_.auto_refresh_interval) + "s)"
        : "off";
    if (runner_) {
        size_t queued = runner_->queued_count();
        if (runner_->busy()) text += " | running";
        if (queued > 0) text += " | queued: " + std::to_string(queued);
    }
    text += " | [0-5] focus  [ ] tabs  r refresh  a auto  ? help  q quit";
    return text;
}

bool Application::handle_input(int ch) {
    switch (ch) {
        case 'q':
        case 'Q':
            LOG_INFO("Application", "User quit");
            return false; // Exit

        case '0': case '1': case '2': case '3': case '4': case '5': {
            size_t index = static_cast<size_t>(ch - '0');
            if (index < focus_order_.size()) {
                focus_panel(focus_order_[index]);
            }
            break;
        }

        case '\t':  // Tab
            cycle_next_panel();
            break;

        case ']':
        case KEY_RIGHT:
            switch_tab(true);
            break;

        case '[':
        case KEY_LEFT:
            switch_tab(false);
            break;

        case 'r':
        case 'R':
            refresh_focused();
            break;

        case 'a':
        case 'A':
            toggle_auto_refresh();
            break;

        case 'l':
        case 'L':
            show_recent_logs();
            break;

        case '?':
            show_help();
            break;

        case KEY_RESIZE:
            ui_manager_->update_layout();
            break;

        default:
            // Pass to focused panel
            ui_manager_->route_to_focused(ch);
            break;
    }

    return true; // Continue running
}

} // namespace lazyverdi::tui
