#include "core/dashboard.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace lazyverdi::tui {

namespace {

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    size_t begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) return {};
    return text.substr(begin, text.find_last_not_of(ws) - begin + 1);
}

} // namespace

Dashboard::Dashboard(CommandRunner& runner, DiagnosticSink& diagnostics, RenderSink& render)
    : runner_(runner), diagnostics_(diagnostics), render_(render) {
}

Dashboard::~Dashboard() {
    shutdown();
}

void Dashboard::mount_panel(const std::string& id, const std::string& label, std::vector<Tab> tabs) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (panels_.count(id)) {
        throw std::invalid_argument("panel already mounted: " + id);
    }

    auto [it, inserted] = panels_.emplace(id, MountedPanel{label, PanelTabState(std::move(tabs)), ""});
    order_.push_back(id);
    if (focused_.empty()) {
        focused_ = id;
    }
    render_.update_tabs(id, it->second.state.title(label));
    LOG_INFO("Dashboard", "Mounted " + id + " with " +
             std::to_string(it->second.state.tab_count()) + " tabs");
}

bool Dashboard::unmount_panel(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (panels_.erase(id) == 0) {
        return false;
    }
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    if (focused_ == id) {
        focused_ = order_.empty() ? std::string{} : order_.front();
    }
    LOG_INFO("Dashboard", "Unmounted " + id);
    return true;
}

std::vector<std::string> Dashboard::panel_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

bool Dashboard::set_focus(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!panels_.count(id)) {
        return false;
    }
    focused_ = id;
    return true;
}

std::string Dashboard::focused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return focused_;
}

bool Dashboard::next_tab(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* panel = find_locked(id);
    if (!panel || !panel->state.next()) {
        return false;
    }
    render_.update_tabs(id, panel->state.title(panel->label));
    show_cached_locked(id, *panel);
    return true;
}

bool Dashboard::prev_tab(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* panel = find_locked(id);
    if (!panel || !panel->state.prev()) {
        return false;
    }
    render_.update_tabs(id, panel->state.title(panel->label));
    show_cached_locked(id, *panel);
    return true;
}

std::shared_ptr<PendingCommand> Dashboard::load_active_tab(const std::string& id, bool priority) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* panel = find_locked(id);
    if (!panel) {
        LOG_WARN("Dashboard", "load_active_tab: unknown panel " + id);
        return nullptr;
    }
    if (shut_down_ || panel->state.empty()) {
        return nullptr;
    }

    size_t index = panel->state.active_index();
    if (panel->state.is_loaded(index)) {
        show_cached_locked(id, *panel);
        return nullptr;
    }

    auto it = in_flight_.find({id, index});
    if (it != in_flight_.end() && !it->second->is_done()) {
        return it->second;
    }

    render_.show_loading(id);
    return submit_locked(id, *panel, priority);
}

std::shared_ptr<PendingCommand> Dashboard::refresh(const std::string& id, bool priority) {
    return request_refresh(id, priority).request;
}

RefreshRequest Dashboard::request_refresh(const std::string& id, bool priority) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* panel = find_locked(id);
    if (!panel) {
        LOG_WARN("Dashboard", "refresh: unknown panel " + id);
        return {};
    }
    if (shut_down_ || panel->state.empty()) {
        return {};
    }

    size_t index = panel->state.active_index();
    auto it = in_flight_.find({id, index});
    if (it != in_flight_.end() && !it->second->is_done() &&
        (it->second->priority() || !priority)) {
        return RefreshRequest{.request = it->second, .reused = true};
    }

    if (!panel->state.is_loaded(index)) {
        render_.show_loading(id);
    }
    return RefreshRequest{.request = submit_locked(id, *panel, priority), .reused = false};
}

std::vector<std::string> Dashboard::refresh_order() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ordered;
    ordered.reserve(order_.size());
    if (!focused_.empty()) {
        ordered.push_back(focused_);
    }
    for (const auto& id : order_) {
        if (id != focused_) ordered.push_back(id);
    }
    return ordered;
}

std::vector<std::shared_ptr<PendingCommand>> Dashboard::load_startup() {
    std::vector<std::shared_ptr<PendingCommand>> requests;
    for (const auto& id : panel_ids()) {
        if (auto request = load_active_tab(id, false)) {
            requests.push_back(std::move(request));
        }
    }
    LOG_INFO("Dashboard", "Startup load queued " + std::to_string(requests.size()) + " commands");
    return requests;
}

std::optional<PanelSnapshot> Dashboard::snapshot(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = panels_.find(id);
    if (it == panels_.end()) {
        return std::nullopt;
    }

    const auto& panel = it->second;
    PanelSnapshot snap;
    snap.id = id;
    snap.label = panel.label;
    snap.title = panel.state.title(panel.label);
    snap.active_index = panel.state.active_index();
    for (size_t i = 0; i < panel.state.tab_count(); ++i) {
        snap.loaded.push_back(panel.state.is_loaded(i));
    }
    snap.last_error = panel.last_error;

    auto flight = in_flight_.find({id, panel.state.active_index()});
    snap.loading = flight != in_flight_.end() && !flight->second->is_done();
    return snap;
}

void Dashboard::shutdown() {
    std::vector<std::shared_ptr<PendingCommand>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) return;
        shut_down_ = true;
        pending.swap(outstanding_);
        in_flight_.clear();
    }

    for (auto& request : pending) {
        request->cancel();
    }
    for (auto& request : pending) {
        request->wait_for(std::chrono::milliseconds(100));
    }
    LOG_INFO("Dashboard", "Shut down, cancelled " + std::to_string(pending.size()) + " requests");
}

std::shared_ptr<PendingCommand> Dashboard::submit_locked(const std::string& id, MountedPanel& panel,
                                                         bool priority) {
    size_t index = panel.state.active_index();
    std::weak_ptr<Dashboard> weak = weak_from_this();

    auto request = runner_.submit(
        panel.state.active_tab().command, priority,
        [weak, id, index](const CommandResult& result) {
            if (auto self = weak.lock()) {
                self->apply_result(id, index, result);
            }
        });

    prune_outstanding_locked();
    in_flight_[{id, index}] = request;
    outstanding_.push_back(request);
    return request;
}

void Dashboard::apply_result(const std::string& id, size_t tab_index, const CommandResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto flight = in_flight_.find({id, tab_index});
    if (flight != in_flight_.end() && flight->second->is_done()) {
        in_flight_.erase(flight);
    }
    prune_outstanding_locked();

    if (shut_down_) return;
    if (result.status == CommandStatus::Cancelled) {
        LOG_DEBUG("Dashboard", "Ignoring cancelled " + result.command_name);
        auto* panel = find_locked(id);
        if (panel && panel->state.active_index() == tab_index &&
            !panel->state.is_loaded(tab_index) && !in_flight_.count({id, tab_index})) {
            render_.clear_loading(id);
        }
        return;
    }

    auto* panel = find_locked(id);
    if (!panel || tab_index >= panel->state.tab_count()) {
        LOG_WARN("Dashboard", "Render target missing: " + id + ", dropped result of " +
                 result.command_name);
        return;
    }

    diagnostics_.report(result.command_name, result.stderr_text);
    const Tab& tab = panel->state.tab(tab_index);
    bool active = panel->state.active_index() == tab_index;

    if (result.success()) {
        TabContent content;
        try {
            content = build_tab_content(tab, result.stdout_text);
        } catch (const std::exception& e) {
            panel->last_error = "Error: " + std::string(e.what());
            LOG_ERROR("Dashboard", tab.name + " output could not be processed: " + e.what());
            diagnostics_.write(panel->last_error);
            if (active) render_.show_error(id, panel->last_error);
            return;
        }

        panel->state.mark_loaded(tab_index, content);
        panel->last_error.clear();
        if (active) {
            render_.show_content(id, tab_index, content);
        }
        return;
    }

    std::string detail = trim(result.stderr_text);
    if (detail.empty()) {
        detail = result.command_name + " exited with code " +
                 std::to_string(result.exit_code.value_or(-1));
        diagnostics_.write("Error: " + detail);
    }
    panel->last_error = "Error: " + format_error_message(result.command_name, detail);
    LOG_WARN("Dashboard", id + "/" + tab.name + " failed (" + status_to_string(result.status) + ")");
    if (active) {
        render_.show_error(id, panel->last_error);
    }
}

void Dashboard::show_cached_locked(const std::string& id, const MountedPanel& panel) {
    if (const TabContent* content = panel.state.cached(panel.state.active_index())) {
        render_.show_content(id, panel.state.active_index(), *content);
    }
}

Dashboard::MountedPanel* Dashboard::find_locked(const std::string& id) {
    auto it = panels_.find(id);
    return it == panels_.end() ? nullptr : &it->second;
}

void Dashboard::prune_outstanding_locked() {
    outstanding_.erase(
        std::remove_if(outstanding_.begin(), outstanding_.end(),
                       [](const std::shared_ptr<PendingCommand>& request) { return request->is_done(); }),
        outstanding_.end());
}

} // namespace lazyverdi::tui
