#pragma once

#include "core/command_runner.hpp"
#include "core/diagnostic_sink.hpp"
#include "core/panel_tab_state.hpp"
#include "core/render_sink.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lazyverdi::tui {

struct PanelSnapshot {
    std::string id;
    std::string label;
    std::string title;
    size_t active_index = 0;
    std::vector<bool> loaded;   // per tab
    std::string last_error;
    bool loading = false;       // a load for the active tab is outstanding
};

struct RefreshRequest {
    std::shared_ptr<PendingCommand> request;
    bool reused = false;   // an in-flight request owned by another caller
};

// Owns the mounted panels and routes command results to them. Results come
// back on the runner's dispatcher thread; everything that touches panel state
// or the render sink does so under one mutex.
//
// Create through std::make_shared: completion callbacks hold a weak reference
// and are dropped once the dashboard is gone.
class Dashboard : public std::enable_shared_from_this<Dashboard> {
public:
    Dashboard(CommandRunner& runner, DiagnosticSink& diagnostics, RenderSink& render);
    ~Dashboard();

    Dashboard(const Dashboard&) = delete;
    Dashboard& operator=(const Dashboard&) = delete;

    // Throws std::invalid_argument for a duplicate id.
    void mount_panel(const std::string& id, const std::string& label, std::vector<Tab> tabs);
    bool unmount_panel(const std::string& id);
    std::vector<std::string> panel_ids() const;

    bool set_focus(const std::string& id);
    std::string focused() const;

    // Tab transitions. Cached content is shown right away; nothing is loaded.
    bool next_tab(const std::string& id);
    bool prev_tab(const std::string& id);

    // Lazy load: runs the active tab command unless it is cached (cache shown,
    // nullptr returned) or already in flight (that request returned).
    std::shared_ptr<PendingCommand> load_active_tab(const std::string& id, bool priority = true);

    // Always re-runs the active tab command. nullptr for an unknown panel or
    // after shutdown.
    std::shared_ptr<PendingCommand> refresh(const std::string& id, bool priority = true);

    // Same as refresh(), but tells whether the request was newly submitted.
    // Callers must only cancel requests they submitted.
    RefreshRequest request_refresh(const std::string& id, bool priority);

    // Focused panel first, then mount order.
    std::vector<std::string> refresh_order() const;

    // One normal-priority lazy load per mounted panel, in mount order.
    std::vector<std::shared_ptr<PendingCommand>> load_startup();

    std::optional<PanelSnapshot> snapshot(const std::string& id) const;

    // Cancels every outstanding request. Later results are ignored.
    void shutdown();

private:
    struct MountedPanel {
        std::string label;
        PanelTabState state;
        std::string last_error;
    };

    using TabKey = std::pair<std::string, size_t>;

    std::shared_ptr<PendingCommand> submit_locked(const std::string& id, MountedPanel& panel,
                                                  bool priority);
    void apply_result(const std::string& id, size_t tab_index, const CommandResult& result);
    void show_cached_locked(const std::string& id, const MountedPanel& panel);
    MountedPanel* find_locked(const std::string& id);
    void prune_outstanding_locked();

    CommandRunner& runner_;
    DiagnosticSink& diagnostics_;
    RenderSink& render_;

    mutable std::mutex mutex_;
    std::map<std::string, MountedPanel> panels_;
    std::vector<std::string> order_;
    std::string focused_;
    std::map<TabKey, std::shared_ptr<PendingCommand>> in_flight_;
    std::vector<std::shared_ptr<PendingCommand>> outstanding_;
    bool shut_down_ = false;
};

} // namespace lazyverdi::tui
