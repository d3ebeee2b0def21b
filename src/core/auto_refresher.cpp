#include "core/auto_refresher.hpp"
#include "utils/logger.hpp"

namespace lazyverdi::tui {

namespace {

constexpr std::chrono::milliseconds kStopPollInterval{50};

} // namespace

std::string refresher_state_to_string(RefresherState state) {
    switch (state) {
        case RefresherState::Idle: return "idle";
        case RefresherState::Running: return "running";
        case RefresherState::Disabled: return "disabled";
        case RefresherState::Cancelled: return "cancelled";
    }
    return "unknown";
}

AutoRefresher::AutoRefresher(Dashboard& dashboard, std::chrono::milliseconds interval)
    : dashboard_(dashboard), interval_(interval) {
}

AutoRefresher::~AutoRefresher() {
    stop();
}

bool AutoRefresher::start() {
    if (running_) return true;

    if (refresh_thread_.joinable()) {
        refresh_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (interval_.count() <= 0) {
            state_ = RefresherState::Disabled;
            LOG_INFO("AutoRefresher", "Interval is not positive, auto-refresh disabled");
            return false;
        }
        state_ = RefresherState::Running;
    }

    running_ = true;
    refresh_thread_ = std::thread(&AutoRefresher::refresh_thread_func, this);
    LOG_INFO("AutoRefresher", "Started (every " + std::to_string(interval().count()) + "ms)");
    return true;
}

void AutoRefresher::stop() {
    std::shared_ptr<PendingCommand> request;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bool was_running = running_.exchange(false);
        request = in_flight_;
        if (was_running || state_ == RefresherState::Running) {
            state_ = RefresherState::Cancelled;
        }
    }
    cv_.notify_all();

    if (request) {
        request->cancel();
    }
    if (refresh_thread_.joinable()) {
        refresh_thread_.join();
        LOG_INFO("AutoRefresher", "Stopped");
    }
}

bool AutoRefresher::toggle() {
    if (running_) {
        stop();
        return false;
    }
    return start();
}

RefresherState AutoRefresher::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void AutoRefresher::set_interval(std::chrono::milliseconds interval) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        interval_ = interval;
    }
    cv_.notify_all();
}

std::chrono::milliseconds AutoRefresher::interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interval_;
}

void AutoRefresher::refresh_thread_func() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, interval_, [this] {
                return !running_ || interval_.count() <= 0;
            });
            if (!running_) break;
            if (interval_.count() <= 0) {
                state_ = RefresherState::Disabled;
                running_ = false;
                LOG_INFO("AutoRefresher", "Interval set to 0, auto-refresh disabled");
                break;
            }
        }

        if (!run_pass()) {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = RefresherState::Cancelled;
            running_ = false;
            LOG_INFO("AutoRefresher", "Refresh cancelled, loop ended");
            break;
        }
        passes_++;
    }
}

bool AutoRefresher::run_pass() {
    for (const auto& panel_id : dashboard_.refresh_order()) {
        if (!running_) return false;

        RefreshRequest refresh;
        try {
            refresh = dashboard_.request_refresh(panel_id, false);
        } catch (const std::exception& e) {
            LOG_ERROR("AutoRefresher", "Refresh of " + panel_id + " failed: " + e.what());
            continue;
        }
        if (!refresh.request) continue;

        // A reused request belongs to someone else and is never cancelled here
        if (!refresh.reused) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) {
                refresh.request->cancel();
                return false;
            }
            in_flight_ = refresh.request;
        }

        while (!refresh.request->wait_for(kStopPollInterval)) {
            if (!running_) break;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_.reset();
        }
        if (!refresh.request->is_done()) {
            return false;  // stopped while waiting on a reused request
        }

        auto result = refresh.request->snapshot();
        if (result.status == CommandStatus::Cancelled) {
            LOG_DEBUG("AutoRefresher", panel_id + ": " + result.command_name + " cancelled");
            if (!refresh.reused) return false;
            continue;
        }
        if (!result.success()) {
            LOG_WARN("AutoRefresher", panel_id + ": " + result.command_name + " " +
                     status_to_string(result.status));
        }
    }
    return true;
}

} // namespace lazyverdi::tui
