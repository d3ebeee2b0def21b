#pragma once

#include "core/dashboard.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace lazyverdi::tui {

enum class RefresherState {
    Idle,
    Running,
    Disabled,   // interval <= 0
    Cancelled   // stopped, or a refresh was cancelled
};

std::string refresher_state_to_string(RefresherState state);

// Background loop that refreshes every mounted panel, focused one first,
// once per interval. Panels are refreshed one at a time at normal priority so
// interactive requests overtake the sweep.
class AutoRefresher {
public:
    AutoRefresher(Dashboard& dashboard, std::chrono::milliseconds interval);
    ~AutoRefresher();

    AutoRefresher(const AutoRefresher&) = delete;
    AutoRefresher& operator=(const AutoRefresher&) = delete;

    // False (and Disabled) when the interval is not positive.
    bool start();

    // Cancels the refresh this loop submitted (never one it shares with an
    // interactive load) and joins the thread.
    void stop();

    // Returns whether the loop runs afterwards.
    bool toggle();

    bool is_running() const { return running_.load(); }
    RefresherState state() const;
    uint64_t passes_completed() const { return passes_.load(); }

    void set_interval(std::chrono::milliseconds interval);
    std::chrono::milliseconds interval() const;

private:
    void refresh_thread_func();

    // False when the pass was cut short by cancellation.
    bool run_pass();

    Dashboard& dashboard_;

    std::thread refresh_thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> passes_{0};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::chrono::milliseconds interval_;
    RefresherState state_ = RefresherState::Idle;
    std::shared_ptr<PendingCommand> in_flight_;   // submitted by this loop only
};

} // namespace lazyverdi::tui
