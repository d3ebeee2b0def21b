#pragma once

#include "core/command.hpp"
#include "core/session_scope.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace lazyverdi::tui {

using CompletionCallback = std::function<void(const CommandResult&)>;

// Handle to one submitted command. Shared between the caller and the runner.
class PendingCommand {
public:
    PendingCommand(CommandSpec spec, bool priority, CompletionCallback callback);

    // Queued: the command will never run. Running: waiters are released with
    // a Cancelled result now; the query itself stops at its next checkpoint.
    void cancel();

    bool is_done() const;
    bool cancel_requested() const { return cancel_requested_.load(); }

    // Blocks until terminal. Throws CommandCancelled for a cancelled command.
    CommandResult wait();

    // True once terminal; does not throw.
    bool wait_for(std::chrono::milliseconds timeout);

    CommandResult snapshot() const;

    const CommandSpec& spec() const { return spec_; }
    const std::string& command_name() const { return spec_.name(); }
    bool priority() const { return priority_; }

private:
    friend class CommandRunner;

    // First terminal result wins; later ones are dropped.
    bool finish(CommandResult result);
    void run_callback();

    const CommandSpec spec_;
    const bool priority_;
    CompletionCallback callback_;
    std::atomic<bool> cancel_requested_{false};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    CommandResult result_;
    bool done_ = false;
};

// Serializes every backend invocation through one dispatcher thread (the
// gate). Priority requests are taken before normal ones but never preempt the
// running one. Each invocation runs on its own worker thread, wrapped by a
// SessionScope reset before and after.
//
// Completion callbacks run on the dispatcher thread and must not block on the
// runner (no execute() or wait() from inside a callback).
class CommandRunner {
public:
    explicit CommandRunner(std::shared_ptr<SessionScope> session);
    ~CommandRunner();

    CommandRunner(const CommandRunner&) = delete;
    CommandRunner& operator=(const CommandRunner&) = delete;

    // After shutdown() the returned request is already Cancelled and its
    // callback is never run.
    std::shared_ptr<PendingCommand> submit(CommandSpec spec, bool priority = false,
                                           CompletionCallback callback = {});

    // submit() + wait(). Throws CommandCancelled only.
    CommandResult execute(CommandSpec spec, bool priority = false);

    // Cancels queued and running commands and joins the dispatcher.
    void shutdown();

    size_t queued_count() const;
    bool busy() const;
    bool is_shut_down() const;

private:
    void dispatch_loop();
    void run_job(const std::shared_ptr<PendingCommand>& job);
    CommandResult invoke_isolated(const std::shared_ptr<PendingCommand>& job);

    std::shared_ptr<SessionScope> session_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::shared_ptr<PendingCommand>> priority_queue_;
    std::deque<std::shared_ptr<PendingCommand>> normal_queue_;
    std::shared_ptr<PendingCommand> current_;
    bool stopping_ = false;

    std::thread dispatcher_;
};

} // namespace lazyverdi::tui
