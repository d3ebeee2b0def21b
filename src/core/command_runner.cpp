#include "core/command_runner.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <future>

using namespace std::chrono_literals;

namespace lazyverdi::tui {

namespace {

constexpr auto kWorkerPollInterval = 50ms;

struct WorkerOutcome {
    InvocationOutput output;
    std::exception_ptr error;
};

} // namespace

// ---------------------------------------------------------------------------
// PendingCommand
// ---------------------------------------------------------------------------

PendingCommand::PendingCommand(CommandSpec spec, bool priority, CompletionCallback callback)
    : spec_(std::move(spec)), priority_(priority), callback_(std::move(callback)) {
    result_.command_name = spec_.name();
}

void PendingCommand::cancel() {
    cancel_requested_ = true;

    std::lock_guard<std::mutex> lock(mutex_);
    if (done_) return;
    result_.status = CommandStatus::Cancelled;
    result_.error = CommandError::Cancelled;
    result_.end_time = std::chrono::system_clock::now();
    done_ = true;
    cv_.notify_all();
}

bool PendingCommand::is_done() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return done_;
}

CommandResult PendingCommand::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return done_; });
    if (result_.status == CommandStatus::Cancelled) {
        throw CommandCancelled(result_.command_name);
    }
    return result_;
}

bool PendingCommand::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return done_; });
}

CommandResult PendingCommand::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return result_;
}

bool PendingCommand::finish(CommandResult result) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_) return false;
    result_ = std::move(result);
    done_ = true;
    cv_.notify_all();
    return true;
}

void PendingCommand::run_callback() {
    if (!callback_) return;
    try {
        callback_(snapshot());
    } catch (const std::exception& e) {
        LOG_ERROR("CommandRunner", "Completion callback for " + command_name() +
                  " threw: " + e.what());
    }
}

// ---------------------------------------------------------------------------
// CommandRunner
// ---------------------------------------------------------------------------

CommandRunner::CommandRunner(std::shared_ptr<SessionScope> session)
    : session_(std::move(session)) {
    dispatcher_ = std::thread(&CommandRunner::dispatch_loop, this);
    LOG_DEBUG("CommandRunner", "Dispatcher started");
}

CommandRunner::~CommandRunner() {
    shutdown();
}

std::shared_ptr<PendingCommand> CommandRunner::submit(CommandSpec spec, bool priority,
                                                      CompletionCallback callback) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (stopping_) {
        lock.unlock();
        auto job = std::make_shared<PendingCommand>(std::move(spec), priority, CompletionCallback{});
        job->cancel();
        LOG_DEBUG("CommandRunner", "Rejected after shutdown: " + job->command_name());
        return job;
    }

    auto job = std::make_shared<PendingCommand>(std::move(spec), priority, std::move(callback));
    if (priority) {
        priority_queue_.push_back(job);
    } else {
        normal_queue_.push_back(job);
    }
    LOG_DEBUG("CommandRunner", "Queued " + job->spec().display() +
              (priority ? " (priority)" : ""));
    cv_.notify_one();
    return job;
}

CommandResult CommandRunner::execute(CommandSpec spec, bool priority) {
    return submit(std::move(spec), priority)->wait();
}

void CommandRunner::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !dispatcher_.joinable()) return;
        stopping_ = true;

        for (auto& job : priority_queue_) job->cancel();
        for (auto& job : normal_queue_) job->cancel();
        if (current_) {
            LOG_INFO("CommandRunner", "Cancelling running command: " + current_->command_name());
            current_->cancel();
        }
        cv_.notify_all();
    }

    if (dispatcher_.joinable() && dispatcher_.get_id() != std::this_thread::get_id()) {
        dispatcher_.join();
        LOG_DEBUG("CommandRunner", "Dispatcher stopped");
    }
}

size_t CommandRunner::queued_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto live = [](const std::shared_ptr<PendingCommand>& job) { return !job->cancel_requested(); };
    return static_cast<size_t>(
        std::count_if(priority_queue_.begin(), priority_queue_.end(), live) +
        std::count_if(normal_queue_.begin(), normal_queue_.end(), live));
}

bool CommandRunner::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_ != nullptr;
}

bool CommandRunner::is_shut_down() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopping_;
}

void CommandRunner::dispatch_loop() {
    while (true) {
        std::shared_ptr<PendingCommand> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] {
                return stopping_ || !priority_queue_.empty() || !normal_queue_.empty();
            });

            auto& queue = !priority_queue_.empty() ? priority_queue_ : normal_queue_;
            if (queue.empty()) {
                break;  // stopping and drained
            }
            job = std::move(queue.front());
            queue.pop_front();
            if (!job->cancel_requested()) {
                current_ = job;
            }
        }

        run_job(job);
    }
}

void CommandRunner::run_job(const std::shared_ptr<PendingCommand>& job) {
    if (job->cancel_requested()) {
        LOG_DEBUG("CommandRunner", "Skipped cancelled " + job->command_name());
        job->run_callback();
        return;
    }

    CommandResult result = invoke_isolated(job);

    // The gate opens before the result is published
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_.reset();
    }

    result.end_time = std::chrono::system_clock::now();
    if (!job->finish(std::move(result))) {
        LOG_INFO("CommandRunner", "Discarded result of cancelled " + job->command_name());
    } else {
        auto final_result = job->snapshot();
        LOG_DEBUG("CommandRunner", job->command_name() + " " + status_to_string(final_result.status) +
                  " in " + std::to_string(final_result.duration().count()) + "ms");
    }
    job->run_callback();
}

CommandResult CommandRunner::invoke_isolated(const std::shared_ptr<PendingCommand>& job) {
    CommandResult result = job->snapshot();

    std::promise<WorkerOutcome> promise;
    std::future<WorkerOutcome> outcome_future = promise.get_future();

    std::thread worker([this, job, promise = std::move(promise)]() mutable {
        WorkerOutcome outcome;
        try {
            session_->reset();
            outcome.output = job->spec().invoke(job->cancel_requested_);
        } catch (...) {
            outcome.error = std::current_exception();
        }

        try {
            session_->reset();
        } catch (const std::exception& e) {
            LOG_ERROR("CommandRunner", std::string("Session reset failed: ") + e.what());
        }
        promise.set_value(std::move(outcome));
    });

    bool cancel_logged = false;
    while (outcome_future.wait_for(kWorkerPollInterval) != std::future_status::ready) {
        if (job->cancel_requested() && !cancel_logged) {
            LOG_INFO("CommandRunner", "Cancel requested, waiting for " + job->command_name() +
                     " to reach a checkpoint");
            cancel_logged = true;
        }
    }
    worker.join();

    WorkerOutcome outcome = outcome_future.get();
    result.stdout_text = std::move(outcome.output.stdout_text);
    result.stderr_text = std::move(outcome.output.stderr_text);

    if (outcome.error) {
        std::string description = describe_exception(outcome.error);
        LOG_WARN("CommandRunner", job->command_name() + " raised " + description);
        if (!result.stderr_text.empty() && result.stderr_text.back() != '\n') {
            result.stderr_text += '\n';
        }
        result.stderr_text += description;
        result.exit_code = 1;
        result.status = CommandStatus::Failed;
        result.error = CommandError::InvocationError;
    } else if (outcome.output.exit_code == 0) {
        result.exit_code = 0;
        result.status = CommandStatus::Done;
        result.error = CommandError::None;
    } else {
        result.exit_code = outcome.output.exit_code;
        result.status = CommandStatus::Failed;
        result.error = CommandError::ExecutionFailed;
    }
    return result;
}

} // namespace lazyverdi::tui
