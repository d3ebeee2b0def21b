#include <gtest/gtest.h>
#include "core/command_runner.hpp"
#include "test_support.hpp"
#include <future>

using namespace lazyverdi::tui;
using namespace lazyverdi::tui::testing;

class CommandRunnerTest : public ::testing::Test {
protected:
    std::shared_ptr<CountingSession> session = std::make_shared<CountingSession>();
    CommandRunner runner{session};

    void TearDown() override {
        runner.shutdown();
    }
};

TEST_F(CommandRunnerTest, ExecuteReturnsDoneResult) {
    std::atomic<int> calls{0};
    auto result = runner.execute(counted_command("code list", "hello", calls));

    EXPECT_EQ(result.status, CommandStatus::Done);
    EXPECT_EQ(result.error, CommandError::None);
    EXPECT_EQ(result.stdout_text, "hello");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_TRUE(result.success());
    EXPECT_TRUE(result.end_time.has_value());
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(CommandRunnerTest, NonZeroExitIsExecutionFailed) {
    auto result = runner.execute(output_command("process list",
        InvocationOutput{.stdout_text = "", .stderr_text = "Critical: boom", .exit_code = 2}));

    EXPECT_EQ(result.status, CommandStatus::Failed);
    EXPECT_EQ(result.error, CommandError::ExecutionFailed);
    EXPECT_EQ(result.exit_code, 2);
    EXPECT_EQ(result.stderr_text, "Critical: boom");
}

TEST_F(CommandRunnerTest, ExceptionBecomesInvocationError) {
    auto result = runner.execute(throwing_command("status", "database is locked"));

    EXPECT_EQ(result.status, CommandStatus::Failed);
    EXPECT_EQ(result.error, CommandError::InvocationError);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.stderr_text.find("std::runtime_error: database is locked"), std::string::npos);
}

TEST_F(CommandRunnerTest, SessionResetBeforeAndAfterEveryInvocation) {
    std::atomic<int> calls{0};
    runner.execute(counted_command("a", "x", calls));
    runner.execute(throwing_command("b", "fails"));

    EXPECT_EQ(session->resets.load(), 4);
}

TEST_F(CommandRunnerTest, ResetsBracketTheQuery) {
    std::vector<std::string> trace;
    std::mutex trace_mutex;

    struct TracingSession : SessionScope {
        std::vector<std::string>& trace;
        std::mutex& m;
        TracingSession(std::vector<std::string>& t, std::mutex& mm) : trace(t), m(mm) {}
        void reset() override {
            std::lock_guard<std::mutex> lock(m);
            trace.push_back("reset");
        }
    };

    CommandRunner traced(std::make_shared<TracingSession>(trace, trace_mutex));
    traced.execute(CommandSpec::plain("q", [&] {
        std::lock_guard<std::mutex> lock(trace_mutex);
        trace.push_back("query");
        return std::string("ok");
    }));
    traced.shutdown();

    EXPECT_EQ(trace, (std::vector<std::string>{"reset", "query", "reset"}));
}

TEST_F(CommandRunnerTest, ConcurrentSubmissionsNeverOverlap) {
    int counter = 0;
    std::atomic<int> active{0};
    std::atomic<int> max_active{0};

    auto increment = CommandSpec::plain("increment", [&] {
        int now = ++active;
        int seen = max_active.load();
        while (now > seen && !max_active.compare_exchange_weak(seen, now)) {}

        int read = counter;
        std::this_thread::sleep_for(std::chrono::microseconds(200));
        counter = read + 1;

        --active;
        return std::to_string(counter);
    });

    constexpr int kThreads = 4;
    constexpr int kPerThread = 10;
    std::vector<std::thread> submitters;
    std::vector<std::shared_ptr<PendingCommand>> requests;
    std::mutex requests_mutex;

    for (int t = 0; t < kThreads; ++t) {
        submitters.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                auto request = runner.submit(increment, (i + t) % 2 == 0);
                std::lock_guard<std::mutex> lock(requests_mutex);
                requests.push_back(request);
            }
        });
    }
    for (auto& thread : submitters) thread.join();
    for (auto& request : requests) {
        EXPECT_TRUE(request->wait().success());
    }

    EXPECT_EQ(counter, kThreads * kPerThread);
    EXPECT_EQ(max_active.load(), 1);
}

TEST_F(CommandRunnerTest, PriorityServedBeforeQueuedNormal) {
    std::atomic<bool> started{false};
    std::atomic<bool> release{false};
    std::vector<std::string> order;
    std::mutex order_mutex;

    auto record = [&](const std::string& name) {
        return CommandSpec::plain(name, [&, name] {
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(name);
            return name;
        });
    };

    auto blocker = runner.submit(blocking_command("blocker", started, release));
    ASSERT_TRUE(eventually([&] { return started.load(); }));

    auto normal1 = runner.submit(record("normal1"));
    auto priority1 = runner.submit(record("priority1"), true);
    auto normal2 = runner.submit(record("normal2"));
    EXPECT_EQ(runner.queued_count(), 3u);

    release = true;
    normal2->wait();
    normal1->wait();
    priority1->wait();

    EXPECT_EQ(order, (std::vector<std::string>{"priority1", "normal1", "normal2"}));
}

TEST_F(CommandRunnerTest, CancelledWhileQueuedNeverRuns) {
    std::atomic<bool> started{false};
    std::atomic<bool> release{false};
    std::atomic<int> calls{0};
    std::promise<CommandStatus> callback_status;

    auto blocker = runner.submit(blocking_command("blocker", started, release));
    ASSERT_TRUE(eventually([&] { return started.load(); }));

    auto queued = runner.submit(counted_command("node list", "x", calls), false,
        [&](const CommandResult& result) { callback_status.set_value(result.status); });
    queued->cancel();

    EXPECT_TRUE(queued->is_done());
    EXPECT_EQ(queued->snapshot().status, CommandStatus::Cancelled);
    EXPECT_THROW(queued->wait(), CommandCancelled);

    release = true;
    blocker->wait();
    auto future = callback_status.get_future();
    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(future.get(), CommandStatus::Cancelled);
    EXPECT_EQ(calls.load(), 0);
    EXPECT_EQ(session->resets.load(), 2);
}

TEST_F(CommandRunnerTest, QueuedCountSkipsCancelledRequests) {
    std::atomic<bool> started{false};
    std::atomic<bool> release{false};
    std::atomic<int> calls{0};

    auto blocker = runner.submit(blocking_command("blocker", started, release));
    ASSERT_TRUE(eventually([&] { return started.load(); }));

    auto first = runner.submit(counted_command("code list", "x", calls));
    auto second = runner.submit(counted_command("group list", "y", calls), true);
    EXPECT_EQ(runner.queued_count(), 2u);

    first->cancel();
    EXPECT_EQ(runner.queued_count(), 1u);
    second->cancel();
    EXPECT_EQ(runner.queued_count(), 0u);

    release = true;
    blocker->wait();
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(CommandRunnerTest, CancelWhileRunningReleasesWaiters) {
    std::atomic<bool> started{false};
    std::atomic<bool> release{false};

    auto running = runner.submit(blocking_command("daemon status", started, release));
    ASSERT_TRUE(eventually([&] { return started.load(); }));

    running->cancel();
    EXPECT_TRUE(running->wait_for(std::chrono::milliseconds(100)));
    EXPECT_EQ(running->snapshot().error, CommandError::Cancelled);

    // The gate stays held until the worker has returned and the session was reset
    EXPECT_TRUE(eventually([&] { return !runner.busy(); }));
    EXPECT_EQ(session->resets.load(), 2);
}

TEST_F(CommandRunnerTest, CallbackRunsAfterGateReleased) {
    std::promise<bool> busy_in_callback;
    std::atomic<int> calls{0};

    runner.submit(counted_command("group list", "g", calls), false,
        [&](const CommandResult&) { busy_in_callback.set_value(runner.busy()); });

    auto future = busy_in_callback.get_future();
    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_FALSE(future.get());
}

TEST_F(CommandRunnerTest, ShutdownCancelsQueuedAndRunning) {
    std::atomic<bool> started{false};
    std::atomic<bool> release{false};
    std::atomic<int> calls{0};

    auto running = runner.submit(blocking_command("blocker", started, release));
    ASSERT_TRUE(eventually([&] { return started.load(); }));
    auto queued = runner.submit(counted_command("code list", "x", calls));

    runner.shutdown();

    EXPECT_EQ(running->snapshot().status, CommandStatus::Cancelled);
    EXPECT_EQ(queued->snapshot().status, CommandStatus::Cancelled);
    EXPECT_EQ(calls.load(), 0);
    EXPECT_TRUE(runner.is_shut_down());
}

TEST_F(CommandRunnerTest, SubmitAfterShutdownIsCancelled) {
    runner.shutdown();
    std::atomic<int> calls{0};

    auto request = runner.submit(counted_command("code list", "x", calls));
    EXPECT_TRUE(request->is_done());
    EXPECT_THROW(runner.execute(counted_command("code list", "x", calls)), CommandCancelled);
    EXPECT_EQ(calls.load(), 0);
}
