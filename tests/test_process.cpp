#include <gtest/gtest.h>
#include "utils/process.hpp"
#include <thread>

using namespace lazyverdi::tui;
using namespace std::chrono_literals;

class ProcessTest : public ::testing::Test {
protected:
    std::atomic<bool> cancel{false};
};

TEST_F(ProcessTest, CollectsStdoutStderrAndExitCode) {
    auto output = run_process({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"}, 5s, cancel);

    EXPECT_EQ(output.out, "out\n");
    EXPECT_EQ(output.err, "err\n");
    EXPECT_EQ(output.exit_code, 3);
    EXPECT_FALSE(output.timed_out);
    EXPECT_FALSE(output.cancelled);
}

TEST_F(ProcessTest, LargeOutputIsNotTruncated) {
    auto output = run_process({"/bin/sh", "-c", "i=0; while [ $i -lt 20000 ]; do echo line$i; i=$((i+1)); done"},
                              10s, cancel);
    EXPECT_EQ(output.exit_code, 0);
    EXPECT_NE(output.out.find("line19999\n"), std::string::npos);
}

TEST_F(ProcessTest, MissingExecutableExits127) {
    auto output = run_process({"/nonexistent/lazyverdi-test-binary"}, 5s, cancel);
    EXPECT_EQ(output.exit_code, 127);
    EXPECT_NE(output.err.find("failed to execute"), std::string::npos);
}

TEST_F(ProcessTest, TimeoutKillsChild) {
    auto start = std::chrono::steady_clock::now();
    auto output = run_process({"sleep", "10"}, 200ms, cancel);

    EXPECT_TRUE(output.timed_out);
    EXPECT_EQ(output.exit_code, 124);
    EXPECT_NE(output.err.find("timed out"), std::string::npos);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST_F(ProcessTest, CancelKillsChild) {
    std::thread canceller([this] {
        std::this_thread::sleep_for(100ms);
        cancel = true;
    });

    auto start = std::chrono::steady_clock::now();
    auto output = run_process({"sleep", "10"}, 30s, cancel);
    canceller.join();

    EXPECT_TRUE(output.cancelled);
    EXPECT_EQ(output.exit_code, 130);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST_F(ProcessTest, EmptyArgvThrows) {
    EXPECT_THROW(run_process({}, 1s, cancel), std::invalid_argument);
}

TEST(FindExecutableTest, SearchesPath) {
    EXPECT_FALSE(find_executable("sh").empty());
    EXPECT_TRUE(find_executable("lazyverdi-no-such-program").empty());
    EXPECT_EQ(find_executable("/bin/sh"), "/bin/sh");
}
