#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace lazyverdi::tui {

struct ProcessOutput {
    std::string out;
    std::string err;
    int exit_code = 0;
    bool timed_out = false;
    bool cancelled = false;
};

// Runs argv[0] (PATH lookup, no shell) and collects stdout and stderr.
// The child is terminated when `cancel_requested` becomes true or the timeout
// expires; both are checked between reads. Exit code is 128+signal for a
// signalled child and 127 when the executable cannot be started.
// Throws std::system_error when pipes or fork fail.
ProcessOutput run_process(const std::vector<std::string>& argv,
                          std::chrono::milliseconds timeout,
                          const std::atomic<bool>& cancel_requested);

// Reaps any exited children without blocking. Returns how many were reaped.
int reap_exited_children();

// Full path of `program` on PATH, or empty when not found.
std::string find_executable(const std::string& program);

} // namespace lazyverdi::tui
