#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace lazyverdi::tui {

struct InvocationOutput {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
};

using Invoker = std::function<InvocationOutput(const std::vector<std::string>& args,
                                               const std::atomic<bool>& cancel_requested)>;

// In-process query; the returned text is stdout, exit code 0.
struct PlainQuery {
    std::function<std::string()> fn;
};

// External invocation (subprocess, REST request) taking fixed arguments.
// The invoker is expected to poll `cancel_requested` at safe points.
struct StructuredQuery {
    Invoker invoker;
    std::vector<std::string> args;
};

class CommandSpec {
public:
    static CommandSpec plain(std::string name, std::function<std::string()> fn);
    static CommandSpec structured(std::string name, Invoker invoker,
                                  std::vector<std::string> args = {});

    const std::string& name() const { return name_; }

    // "verdi <name> <args...>"
    std::string display() const;

    bool is_plain() const { return std::holds_alternative<PlainQuery>(query_); }

    // Runs the query on the calling thread. Exceptions from the query propagate.
    InvocationOutput invoke(const std::atomic<bool>& cancel_requested) const;

private:
    CommandSpec(std::string name, std::variant<PlainQuery, StructuredQuery> query);

    std::string name_;
    std::variant<PlainQuery, StructuredQuery> query_;
};

enum class CommandStatus {
    Running,
    Done,
    Cancelled,
    Failed
};

enum class CommandError {
    None,
    ExecutionFailed,   // ran, non-zero exit
    InvocationError,   // query threw
    Cancelled
};

struct CommandResult {
    std::string command_name;
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> exit_code;
    CommandStatus status = CommandStatus::Running;
    CommandError error = CommandError::None;
    std::chrono::system_clock::time_point start_time = std::chrono::system_clock::now();
    std::optional<std::chrono::system_clock::time_point> end_time;

    std::chrono::milliseconds duration() const;
    bool success() const { return status == CommandStatus::Done && exit_code == 0; }
    bool is_terminal() const { return status != CommandStatus::Running; }
};

std::string status_to_string(CommandStatus status);

// Raised by blocking waits when the request they wait on was cancelled.
class CommandCancelled : public std::runtime_error {
public:
    explicit CommandCancelled(const std::string& command_name)
        : std::runtime_error("command cancelled: " + command_name) {}
};

// "TypeName: message" for the exception and each nested cause, one per line.
std::string describe_exception(std::exception_ptr error);

} // namespace lazyverdi::tui
