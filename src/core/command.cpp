#include "core/command.hpp"
#include <cxxabi.h>
#include <cstdlib>
#include <memory>
#include <typeinfo>

namespace lazyverdi::tui {

namespace {

std::string demangle(const char* mangled) {
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> name(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    return (status == 0 && name) ? std::string(name.get()) : std::string(mangled);
}

void append_exception(std::string& out, const std::exception& e, int depth) {
    if (depth > 0) {
        out += "\n" + std::string(static_cast<size_t>(depth) * 2, ' ') + "caused by ";
    }
    out += demangle(typeid(e).name()) + ": " + e.what();
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        append_exception(out, nested, depth + 1);
    } catch (...) {
        out += "\n" + std::string(static_cast<size_t>(depth + 1) * 2, ' ') +
               "caused by unknown exception";
    }
}

} // namespace

CommandSpec::CommandSpec(std::string name, std::variant<PlainQuery, StructuredQuery> query)
    : name_(std::move(name)), query_(std::move(query)) {
}

CommandSpec CommandSpec::plain(std::string name, std::function<std::string()> fn) {
    return CommandSpec(std::move(name), PlainQuery{std::move(fn)});
}

CommandSpec CommandSpec::structured(std::string name, Invoker invoker,
                                    std::vector<std::string> args) {
    return CommandSpec(std::move(name), StructuredQuery{std::move(invoker), std::move(args)});
}

std::string CommandSpec::display() const {
    std::string text = "verdi " + name_;
    if (const auto* query = std::get_if<StructuredQuery>(&query_)) {
        for (const auto& arg : query->args) {
            text += " " + arg;
        }
    }
    return text;
}

InvocationOutput CommandSpec::invoke(const std::atomic<bool>& cancel_requested) const {
    if (const auto* query = std::get_if<PlainQuery>(&query_)) {
        return InvocationOutput{.stdout_text = query->fn(), .stderr_text = "", .exit_code = 0};
    }
    const auto& query = std::get<StructuredQuery>(query_);
    return query.invoker(query.args, cancel_requested);
}

std::chrono::milliseconds CommandResult::duration() const {
    auto end = end_time.value_or(std::chrono::system_clock::now());
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - start_time);
}

std::string status_to_string(CommandStatus status) {
    switch (status) {
        case CommandStatus::Running: return "running";
        case CommandStatus::Done: return "done";
        case CommandStatus::Cancelled: return "cancelled";
        case CommandStatus::Failed: return "failed";
    }
    return "unknown";
}

std::string describe_exception(std::exception_ptr error) {
    if (!error) return {};
    std::string out;
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        append_exception(out, e, 0);
    } catch (...) {
        out = "UnknownFault: exception of non-standard type";
    }
    return out;
}

} // namespace lazyverdi::tui
